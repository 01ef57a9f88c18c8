#include "pch.hpp"
#include "engine/engine.hpp"
#include "engine/defaults.hpp"

namespace RenderSystem {

    constexpr uint32_t BACKGROUND_COLOR = 0x111827;

    void init(ECS &ecs, World &world, real dt) {
        world.render.setClearColor(hexToColor(BACKGROUND_COLOR));
        if (world.assets.hasImage("matcap"))
            world.render.createMatcap(world.assets.getImage("matcap"));
    };

    void syncGeometry(ECS &ecs, World &world, real dt) {
        world.render.sync(world.geometries);
    }

    void setCameraUniforms(ECS &ecs, World &world, real dt) {
        auto &data = world.source.get<CamData>();
        world.render.setUniforms(data.projection, data.view);
    }

    void updateMesh(ECS &ecs, World &world, real dt) {
        std::unordered_map<GeometryID, MeshBatch> &meshBatches =
            world.render.meshBatches;
        for (auto &[id, batch] : meshBatches)
            batch.data.clear();
        auto view = ecs.view<Transform, Mesh, Material>();
        view.iterate([&](EntityID id, Transform &transform, Mesh &mesh, Material &material) {
            if (!mesh.render)
                return;
            auto batch = meshBatches.find(mesh.geometry);
            if (batch == meshBatches.end())
                return;
            MeshData meshData;
            meshData.model = modelMatrix(transform);
            meshData.color = material.color;
            meshData.matcap = material.matcap ? 1.0f : 0.0f;
            batch->second.data.push_back(meshData);
        });
        world.render.beginFrame();
        for (auto &[id, batch] : meshBatches)
            world.render.render(batch);
    };

    void finalRender(ECS &ecs, World &world, real dt) {
        world.render.finalRender();
    }

    void setResolution(ECS &ecs, World &world, Event &baseEvent) {
        WindowResizeEvent &event = static_cast<WindowResizeEvent &>(baseEvent);
        if (event.type == SDL_EVENT_WINDOW_RESIZED) {
            world.setResolution(event.resolution);
        }
    }

} // namespace RenderSystem

void RenderPlugin(Engine &engine) {
    engine.addRenderSystem(SystemType::INIT, RenderSystem::init);
    engine.addRenderSystem(SystemType::UPDATE, RenderSystem::syncGeometry);
    engine.addRenderSystem(SystemType::UPDATE, RenderSystem::setCameraUniforms);
    engine.addRenderSystem(SystemType::UPDATE, RenderSystem::updateMesh);
    engine.addRenderSystem(SystemType::UPDATE, RenderSystem::finalRender);

    engine.addEventHandler<WindowResizeEvent>(RenderSystem::setResolution);
};
