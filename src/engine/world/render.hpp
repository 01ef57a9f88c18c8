#pragma once

#include "pch.hpp"
#include "shader.hpp"
#include "pipeline.hpp"
#include "assets.hpp"
#include "geometry.hpp"

struct MeshData {
    mat4 model;
    vec3 color;
    real matcap;
};
struct MeshBatch {
    GeometryID geometry;
    std::vector<MeshData> data;
};
struct GpuMesh {
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint instance = 0;
    GLsizei vertices = 0;
};

class Render {
public:
    std::unordered_map<GeometryID, MeshBatch> meshBatches;

private:
    ivec2 resolution = ivec2(1);
    ivec2 pixelSize = ivec2(1);
    real pixelRatio = 1.0f;

protected:
    std::unique_ptr<Pipeline> pipeline;

    mat4 view = mat4(1.0f), projection = mat4(1.0f);

    Shader meshShader;
    GLuint matcapTexture = 0;

    std::unordered_map<GeometryID, GpuMesh> meshes;

public:
    Render() = default;

    void init(const std::string &shaderPath, ivec2 newResolution, ivec2 newPixelSize, real newPixelRatio) {
        resolution = newResolution;
        pixelSize = newPixelSize;
        pixelRatio = newPixelRatio;
        pipeline = std::make_unique<Pipeline>(bufferSize(), pixelSize, shaderPath);
        meshShader = Shader(shaderPath + "mesh.vert", shaderPath + "mesh.frag");
    }

    void shutdown() {
        for (auto &[id, mesh] : meshes)
            destroyMesh(mesh);
        meshes.clear();
        meshBatches.clear();
        if (matcapTexture)
            glDeleteTextures(1, &matcapTexture);
        matcapTexture = 0;
        meshShader.destroy();
        pipeline.reset();
    }

    // Logical window size plus the drawable size; the scene buffer uses the
    // logical size scaled by the pixel ratio.
    void setResolution(ivec2 newResolution, ivec2 newPixelSize, real newPixelRatio) {
        resolution = newResolution;
        pixelSize = newPixelSize;
        pixelRatio = newPixelRatio;
        if (pipeline)
            pipeline->setResolution(bufferSize(), pixelSize);
    }
    ivec2 bufferSize() const {
        return glm::max(ivec2(vec2(resolution) * pixelRatio), ivec2(1));
    }
    void setClearColor(const vec3 &color) {
        pipeline->setClearColor(vec4(color, 1.0f));
    }
    void setUniforms(const mat4 &projectionMat, const mat4 &viewMat) {
        projection = projectionMat;
        view = viewMat;
    }

    void createMatcap(const Image &image) {
        if (matcapTexture)
            glDeleteTextures(1, &matcapTexture);
        glGenTextures(1, &matcapTexture);
        glBindTexture(GL_TEXTURE_2D, matcapTexture);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, image.width, image.height, 0, GL_RGBA,
                     GL_UNSIGNED_BYTE, image.pixels.data());
        glGenerateMipmap(GL_TEXTURE_2D);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        glBindTexture(GL_TEXTURE_2D, 0);
    }

    // Uploads geometries added since the last sync and frees released ones.
    void sync(Geometries &geometries) {
        for (GeometryID id : geometries.takeReleases()) {
            auto it = meshes.find(id);
            if (it == meshes.end())
                continue;
            destroyMesh(it->second);
            meshes.erase(it);
            meshBatches.erase(id);
        }
        for (GeometryID id : geometries.takeUploads())
            addMesh(id, geometries.get(id));
    }

    void beginFrame() { pipeline->beginScene(); }

    void render(const MeshBatch &batch) {
        auto it = meshes.find(batch.geometry);
        if (it == meshes.end() || batch.data.empty())
            return;
        const GpuMesh &mesh = it->second;
        meshShader.activate();
        meshShader.setMat4("projection", projection);
        meshShader.setMat4("view", view);
        glActiveTexture(GL_TEXTURE0);
        glBindTexture(GL_TEXTURE_2D, matcapTexture);
        meshShader.setInt("tMatcap", 0);
        meshShader.setBool("hasMatcap", matcapTexture != 0);
        glBindVertexArray(mesh.vao);
        glBindBuffer(GL_ARRAY_BUFFER, mesh.instance);
        glBufferData(GL_ARRAY_BUFFER, batch.data.size() * sizeof(MeshData),
                     batch.data.data(), GL_DYNAMIC_DRAW);
        glDrawArraysInstanced(GL_TRIANGLES, 0, mesh.vertices,
                              static_cast<GLsizei>(batch.data.size()));
        glBindVertexArray(0);
    }
    void finalRender() { pipeline->composite(); }

private:
    void addMesh(GeometryID id, const Geometry &geometry) {
        GpuMesh mesh;
        mesh.vertices = static_cast<GLsizei>(geometry.vertexCount());
        glGenVertexArrays(1, &mesh.vao);
        glGenBuffers(1, &mesh.vbo);
        glGenBuffers(1, &mesh.instance);
        glBindVertexArray(mesh.vao);
        glBindBuffer(GL_ARRAY_BUFFER, mesh.vbo);
        glBufferData(GL_ARRAY_BUFFER, geometry.byteSize(), geometry.vertices.data(), GL_STATIC_DRAW);
        glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, Geometry::STRIDE * sizeof(real), (void *)0);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, Geometry::STRIDE * sizeof(real), (void *)(3 * sizeof(real)));
        glEnableVertexAttribArray(1);

        glBindBuffer(GL_ARRAY_BUFFER, mesh.instance);
        glBufferData(GL_ARRAY_BUFFER, 0, nullptr, GL_DYNAMIC_DRAW);
        for (GLuint column = 0; column < 4; ++column) {
            glEnableVertexAttribArray(2 + column);
            glVertexAttribPointer(2 + column, 4, GL_FLOAT, GL_FALSE, sizeof(MeshData),
                                  (void *)(column * sizeof(vec4)));
            glVertexAttribDivisor(2 + column, 1);
        }
        glEnableVertexAttribArray(6);
        glVertexAttribPointer(6, 3, GL_FLOAT, GL_FALSE, sizeof(MeshData), (void *)offsetof(MeshData, color));
        glVertexAttribDivisor(6, 1);
        glEnableVertexAttribArray(7);
        glVertexAttribPointer(7, 1, GL_FLOAT, GL_FALSE, sizeof(MeshData), (void *)offsetof(MeshData, matcap));
        glVertexAttribDivisor(7, 1);
        glBindVertexArray(0);

        meshes[id] = mesh;
        meshBatches[id] = MeshBatch{id, {}};
    }

    static void destroyMesh(GpuMesh &mesh) {
        glDeleteBuffers(1, &mesh.instance);
        glDeleteBuffers(1, &mesh.vbo);
        glDeleteVertexArrays(1, &mesh.vao);
        mesh = GpuMesh{};
    }
};
