#include "pch.hpp"
#include "engine/engine.hpp"
#include "app/plugins.hpp"
#include "app/functions/content.hpp"

namespace AssetLoadSystem {

    void init(ECS &ecs, World &world, real dt) {
        std::string matcapPath = world.path(PATH_TEXTURE + world.config.matcap);
        if (!world.assets.loadImage(ContentFunctions::MATCAP, matcapPath))
            std::cerr << "[WARN] " << "Could not load matcap texture. Using flat colors.\n";

        std::string fontPath = world.path(PATH_FONT + world.config.font);
        try {
            world.assets.loadTypeface(ContentFunctions::FONT, fontPath);
        } catch (const FatalAssetError &e) {
            std::cerr << "[ERROR] " << "Font loading error: " << e.what() << "\n";
            throw FatalAssetError("Failed to load font. Check console and file path (" + fontPath + ").");
        }
    }

} // namespace AssetLoadSystem

void AssetLoadPlugin(Engine &engine) {
    engine.addLogicSystem(SystemType::INIT, AssetLoadSystem::init);
};
