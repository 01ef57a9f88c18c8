#include "engine/engine.hpp"
#include "engine/defaults.hpp"

#include "app/plugins.hpp"

class App : public Engine {

public:
    App() {
        addPlugin(AssetLoadPlugin);
        addPlugin(ContentPlugin);
        addPlugin(DonutPlugin);

        addPlugin(PhysicsPlugin);
        addPlugin(MousePlugin);
        addPlugin(CameraPlugin);
        addPlugin(RenderPlugin);
        addPlugin(PanelPlugin);
    }
};

Engine *createApp() {
    return new App();
}
