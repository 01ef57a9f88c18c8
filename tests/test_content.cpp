#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"
#include "app/plugins.hpp"
#include "app/functions/content.hpp"

using Catch::Matchers::WithinAbs;

namespace {

    void addContentPlugins(Engine &engine) {
        engine.addPlugin(AssetLoadPlugin);
        engine.addPlugin(ContentPlugin);
        engine.addPlugin(DonutPlugin);
    }

    size_t countDonuts(ECS &ecs) { return ecs.view<Donut>().count(); }

} // namespace

TEST_CASE("Display text placeholder", "[content]") {
    REQUIRE(ContentFunctions::displayText("") == "...");
    REQUIRE(ContentFunctions::displayText("   ") == "...");
    REQUIRE(ContentFunctions::displayText(" \t\n") == "...");
    REQUIRE(ContentFunctions::displayText("Hello :)") == "Hello :)");
    REQUIRE(ContentFunctions::displayText(" a ") == " a ");
}

TEST_CASE("Text geometry", "[content]") {
    Typeface typeface = Typeface::load(std::string(TEST_DATA_DIR) + "fonts/test.typeface.json");

    SECTION("empty text builds the placeholder") {
        Geometry empty = ContentFunctions::createTextGeometry("", typeface);
        Geometry dots = ContentFunctions::createTextGeometry("...", typeface);
        REQUIRE(empty.vertexCount() > 0);
        REQUIRE(empty.vertexCount() == dots.vertexCount());
        REQUIRE(ContentFunctions::createTextGeometry("  ", typeface).vertexCount() == dots.vertexCount());
    }

    SECTION("result is centered on the origin") {
        for (const std::string text : {"IO", "D", "O\nI", "...", ""}) {
            Bounds box = ContentFunctions::createTextGeometry(text, typeface).bounds();
            REQUIRE_FALSE(box.empty());
            REQUIRE_THAT(box.center().x, WithinAbs(0.0f, 1e-5f));
            REQUIRE_THAT(box.center().y, WithinAbs(0.0f, 1e-5f));
            REQUIRE_THAT(box.center().z, WithinAbs(0.0f, 1e-5f));
        }
    }

    SECTION("depth includes both bevels") {
        Bounds box = ContentFunctions::createTextGeometry("I", typeface).bounds();
        REQUIRE_THAT(box.size().z, WithinAbs(0.2f + 2.0f * 0.03f, 1e-5f));
        // glyph height 700 units at size 0.5 plus the bevel on both sides
        REQUIRE_THAT(box.size().y, WithinAbs(0.35f + 2.0f * 0.02f, 1e-4f));
    }

    SECTION("characters outside the font still build") {
        REQUIRE(ContentFunctions::createTextGeometry("ZZZ", typeface).vertexCount() > 0);
        REQUIRE(ContentFunctions::createTextGeometry("\xC3\xA9", typeface).vertexCount() > 0);
    }
}

TEST_CASE("Content build", "[content]") {
    HeadlessEngine engine;
    addContentPlugins(engine);
    REQUIRE(engine.start());
    ECS &ecs = engine.getECS();
    World &world = engine.getWorld();
    auto &scene = world.source.get<Scene>();
    auto &settings = world.source.get<Settings>();

    SECTION("settings come from the config") {
        REQUIRE(settings.text == "IO");
        REQUIRE(settings.textColor == 0x00ff00u);
        REQUIRE(settings.donutColor == 0x0000ffu);
    }

    SECTION("one text object and a hundred donuts") {
        REQUIRE(ecs.getEntityCount() == 101);
        REQUIRE(countDonuts(ecs) == ContentFunctions::DONUT_COUNT);
        REQUIRE(ecs.view<Label>().count() == 1);
        REQUIRE(scene.donuts.size() == ContentFunctions::DONUT_COUNT);
        REQUIRE(world.geometries.size() == 2);
        REQUIRE(ecs.has<Label>(scene.text));
        REQUIRE(ecs.get<Mesh>(scene.text).geometry == scene.textGeometry);
    }

    SECTION("text material uses the configured color") {
        auto &material = ecs.get<Material>(scene.text);
        REQUIRE(colorToHex(material.color) == 0x00ff00u);
        REQUIRE(material.matcap);
    }

    SECTION("donuts share the torus and cycle through the palette") {
        for (size_t i = 0; i < scene.donuts.size(); ++i) {
            EntityID id = scene.donuts[i];
            REQUIRE(ecs.get<Mesh>(id).geometry == scene.torus);
            REQUIRE(colorToHex(ecs.get<Material>(id).color) == ContentFunctions::PALETTE[i % 7]);
            REQUIRE(ecs.get<Material>(id).matcap);
        }
        REQUIRE(world.geometries.get(scene.torus).triangleCount() == 1024);
    }

    SECTION("donut placement ranges") {
        for (EntityID id : scene.donuts) {
            const Transform &transform = ecs.get<Transform>(id);
            const Motion &motion = ecs.get<Motion>(id);
            for (int axis = 0; axis < 3; ++axis) {
                REQUIRE(transform.position[axis] >= -7.5f);
                REQUIRE(transform.position[axis] < 7.5f);
                REQUIRE(motion.velocity[axis] >= -0.01f);
                REQUIRE(motion.velocity[axis] < 0.01f);
            }
            REQUIRE(transform.rotation.x >= 0.0f);
            REQUIRE(transform.rotation.x < glm::pi<real>());
            REQUIRE(transform.rotation.y >= 0.0f);
            REQUIRE(transform.rotation.y < glm::pi<real>());
            REQUIRE(transform.rotation.z == 0.0f);
            REQUIRE(transform.scale.x >= 0.3f);
            REQUIRE(transform.scale.x < 1.0f);
            REQUIRE(transform.scale.x == transform.scale.y);
            REQUIRE(transform.scale.x == transform.scale.z);
        }
    }

    SECTION("rebuild keeps the population and releases what it replaced") {
        world.geometries.takeUploads();
        GeometryID oldTorus = scene.torus;
        GeometryID oldText = scene.textGeometry;

        world.events.write(ecs, world, RebuildContentEvent{});

        REQUIRE(ecs.getEntityCount() == 101);
        REQUIRE(countDonuts(ecs) == ContentFunctions::DONUT_COUNT);
        REQUIRE(ecs.view<Label>().count() == 1);
        REQUIRE(world.geometries.size() == 2);
        REQUIRE(world.geometries.pendingReleases() == 2);
        REQUIRE_FALSE(world.geometries.contains(oldTorus));
        REQUIRE_FALSE(world.geometries.contains(oldText));
        REQUIRE(world.geometries.takeUploads().size() == 2);
    }

    SECTION("text edits replace only the text geometry") {
        world.geometries.takeUploads();
        GeometryID oldText = scene.textGeometry;
        GeometryID torus = scene.torus;
        EntityID text = scene.text;

        TextChangedEvent event;
        event.text = "O";
        world.events.write(ecs, world, std::move(event));

        REQUIRE(settings.text == "O");
        REQUIRE(scene.text == text);
        REQUIRE(scene.torus == torus);
        REQUIRE(scene.textGeometry != oldText);
        REQUIRE(ecs.get<Mesh>(text).geometry == scene.textGeometry);
        REQUIRE(world.geometries.size() == 2);
        REQUIRE(world.geometries.takeReleases() == std::vector<GeometryID>{oldText});

        TextChangedEvent cleared;
        world.events.write(ecs, world, std::move(cleared));
        REQUIRE(settings.text.empty());
        REQUIRE(world.geometries.get(scene.textGeometry).vertexCount() ==
                ContentFunctions::createTextGeometry("...", world.assets.getTypeface(ContentFunctions::FONT))
                    .vertexCount());
    }

    SECTION("text color touches only the text") {
        TextColorChangedEvent event;
        event.color = 0xff00ff;
        world.events.write(ecs, world, std::move(event));

        REQUIRE(settings.textColor == 0xff00ffu);
        REQUIRE(colorToHex(ecs.get<Material>(scene.text).color) == 0xff00ffu);
        for (size_t i = 0; i < scene.donuts.size(); ++i)
            REQUIRE(colorToHex(ecs.get<Material>(scene.donuts[i]).color) == ContentFunctions::PALETTE[i % 7]);
    }

    SECTION("donut color touches every donut and nothing else") {
        DonutColorChangedEvent event;
        event.color = 0x123456;
        world.events.write(ecs, world, std::move(event));

        REQUIRE(settings.donutColor == 0x123456u);
        for (EntityID id : scene.donuts)
            REQUIRE(colorToHex(ecs.get<Material>(id).color) == 0x123456u);
        REQUIRE(colorToHex(ecs.get<Material>(scene.text).color) == 0x00ff00u);
    }
}

TEST_CASE("Missing matcap falls back to flat colors", "[content]") {
    HeadlessEngine engine("flat.ini");
    addContentPlugins(engine);
    REQUIRE(engine.start());
    REQUIRE(engine.alerts.empty());

    ECS &ecs = engine.getECS();
    World &world = engine.getWorld();
    REQUIRE_FALSE(world.assets.hasImage(ContentFunctions::MATCAP));
    REQUIRE(ecs.getEntityCount() == 101);

    size_t flat = 0;
    ecs.view<Material>().iterate([&](EntityID id, Material &material) {
        REQUIRE_FALSE(material.matcap);
        ++flat;
    });
    REQUIRE(flat == 101);
    REQUIRE(world.source.get<Settings>().text == "D");
}

TEST_CASE("Seeded builds are reproducible", "[content]") {
    HeadlessEngine first, second;
    addContentPlugins(first);
    addContentPlugins(second);
    REQUIRE(first.start());
    REQUIRE(second.start());

    auto &a = first.getWorld().source.get<Scene>();
    auto &b = second.getWorld().source.get<Scene>();
    for (size_t i = 0; i < a.donuts.size(); ++i) {
        vec3 p = first.getECS().get<Transform>(a.donuts[i]).position;
        vec3 q = second.getECS().get<Transform>(b.donuts[i]).position;
        REQUIRE(p == q);
    }
}
