#include <catch2/catch_test_macros.hpp>
#include "helpers.hpp"
#include "engine/components/physics.hpp"
#include "engine/components/render.hpp"

namespace {

    struct Tag {};

    struct Counter : Resource {
        int value = 0;
    };

    struct PingEvent : Event {
        int amount = 1;
    };

    struct PongEvent : Event {};

} // namespace

TEST_CASE("ECS entities and components", "[ecs]") {
    ECS ecs;
    ecs.init();

    EntityID a = ecs.createEntity();
    EntityID b = ecs.createEntity();
    REQUIRE(a != b);
    REQUIRE(ecs.getEntityCount() == 2);

    ecs.add(a, Transform{.position = vec3(1.0f, 2.0f, 3.0f)});
    ecs.add(a, Tag{});
    ecs.add<Transform>(b);

    SECTION("get, has and remove") {
        REQUIRE(ecs.get<Transform>(a).position.y == 2.0f);
        REQUIRE(ecs.has<Tag>(a));
        REQUIRE_FALSE(ecs.has<Tag>(b));
        REQUIRE_THROWS_AS(ecs.get<Tag>(b), std::out_of_range);

        ecs.remove<Tag>(a);
        REQUIRE_FALSE(ecs.has<Tag>(a));
        REQUIRE(ecs.has<Transform>(a));
    }

    SECTION("adding twice replaces the component") {
        ecs.add(a, Transform{.position = vec3(5.0f)});
        REQUIRE(ecs.get<Transform>(a).position.x == 5.0f);
        REQUIRE(ecs.view<Transform>().count() == 2);
    }

    SECTION("views join on every listed component") {
        REQUIRE(ecs.view<Transform>().count() == 2);
        REQUIRE(ecs.view<Transform, Tag>().count() == 1);
        REQUIRE(ecs.view<Transform, Material>().count() == 0);

        int visited = 0;
        ecs.view<Transform, Tag>().iterate([&](EntityID id, Transform &transform, Tag &) {
            REQUIRE(id == a);
            transform.position.x = 9.0f;
            ++visited;
        });
        REQUIRE(visited == 1);
        REQUIRE(ecs.get<Transform>(a).position.x == 9.0f);
    }

    SECTION("removed entities drop their components and ids are reused") {
        EntityID removed = a;
        ecs.removeEntity(a);
        REQUIRE(a == NULL_ENTITY);
        REQUIRE_FALSE(ecs.alive(removed));
        REQUIRE(ecs.getEntityCount() == 1);
        REQUIRE(ecs.view<Transform>().count() == 1);
        REQUIRE(ecs.view<Tag>().count() == 0);

        EntityID reused = ecs.createEntity();
        REQUIRE(reused == removed);
        REQUIRE_FALSE(ecs.has<Transform>(reused));

        ecs.removeEntity(a);
        REQUIRE(ecs.getEntityCount() == 2);
    }

    SECTION("reset forgets everything") {
        ecs.reset();
        REQUIRE(ecs.getEntityCount() == 0);
        REQUIRE(ecs.getPoolCount() == 0);
    }
}

TEST_CASE("Source resources", "[ecs][world]") {
    Source source;
    REQUIRE_FALSE(source.has<Counter>());

    source.get<Counter>().value = 3;
    REQUIRE(source.has<Counter>());
    REQUIRE(source.get<Counter>().value == 3);

    source.add<Counter>();
    REQUIRE(source.get<Counter>().value == 0);

    source.clear();
    REQUIRE_FALSE(source.has<Counter>());
}

TEST_CASE("Events dispatch to registered handlers", "[ecs][world]") {
    ECS ecs;
    World world;
    int total = 0;
    world.events.addEventHandler<PingEvent>([&](ECS &, World &, Event &baseEvent) {
        total += static_cast<PingEvent &>(baseEvent).amount;
    });
    world.events.addEventHandler<PingEvent>([&](ECS &, World &, Event &) { total += 10; });

    PingEvent ping;
    ping.amount = 2;
    world.events.write(ecs, world, std::move(ping));
    REQUIRE(total == 12);

    world.events.write(ecs, world, PongEvent{});
    REQUIRE(total == 12);

    SDL_Event key{};
    key.type = SDL_EVENT_KEY_DOWN;
    key.key.key = SDLK_A;
    world.events.pushSDLEvent(key);
    REQUIRE(world.events.pending() == 1);
    world.events.flushSDLEvents(ecs, world);
    REQUIRE(world.events.pending() == 0);
}

TEST_CASE("Color helpers", "[ecs]") {
    REQUIRE(colorToHex(hexToColor(0x8a2be2)) == 0x8a2be2u);
    REQUIRE(hexToColor(0xff0000) == vec3(1.0f, 0.0f, 0.0f));
    REQUIRE(colorToHex(vec3(2.0f, -1.0f, 0.5f)) == 0xff0080u);
}
