#include <sprout/sprout.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "raylib.h"

// ---------------------------------------------------------------------------
// Example-local components
// ---------------------------------------------------------------------------

struct Renderable {
    float radius;
    uint8_t r, g, b;
};

struct Orbital {
    float speed;
    float orbit_radius;
    float angle;
};

struct Settings {
    bool paused = false;
    bool wireframe = false;
    bool show_help = true;
};

// ---------------------------------------------------------------------------
// Spawnables
// ---------------------------------------------------------------------------

/**
 * @brief A body on a circular orbit around its parent.
 * @details Starts at a random angle so that bodies spawned from the same template spread out.
 */
struct Body {
    float orbit_radius;
    float speed;
    float radius;
    uint8_t r, g, b;

    sprout::Bundle spawn(const sprout::World&, sprout::Entity) const {
        float angle = static_cast<float>(rand() % 628) / 100.0f;
        return sprout::Bundle::of(sprout::LocalTransform::from_translation(orbit_radius, 0, 0),
                                  sprout::WorldTransform{}, Renderable{radius, r, g, b},
                                  Orbital{speed, orbit_radius, angle});
    }
};

static Body random_planet() {
    return Body{3.0f + static_cast<float>(rand() % 80) / 10.0f,
                0.3f + static_cast<float>(rand() % 20) / 10.0f,
                0.3f + static_cast<float>(rand() % 5) / 10.0f,
                static_cast<uint8_t>(80 + rand() % 176),
                static_cast<uint8_t>(80 + rand() % 176),
                static_cast<uint8_t>(80 + rand() % 176)};
}

static void register_bodies(sprout::App& app) {
    sprout::add_spawnable(app, "Moon", Body{1.5f, 2.5f, 0.3f, 180, 180, 180});
    sprout::add_spawnable(app, "Rock", Body{1.2f, 3.0f, 0.2f, 160, 160, 160});
}

static sprout::Entity spawn_system(sprout::CommandBuffer& cmds) {
    auto sun = std::make_tuple(sprout::LocalTransform{}, sprout::WorldTransform{},
                               Renderable{2.0f, 255, 220, 50});
    return sprout::spawn_once(
        cmds, sprout::with_children(sun, [](sprout::SpawnChildBuilder& planets) {
            planets.spawn(sprout::with_children(
                Body{5.0f, 1.0f, 0.8f, 50, 100, 255},
                [](sprout::SpawnChildBuilder& moons) { moons.spawn_key("Moon"); }));
            planets.spawn(sprout::with_children(
                Body{8.0f, 0.6f, 0.6f, 220, 80, 50}, [](sprout::SpawnChildBuilder& moons) {
                    moons.spawn_key("Rock").spawn_key_with(
                        "Rock", Orbital{2.0f, 1.8f, 0.0f});
                }));
        }));
}

// ---------------------------------------------------------------------------
// Systems
// ---------------------------------------------------------------------------

static void orbital_motion(sprout::World& w) {
    if (w.resource<Settings>().paused)
        return;
    float dt = GetFrameTime();
    w.each<Orbital, sprout::LocalTransform>(
        [&](sprout::Entity, Orbital& orb, sprout::LocalTransform& lt) {
            orb.angle += orb.speed * dt;
            lt.position.x = std::cos(orb.angle) * orb.orbit_radius;
            lt.position.y = 0.0f;
            lt.position.z = std::sin(orb.angle) * orb.orbit_radius;
        });
}

// ---------------------------------------------------------------------------
// Scene editing
// ---------------------------------------------------------------------------

static sprout::Entity sun = sprout::INVALID_ENTITY;

static void add_random_planet(sprout::World& w) {
    // Deferred: the planet and its moon appear once the spawn hook runs next frame.
    sprout::Entity planet = sprout::spawn_once(
        w.deferred(), sprout::with_children(random_planet(), [](sprout::SpawnChildBuilder& m) {
            m.spawn_key("Moon");
        }));
    w.deferred().queue([planet](sprout::World& world) {
        sprout::set_parent(world, planet, sun);
    });
}

static void destroy_random_body(sprout::World& w) {
    std::vector<sprout::Entity> candidates;
    w.each<Orbital>([&](sprout::Entity e, Orbital&) { candidates.push_back(e); });
    if (candidates.empty())
        return;
    sprout::destroy_recursive(w, candidates[static_cast<size_t>(rand()) % candidates.size()]);
}

static void reset_scene(sprout::World& w) {
    sprout::destroy_recursive(w, sun);
    sun = spawn_system(w.deferred());
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

static Vector3 to_raylib(const glm::vec3& v) {
    return Vector3{v.x, v.y, v.z};
}

static void draw_bodies(sprout::World& w) {
    bool wireframe = w.resource<Settings>().wireframe;
    w.each<sprout::WorldTransform, Renderable>(
        [&](sprout::Entity, sprout::WorldTransform& wt, Renderable& vis) {
            Vector3 pos = to_raylib(wt.translation());
            Color col = {vis.r, vis.g, vis.b, 255};
            if (wireframe) {
                DrawSphereWires(pos, vis.radius, 12, 12, col);
            } else {
                DrawSphere(pos, vis.radius, col);
                DrawSphereWires(pos, vis.radius, 12, 12,
                                Color{static_cast<uint8_t>(vis.r / 2),
                                      static_cast<uint8_t>(vis.g / 2),
                                      static_cast<uint8_t>(vis.b / 2), 255});
            }
        });
}

static void draw_orbit_rings(sprout::World& w) {
    w.each<Orbital, sprout::Parent>([&](sprout::Entity, Orbital& orb, sprout::Parent& par) {
        auto* pwt = w.try_get<sprout::WorldTransform>(par.entity);
        if (!pwt)
            return;
        Vector3 center = to_raylib(pwt->translation());
        int segments = 64;
        for (int i = 0; i < segments; ++i) {
            float a0 = (static_cast<float>(i) / static_cast<float>(segments)) * 2.0f * PI;
            float a1 = (static_cast<float>(i + 1) / static_cast<float>(segments)) * 2.0f * PI;
            Vector3 p0 = {center.x + std::cos(a0) * orb.orbit_radius, center.y,
                          center.z + std::sin(a0) * orb.orbit_radius};
            Vector3 p1 = {center.x + std::cos(a1) * orb.orbit_radius, center.y,
                          center.z + std::sin(a1) * orb.orbit_radius};
            DrawLine3D(p0, p1, Color{80, 80, 80, 255});
        }
    });
}

static void draw_ui(sprout::World& w) {
    DrawFPS(10, 10);

    char buf[256];
    std::snprintf(buf, sizeof(buf), "Entities: %zu  Orbital: %zu  Pending spawns: %zu",
                  w.count(), w.count<Orbital>(), w.count<sprout::SpawnChildren>());
    DrawText(buf, 10, 35, 18, LIGHTGRAY);

    const Settings& settings = w.resource<Settings>();
    if (settings.paused)
        DrawText("PAUSED", GetScreenWidth() / 2 - 40, 10, 24, RED);

    if (settings.show_help) {
        int y = 70;
        DrawText("--- Controls ---", 10, y, 16, LIGHTGRAY);
        y += 20;
        DrawText("Mouse: rotate camera  Scroll: zoom", 10, y, 16, LIGHTGRAY);
        y += 18;
        DrawText("1: Add planet   D: Destroy random body", 10, y, 16, LIGHTGRAY);
        y += 18;
        DrawText("P: Pause   Space: Toggle wireframe", 10, y, 16, LIGHTGRAY);
        y += 18;
        DrawText("R: Reset scene   H: Toggle help", 10, y, 16, LIGHTGRAY);
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    srand(42);

    sprout::App app;
    app.add_plugin<sprout::SpawnPlugin>();
    app.add_plugin<sprout::TransformPlugin>();
    app.insert_resource(Settings{});
    register_bodies(app);
    app.add_system(sprout::Stage::Startup, "spawn_system",
                   [](sprout::World& w) { sun = spawn_system(w.deferred()); });
    app.add_system(sprout::Stage::Update, "orbital_motion", orbital_motion);

    InitWindow(1280, 720, "sprout orrery");
    SetTargetFPS(60);

    Camera3D camera = {};
    camera.position = Vector3{15.0f, 12.0f, 15.0f};
    camera.target = Vector3{0.0f, 0.0f, 0.0f};
    camera.up = Vector3{0.0f, 1.0f, 0.0f};
    camera.fovy = 45.0f;
    camera.projection = CAMERA_PERSPECTIVE;

    sprout::World& world = app.world();
    while (!WindowShouldClose()) {
        UpdateCamera(&camera, CAMERA_ORBITAL);

        Settings& settings = world.resource<Settings>();
        if (IsKeyPressed(KEY_ONE))
            add_random_planet(world);
        if (IsKeyPressed(KEY_D))
            destroy_random_body(world);
        if (IsKeyPressed(KEY_R))
            reset_scene(world);
        if (IsKeyPressed(KEY_P))
            settings.paused = !settings.paused;
        if (IsKeyPressed(KEY_SPACE))
            settings.wireframe = !settings.wireframe;
        if (IsKeyPressed(KEY_H))
            settings.show_help = !settings.show_help;

        app.update();

        BeginDrawing();
        ClearBackground(Color{20, 20, 30, 255});
        BeginMode3D(camera);
        DrawGrid(20, 1.0f);
        draw_orbit_rings(world);
        draw_bodies(world);
        EndMode3D();
        draw_ui(world);
        EndDrawing();
    }

    CloseWindow();
    return 0;
}
