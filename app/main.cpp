// MONO TOWER - windowed client
// Drives TowerSession from the raylib frame loop and draws the tower.

#include <monotower/core/config.hpp>
#include <monotower/core/logger.hpp>
#include <monotower/core/random_source.hpp>
#include <monotower/session/tower_session.hpp>

#include <raylib.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr float kHalfPi = 1.5707963267948966f;
constexpr float kCameraOffset = 800.0f;
constexpr float kCameraSmoothing = 0.15f;
constexpr float kMinViewWidth = 1000.0f;
constexpr float kFrustumSize = 800.0f;

struct Args {
    std::string configPath = "monotower.conf";
    std::uint32_t seed = 0;
    bool haveSeed = false;
    std::vector<std::string> overrides;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--seed") == 0 && i + 1 < argc) {
            args.seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            args.haveSeed = true;
        }
        else if (std::strcmp(arg, "--set") == 0 && i + 1 < argc) {
            args.overrides.emplace_back(argv[++i]);
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

// Orbit camera around the player; yaw eases toward 90-degree snap targets.
struct OrbitCamera {
    float angle{kHalfPi * 0.5f};
    float target{kHalfPi * 0.5f};

    void rotate_left() { target += kHalfPi; }
    void rotate_right() { target -= kHalfPi; }
    void update() { angle += (target - angle) * kCameraSmoothing; }

    Camera3D to_camera(const Vector3& focus, int width, int height) const {
        const float aspect = static_cast<float>(width) / static_cast<float>(height > 0 ? height : 1);

        // Portrait screens widen the frustum so the tower still fits.
        float frustum = kFrustumSize;
        if (width < height) frustum = kMinViewWidth / aspect;

        Camera3D cam{};
        cam.position = Vector3{focus.x + std::sin(angle) * kCameraOffset,
                               focus.y + kCameraOffset * 0.8f,
                               focus.z + std::cos(angle) * kCameraOffset};
        cam.target = focus;
        cam.up = Vector3{0.0f, 1.0f, 0.0f};
        cam.fovy = frustum;
        cam.projection = CAMERA_ORTHOGRAPHIC;
        return cam;
    }
};

void draw_level(const monotower::world::Level& level) {
    const float s = level.index.block_size();
    for (const auto& b : level.blocks()) {
        if (b.type == monotower::world::BlockType::Hazard) {
            DrawCube(b.center, s * 0.7f, s * 0.7f, s * 0.7f, BLACK);
        } else {
            DrawCube(b.center, s, s, s, RAYWHITE);
            DrawCubeWires(b.center, s, s, s, BLACK);
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace monotower;

    Args args = parse_args(argc, argv);

    auto& config = core::Config::instance();
    const bool cfg_ok = config.load_from_file(args.configPath);
    for (const auto& o : args.overrides) {
        if (!config.apply_override(o)) {
            std::cerr << "[WARNING] Ignoring malformed --set " << o << "\n";
        }
    }

    core::Logger::instance().init(config.logging());
    TraceLog(LOG_INFO, "[config] %s: %s", args.configPath.c_str(), cfg_ok ? "ok" : "missing (defaults)");

    core::GameConfig cfg = config.get();
    if (args.haveSeed) cfg.level.seed = args.seed;
    if (cfg.level.seed == 0) cfg.level.seed = core::seed_from_clock();
    TraceLog(LOG_INFO, "[config] level seed=%u", cfg.level.seed);

    core::SeededRandomSource rng(cfg.level.seed);
    session::TowerSession game;

    std::string err;
    if (!game.init(cfg, rng, &err)) {
        TraceLog(LOG_ERROR, "[config] invalid configuration: %s", err.c_str());
        core::Logger::instance().shutdown();
        return 1;
    }

    int score = 0;
    std::string status;
    game.set_events(session::SessionEvents{
        [&score](int s) { score = s; },
        [&status](std::string_view msg) { status.assign(msg.data(), msg.size()); },
        nullptr,
    });

    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
    InitWindow(1280, 720, "MONO TOWER");
    SetTargetFPS(120);

    OrbitCamera orbit;

    while (!WindowShouldClose()) {
        if (IsKeyPressed(KEY_LEFT)) orbit.rotate_left();
        if (IsKeyPressed(KEY_RIGHT)) orbit.rotate_right();

        session::InputState input;
        input.forward = (IsKeyDown(KEY_W) ? 1.0f : 0.0f) - (IsKeyDown(KEY_S) ? 1.0f : 0.0f);
        input.right = (IsKeyDown(KEY_D) ? 1.0f : 0.0f) - (IsKeyDown(KEY_A) ? 1.0f : 0.0f);
        input.jump = IsKeyDown(KEY_SPACE);
        input.camera_yaw = orbit.angle;
        game.set_input(input);

        game.update(GetTime());

        orbit.update();
        const session::SessionSnapshot snap = game.snapshot();
        const Camera3D cam = orbit.to_camera(snap.player.position, GetScreenWidth(), GetScreenHeight());

        BeginDrawing();
        ClearBackground(WHITE);

        BeginMode3D(cam);
        draw_level(game.level());
        DrawSphere(snap.player.position, cfg.physics.player_radius, BLACK);
        EndMode3D();

        DrawText(TextFormat("HEIGHT %d", score), 20, 20, 32, BLACK);
        if (!status.empty()) {
            const int w = MeasureText(status.c_str(), 40);
            DrawText(status.c_str(), (GetScreenWidth() - w) / 2, GetScreenHeight() / 3, 40, BLACK);
        }

        EndDrawing();
    }

    CloseWindow();
    core::Logger::instance().shutdown();
    return 0;
}
