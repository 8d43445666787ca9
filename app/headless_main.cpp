// MONO TOWER - headless runner
// Plays a scripted climb on simulated frame times and prints the outcome.

#include <monotower/core/config.hpp>
#include <monotower/core/logger.hpp>
#include <monotower/core/random_source.hpp>
#include <monotower/session/tower_session.hpp>

#include <raylib.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#ifndef MONOTOWER_VERSION
#define MONOTOWER_VERSION "0.0.0-dev"
#endif

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_banner() {
    std::cout << "\n  MONO TOWER headless runner v" << MONOTOWER_VERSION << "\n";
    std::cout << "  ============================================\n\n";
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>     Config file (default: monotower.conf)\n";
    std::cout << "  --seed <n>          Level seed (default: from config, else clock)\n";
    std::cout << "  --seconds <s>       Simulated wall time (default: 20)\n";
    std::cout << "  --fps <n>           Simulated frame rate (default: 144)\n";
    std::cout << "  --set <sec.key=v>   Override one config value (repeatable)\n";
    std::cout << "  --quiet             Only print the final summary\n";
    std::cout << "  --help              Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --seed 42 --seconds 30 --set physics.seam_strategy=neighbor\n";
}

struct Args {
    std::string configPath = "monotower.conf";
    std::uint32_t seed = 0;
    bool haveSeed = false;
    double seconds = 20.0;
    int fps = 144;
    std::vector<std::string> overrides;
    bool quiet = false;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--seed") == 0 && i + 1 < argc) {
            args.seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            args.haveSeed = true;
        }
        else if (std::strcmp(arg, "--seconds") == 0 && i + 1 < argc) {
            args.seconds = std::atof(argv[++i]);
        }
        else if (std::strcmp(arg, "--fps") == 0 && i + 1 < argc) {
            args.fps = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--set") == 0 && i + 1 < argc) {
            args.overrides.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

// Input for a given simulated time: walk in a slowly turning circle, hop every second.
monotower::session::InputState scripted_input(double t) {
    monotower::session::InputState in;
    in.forward = 1.0f;
    in.right = (static_cast<int>(t) % 4 < 2) ? 0.5f : -0.5f;
    in.camera_yaw = static_cast<float>(t * 0.4);
    in.jump = (t - static_cast<double>(static_cast<int>(t))) < 0.05;
    return in;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace monotower;

    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.fps <= 0 || args.seconds <= 0.0) {
        std::cerr << "[ERROR] --fps and --seconds must be positive\n";
        return 1;
    }

    if (!args.quiet) {
        print_banner();
    }

    auto& config = core::Config::instance();
    const bool cfg_ok = config.load_from_file(args.configPath);
    for (const auto& o : args.overrides) {
        if (!config.apply_override(o)) {
            std::cerr << "[WARNING] Ignoring malformed --set " << o << "\n";
        }
    }

    core::LoggingConfig logCfg = config.logging();
    if (args.quiet) logCfg.level = LOG_WARNING;
    core::Logger::instance().init(logCfg);
    TraceLog(LOG_INFO, "[config] %s: %s", args.configPath.c_str(), cfg_ok ? "ok" : "missing (defaults)");

    core::GameConfig cfg = config.get();
    if (args.haveSeed) cfg.level.seed = args.seed;
    if (cfg.level.seed == 0) cfg.level.seed = core::seed_from_clock();

    core::SeededRandomSource rng(cfg.level.seed);
    session::TowerSession game;

    std::string err;
    if (!game.init(cfg, rng, &err)) {
        std::cerr << "[ERROR] Invalid configuration: " << err << "\n";
        core::Logger::instance().shutdown();
        return 1;
    }

    int bestScore = 0;
    const bool quiet = args.quiet;
    game.set_events(session::SessionEvents{
        [&bestScore](int s) { if (s > bestScore) bestScore = s; },
        [&game, quiet](std::string_view msg) {
            if (!quiet && !msg.empty()) {
                std::cout << "  tick " << game.tick() << ": " << msg << "\n";
            }
        },
        [&game, quiet](session::ResetReason r) {
            if (!quiet) {
                std::cout << "  tick " << game.tick() << ": reset (" << session::reset_reason_name(r) << ")\n";
            }
        },
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const double frame = 1.0 / static_cast<double>(args.fps);
    // One simulated stall halfway through, to exercise the frame-delta clamp.
    const double stallAt = args.seconds * 0.5;
    const double stallLength = 2.0;
    bool stalled = false;

    double now = 0.0;
    double simulated = 0.0;
    int frames = 0;

    while (g_running && simulated < args.seconds) {
        game.set_input(scripted_input(simulated));
        game.update(now);

        now += frame;
        simulated += frame;
        ++frames;

        if (!stalled && simulated >= stallAt) {
            stalled = true;
            now += stallLength;
        }
    }

    const session::SessionSnapshot snap = game.snapshot();

    std::cout << "\n  seed        " << cfg.level.seed << "\n";
    std::cout << "  blocks      " << game.level().index.size() << "\n";
    std::cout << "  frames      " << frames << "\n";
    std::cout << "  ticks       " << snap.tick << "\n";
    std::cout << "  clamped     " << game.scheduler().clamped_frames() << "\n";
    std::cout << "  resets      " << snap.resets << "\n";
    std::cout << "  score       " << snap.score << " (best " << bestScore << ")\n";
    std::cout << "  victory     " << (snap.victory ? "yes" : "no") << "\n";
    std::cout << "  position    " << snap.player.position.x << ", " << snap.player.position.y << ", "
              << snap.player.position.z << "\n";

    core::Logger::instance().shutdown();
    return 0;
}
