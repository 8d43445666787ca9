#pragma once

#include "types.hpp"

#include <raylib.h>

#include <iosfwd>
#include <string>

namespace monotower::core {

struct PhysicsConfig {
    float block_size{40.0f};
    float player_radius{20.0f};

    float gravity{0.65f};
    float jump_force{14.0f};
    float move_speed{1.2f};
    float friction{0.82f};
    float max_speed{10.0f};

    // Broad-phase cutoff: blocks whose center is farther than this on any axis are skipped.
    float collision_range{80.0f};
    int coyote_frames{5};

    // Resolver passes per tick.
    int solver_iterations{4};
    SeamStrategy seam_strategy{SeamStrategy::RegionMerge};
};

struct TimingConfig {
    double time_step{1.0 / 60.0};
    double max_frame_delta{0.1};
};

struct LevelConfig {
    // 0 = the driver picks a seed from the clock.
    std::uint32_t seed{0};
    int tower_height{100};
};

struct SessionConfig {
    Vector3 spawn{0.0f, 150.0f, 0.0f};
    float fall_floor{-300.0f};
    double status_clear_seconds{1.0};
};

struct LoggingConfig {
    bool enabled{true};
    int level{LOG_INFO};
    std::string file{};

    bool collision_debug{false};
};

struct GameConfig {
    PhysicsConfig physics{};
    TimingConfig timing{};
    LevelConfig level{};
    SessionConfig session{};
    LoggingConfig logging{};
};

// Fail-fast gate applied once before any tick runs.
bool validate_config(const GameConfig& cfg, std::string* err);

const char* seam_strategy_name(SeamStrategy s);

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& path);

    // Same parser, fed from memory (used by tests and --set overrides).
    void load_from_string(const std::string& text);

    // Applies a single "section.key=value" override.
    bool apply_override(const std::string& assignment);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const GameConfig& get() const { return config_; }
    GameConfig& mutable_get() { return config_; }

    const PhysicsConfig& physics() const { return config_.physics; }
    const TimingConfig& timing() const { return config_.timing; }
    const LevelConfig& level() const { return config_.level; }
    const SessionConfig& session() const { return config_.session; }
    const LoggingConfig& logging() const { return config_.logging; }

    void reset_to_defaults() { config_ = GameConfig{}; loaded_from_path_.clear(); }

private:
    Config() = default;

    GameConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static float parse_float(const std::string& v, float default_value);
    static double parse_double(const std::string& v, double default_value);

    static int log_level_from_string(const std::string& v, int default_value);
    static SeamStrategy seam_strategy_from_string(const std::string& v, SeamStrategy default_value);

    void parse_lines(std::istream& in);
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace monotower::core
