#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace monotower::core {

namespace {

std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool set_error(std::string* err, const char* key, double value, const char* rule) {
    if (err) {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "invalid %s=%g (%s)", key, value, rule);
        *err = buf;
    }
    return false;
}

} // namespace

const char* seam_strategy_name(SeamStrategy s) {
    switch (s) {
        case SeamStrategy::RegionMerge: return "region_merge";
        case SeamStrategy::NeighborHeuristic: return "neighbor_heuristic";
    }
    return "unknown";
}

bool validate_config(const GameConfig& cfg, std::string* err) {
    const auto& p = cfg.physics;
    const auto& t = cfg.timing;

    if (!(p.block_size > 0.0f)) return set_error(err, "physics.block_size", p.block_size, "must be > 0");
    if (!(p.player_radius > 0.0f)) return set_error(err, "physics.player_radius", p.player_radius, "must be > 0");
    if (!(t.time_step > 0.0)) return set_error(err, "timing.time_step", t.time_step, "must be > 0");
    if (!(t.max_frame_delta >= t.time_step)) {
        return set_error(err, "timing.max_frame_delta", t.max_frame_delta, "must be >= time_step");
    }
    if (!(p.friction >= 0.0f && p.friction <= 1.0f)) {
        return set_error(err, "physics.friction", p.friction, "must be in [0, 1]");
    }
    if (!(p.max_speed > 0.0f)) return set_error(err, "physics.max_speed", p.max_speed, "must be > 0");
    if (!(p.collision_range > 0.0f)) {
        return set_error(err, "physics.collision_range", p.collision_range, "must be > 0");
    }
    if (p.coyote_frames < 0) return set_error(err, "physics.coyote_frames", p.coyote_frames, "must be >= 0");
    if (p.solver_iterations < 1) {
        return set_error(err, "physics.solver_iterations", p.solver_iterations, "must be >= 1");
    }
    if (cfg.level.tower_height < 0) {
        return set_error(err, "level.tower_height", cfg.level.tower_height, "must be >= 0");
    }
    if (!std::isfinite(p.gravity) || !std::isfinite(p.jump_force) || !std::isfinite(p.move_speed)) {
        if (err) *err = "physics.gravity/jump_force/move_speed must be finite";
        return false;
    }

    const auto& s = cfg.session;
    if (!std::isfinite(s.fall_floor)) return set_error(err, "session.fall_floor", s.fall_floor, "must be finite");
    if (!(std::isfinite(s.status_clear_seconds) && s.status_clear_seconds >= 0.0)) {
        return set_error(err, "session.status_clear_seconds", s.status_clear_seconds, "must be finite and >= 0");
    }
    if (!std::isfinite(s.spawn.x) || !std::isfinite(s.spawn.y) || !std::isfinite(s.spawn.z)) {
        if (err) *err = "session.spawn must be finite";
        return false;
    }
    return true;
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    const std::string s = trim(v);
    if (s.empty()) return default_value;

    errno = 0;
    char* end = nullptr;
    const long out = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return default_value;
    return static_cast<int>(out);
}

double Config::parse_double(const std::string& v, double default_value) {
    const std::string s = trim(v);
    if (s.empty()) return default_value;

    errno = 0;
    char* end = nullptr;
    const double out = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return default_value;
    return out;
}

float Config::parse_float(const std::string& v, float default_value) {
    return static_cast<float>(parse_double(v, static_cast<double>(default_value)));
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

SeamStrategy Config::seam_strategy_from_string(const std::string& v, SeamStrategy default_value) {
    const std::string s = to_lower(strip_quotes(v));
    if (s == "region_merge" || s == "merge" || s == "region") return SeamStrategy::RegionMerge;
    if (s == "neighbor_heuristic" || s == "neighbor" || s == "heuristic") return SeamStrategy::NeighborHeuristic;
    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "physics") {
        auto& p = config_.physics;
        if (k == "block_size") p.block_size = parse_float(v, p.block_size);
        else if (k == "player_radius") p.player_radius = parse_float(v, p.player_radius);
        else if (k == "gravity") p.gravity = parse_float(v, p.gravity);
        else if (k == "jump_force") p.jump_force = parse_float(v, p.jump_force);
        else if (k == "move_speed") p.move_speed = parse_float(v, p.move_speed);
        else if (k == "friction") p.friction = parse_float(v, p.friction);
        else if (k == "max_speed") p.max_speed = parse_float(v, p.max_speed);
        else if (k == "collision_range") p.collision_range = parse_float(v, p.collision_range);
        else if (k == "coyote_frames") p.coyote_frames = parse_int(v, p.coyote_frames);
        else if (k == "solver_iterations") p.solver_iterations = parse_int(v, p.solver_iterations);
        else if (k == "seam_strategy") p.seam_strategy = seam_strategy_from_string(v, p.seam_strategy);
        return;
    }

    if (sec == "timing") {
        auto& t = config_.timing;
        if (k == "time_step") t.time_step = parse_double(v, t.time_step);
        else if (k == "tick_rate") {
            const double rate = parse_double(v, 0.0);
            if (rate > 0.0) t.time_step = 1.0 / rate;
        }
        else if (k == "max_frame_delta") t.max_frame_delta = parse_double(v, t.max_frame_delta);
        return;
    }

    if (sec == "level") {
        auto& l = config_.level;
        if (k == "seed") l.seed = static_cast<std::uint32_t>(parse_int(v, static_cast<int>(l.seed)));
        else if (k == "tower_height") l.tower_height = parse_int(v, l.tower_height);
        return;
    }

    if (sec == "session") {
        auto& s = config_.session;
        if (k == "spawn_x") s.spawn.x = parse_float(v, s.spawn.x);
        else if (k == "spawn_y") s.spawn.y = parse_float(v, s.spawn.y);
        else if (k == "spawn_z") s.spawn.z = parse_float(v, s.spawn.z);
        else if (k == "fall_floor") s.fall_floor = parse_float(v, s.fall_floor);
        else if (k == "status_clear_seconds") s.status_clear_seconds = parse_double(v, s.status_clear_seconds);
        return;
    }

    if (sec == "logging") {
        auto& lg = config_.logging;
        if (k == "enabled") lg.enabled = parse_bool(v, lg.enabled);
        else if (k == "level") lg.level = log_level_from_string(v, lg.level);
        else if (k == "file") lg.file = strip_quotes(v);
        else if (k == "collision_debug") lg.collision_debug = parse_bool(v, lg.collision_debug);
        return;
    }

    if (sec == "debug") {
        if (k == "collision") config_.logging.collision_debug = parse_bool(v, config_.logging.collision_debug);
        return;
    }
}

void Config::parse_lines(std::istream& in) {
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    parse_lines(in);
    loaded_from_path_ = path;
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    parse_lines(in);
}

bool Config::apply_override(const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos) return false;

    const std::string lhs = trim(assignment.substr(0, eq));
    const auto dot = lhs.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= lhs.size()) return false;

    apply_kv(lhs.substr(0, dot), lhs.substr(dot + 1), assignment.substr(eq + 1));
    return true;
}

} // namespace monotower::core
