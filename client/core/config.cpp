#include "config.hpp"

#include "../../shared/world/chunk_grid.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace core {

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

} // namespace

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    config_ = defaults();
}

ClientConfig Config::defaults() {
    ClientConfig cfg;

    cfg.logging.enabled = true;
    cfg.logging.level = LOG_INFO;
    cfg.logging.file = "";

    // Resources are chunk-indexed by the authority; everything else is small enough to
    // replicate whole.
    cfg.classes.fill(EntityClass::Global);
    cfg.classes[static_cast<std::size_t>(shared::proto::EntityType::Tree)] = EntityClass::Spatial;
    cfg.classes[static_cast<std::size_t>(shared::proto::EntityType::Stone)] = EntityClass::Spatial;
    cfg.classes[static_cast<std::size_t>(shared::proto::EntityType::Mushroom)] = EntityClass::Spatial;
    cfg.classes[static_cast<std::size_t>(shared::proto::EntityType::Campfire)] = EntityClass::Spatial;

    return cfg;
}

void Config::reset_to_defaults() {
    config_ = defaults();
    loaded_from_path_.clear();
}

bool Config::validate(const ClientConfig& cfg, std::string& err) {
    const auto& in = cfg.interest;
    if (!std::isfinite(in.chunk_size) || !std::isfinite(in.world_width) || !std::isfinite(in.world_height) ||
        !std::isfinite(in.view_width) || !std::isfinite(in.view_height) || !std::isfinite(in.buffer_margin) ||
        !std::isfinite(in.move_threshold_sq)) {
        err = "interest values must be finite";
        return false;
    }
    if (!(in.chunk_size > 0.0f)) {
        err = "interest.chunk_size must be > 0";
        return false;
    }
    if (!(in.world_width > 0.0f) || !(in.world_height > 0.0f)) {
        err = "interest.world_width and interest.world_height must be > 0";
        return false;
    }

    shared::world::ChunkGrid grid;
    grid.chunkSize = in.chunk_size;
    grid.worldWidth = in.world_width;
    grid.worldHeight = in.world_height;
    if (!grid.valid()) {
        err = "interest grid has too many chunks for 32-bit chunk ids";
        return false;
    }
    if (in.view_width < 0.0f || in.view_height < 0.0f || in.buffer_margin < 0.0f) {
        err = "interest view extent and buffer_margin must be >= 0";
        return false;
    }
    if (in.debounce_ms < 0 || in.move_threshold_sq < 0.0f) {
        err = "interest.debounce_ms and interest.move_threshold_sq must be >= 0";
        return false;
    }

    const auto& rep = cfg.replication;
    if (!std::isfinite(rep.position_epsilon) || rep.position_epsilon < 0.0f) {
        err = "replication.position_epsilon must be finite and >= 0";
        return false;
    }
    if (rep.retry_interval_ms < 0) {
        err = "replication.retry_interval_ms must be >= 0";
        return false;
    }

    for (std::size_t i = 0; i < cfg.classes.size(); ++i) {
        const auto type = static_cast<shared::proto::EntityType>(i);
        if (cfg.classes[i] == EntityClass::Spatial && !shared::proto::entity_type_is_chunked(type)) {
            err = std::string("entity ") + shared::proto::entity_type_name(type) + " cannot be spatial";
            return false;
        }
    }

    return true;
}

EntityClass Config::entity_class(shared::proto::EntityType type) const {
    const auto idx = static_cast<std::size_t>(type);
    if (idx >= config_.classes.size()) return EntityClass::Global;
    return config_.classes[idx];
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
    try {
        size_t idx = 0;
        int out = std::stoi(trim(v), &idx, 10);
        (void)idx;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

float Config::parse_float(const std::string& v, float default_value) {
    try {
        size_t idx = 0;
        float out = std::stof(trim(v), &idx);
        (void)idx;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
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

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "interest") {
        auto& in = config_.interest;
        if (k == "chunk_size") in.chunk_size = parse_float(v, in.chunk_size);
        else if (k == "world_width") in.world_width = parse_float(v, in.world_width);
        else if (k == "world_height") in.world_height = parse_float(v, in.world_height);
        else if (k == "view_width") in.view_width = parse_float(v, in.view_width);
        else if (k == "view_height") in.view_height = parse_float(v, in.view_height);
        else if (k == "buffer_margin") in.buffer_margin = parse_float(v, in.buffer_margin);
        else if (k == "debounce_ms") in.debounce_ms = parse_int(v, in.debounce_ms);
        else if (k == "move_threshold_sq") in.move_threshold_sq = parse_float(v, in.move_threshold_sq);
        return;
    }

    if (sec == "replication") {
        auto& rep = config_.replication;
        if (k == "position_epsilon") rep.position_epsilon = parse_float(v, rep.position_epsilon);
        else if (k == "retry_interval_ms") rep.retry_interval_ms = parse_int(v, rep.retry_interval_ms);
        return;
    }

    if (sec == "entities") {
        const auto type = shared::proto::entity_type_from_name(k);
        if (!type) {
            TraceLog(LOG_WARNING, "[config] unknown entity type '%s'", k.c_str());
            return;
        }

        const std::string cls = to_lower(v);
        auto& slot = config_.classes[static_cast<std::size_t>(*type)];
        if (cls == "global") {
            slot = EntityClass::Global;
        } else if (cls == "spatial") {
            if (!shared::proto::entity_type_is_chunked(*type)) {
                TraceLog(LOG_WARNING, "[config] %s rows carry no chunk index; keeping it global", k.c_str());
                return;
            }
            slot = EntityClass::Spatial;
        } else {
            TraceLog(LOG_WARNING, "[config] %s: expected spatial|global, got '%s'", k.c_str(), v.c_str());
        }
        return;
    }
}

void Config::parse_line(std::string line, std::string& section) {
    // Strip comments (# or ;) - simplest approach: cut at first occurrence.
    auto hash = line.find('#');
    auto semi = line.find(';');
    size_t cut = std::string::npos;
    if (hash != std::string::npos) cut = hash;
    if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) return;

    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) return;

    apply_kv(section, key, value);
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        parse_line(line, section);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        parse_line(line, section);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace core
