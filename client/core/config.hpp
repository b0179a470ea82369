#pragma once

#include "../../shared/protocol/entities.hpp"

#include <array>
#include <string>

namespace core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};
};

struct InterestConfig {
    // World grid (world units). Must match the authority's grid.
    float chunk_size{960.0f};
    float world_width{4800.0f};
    float world_height{4800.0f};

    // Visible rectangle around the local actor, plus pre-fetch margin.
    float view_width{1280.0f};
    float view_height{720.0f};
    float buffer_margin{96.0f};

    // Viewport push throttling.
    int debounce_ms{250};
    float move_threshold_sq{48.0f * 48.0f};
};

struct ReplicationConfig {
    float position_epsilon{0.01f};
    int retry_interval_ms{1000};
};

enum class EntityClass : std::uint8_t {
    Global = 0,
    Spatial = 1,
};

struct ClientConfig {
    LoggingConfig logging{};
    InterestConfig interest{};
    ReplicationConfig replication{};

    // Indexed by shared::proto::EntityType.
    std::array<EntityClass, shared::proto::kEntityTypeCount> classes{};
};

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& path);

    // Parses INI text directly (same rules as load_from_file).
    void load_from_string(const std::string& text);

    void reset_to_defaults();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ClientConfig& get() const { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const InterestConfig& interest() const { return config_.interest; }
    const ReplicationConfig& replication() const { return config_.replication; }

    EntityClass entity_class(shared::proto::EntityType type) const;

    static ClientConfig defaults();

    // Rejects values no grid or tracker can work with. Returns false and fills `err`.
    static bool validate(const ClientConfig& cfg, std::string& err);

private:
    Config();

    ClientConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static float parse_float(const std::string& v, float default_value);

    static int log_level_from_string(const std::string& v, int default_value);

    void parse_line(std::string line, std::string& section);
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace core
