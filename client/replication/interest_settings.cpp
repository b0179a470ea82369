#include "interest_settings.hpp"

#include <stdexcept>
#include <string>

namespace client::replication {

InterestSettings InterestSettings::defaults() {
    return from_config(core::Config::defaults());
}

InterestSettings InterestSettings::from_config(const core::ClientConfig& cfg) {
    std::string err;
    if (!core::Config::validate(cfg, err)) {
        throw std::invalid_argument("invalid interest configuration: " + err);
    }

    InterestSettings s;
    s.grid.chunkSize = cfg.interest.chunk_size;
    s.grid.worldWidth = cfg.interest.world_width;
    s.grid.worldHeight = cfg.interest.world_height;

    for (std::size_t i = 0; i < shared::proto::kEntityTypeCount; ++i) {
        const auto type = static_cast<EntityType>(i);
        if (cfg.classes[i] == core::EntityClass::Spatial) {
            s.spatialTypes.push_back(type);
        } else {
            s.globalTypes.push_back(type);
        }
    }

    s.change.positionEpsilon = cfg.replication.position_epsilon;
    s.retryInterval = std::chrono::milliseconds(cfg.replication.retry_interval_ms);
    return s;
}

interest::TrackerSettings tracker_settings_from_config(const core::InterestConfig& cfg) {
    interest::TrackerSettings t;
    t.viewWidth = cfg.view_width;
    t.viewHeight = cfg.view_height;
    t.bufferMargin = cfg.buffer_margin;
    t.debounce = std::chrono::milliseconds(cfg.debounce_ms);
    t.moveThresholdSq = cfg.move_threshold_sq;
    return t;
}

} // namespace client::replication
