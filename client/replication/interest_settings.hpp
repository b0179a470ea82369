#pragma once

#include "change_predicates.hpp"
#include "../core/config.hpp"
#include "../interest/viewport_tracker.hpp"

#include <chrono>
#include <vector>

namespace client::replication {

using shared::proto::EntityType;

// Everything the replication layer needs from configuration, resolved once at startup.
struct InterestSettings {
    shared::world::ChunkGrid grid{};

    // Subscribed per chunk, driven by the viewport.
    std::vector<EntityType> spatialTypes;
    // Subscribed once per connection.
    std::vector<EntityType> globalTypes;

    ChangeContext change{};

    // Minimum spacing between retry passes after subscribe failures.
    std::chrono::milliseconds retryInterval{1000};

    // Built from core::Config::defaults().
    static InterestSettings defaults();

    // Throws std::invalid_argument when the configuration fails core::Config::validate().
    static InterestSettings from_config(const core::ClientConfig& cfg);
};

interest::TrackerSettings tracker_settings_from_config(const core::InterestConfig& cfg);

} // namespace client::replication
