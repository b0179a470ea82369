// sightline_sim - headless interest-management simulator
// Walks a local actor across an in-process world and reports subscription churn.

#include "../client/core/config.hpp"
#include "../client/core/logger.hpp"
#include "../client/interest/viewport_tracker.hpp"
#include "../client/net/local_subscription_service.hpp"
#include "../client/replication/connection_lifecycle.hpp"

#include <raylib.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#ifndef SIGHTLINE_VERSION
#define SIGHTLINE_VERSION "0.0.0-dev"
#endif

namespace {

namespace proto = shared::proto;
using client::replication::ConnectionLifecycle;

void print_banner() {
    std::cout << "  sightline simulator v" << SIGHTLINE_VERSION << "\n";
    std::cout << "  ============================================\n\n";
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>     Config file (default: sightline.conf)\n";
    std::cout << "  --steps <n>         Simulation steps per connection (default: 200)\n";
    std::cout << "  --step-ms <n>       Simulated milliseconds per step (default: 100)\n";
    std::cout << "  --speed <u>         Actor speed in world units per step (default: 24)\n";
    std::cout << "  --resources <n>     Resources per kind scattered over the world (default: 400)\n";
    std::cout << "  --verbose           Enable debug logging\n";
    std::cout << "  --quiet             Disable most logging\n";
    std::cout << "  --help              Show this help message\n";
}

struct Args {
    std::string configPath = "sightline.conf";
    int steps = 200;
    int stepMs = 100;
    float speed = 24.0f;
    int resources = 400;
    bool verbose = false;
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
        else if (std::strcmp(arg, "--steps") == 0 && i + 1 < argc) {
            args.steps = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--step-ms") == 0 && i + 1 < argc) {
            args.stepMs = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--speed") == 0 && i + 1 < argc) {
            args.speed = static_cast<float>(std::atof(argv[++i]));
        }
        else if (std::strcmp(arg, "--resources") == 0 && i + 1 < argc) {
            args.resources = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

// Deterministic scatter so runs are comparable.
struct Scatter {
    std::uint32_t state;

    float next(float extent) {
        state = state * 1664525u + 1013904223u;
        return static_cast<float>(state >> 8) / static_cast<float>(1u << 24) * extent;
    }
};

void populate_world(client::net::LocalSubscriptionService& service,
                    const shared::world::ChunkGrid& grid,
                    int perKind) {
    Scatter rng{12345u};

    for (int i = 0; i < perKind; ++i) {
        proto::Tree tree;
        tree.id = static_cast<proto::EntityId>(i + 1);
        tree.posX = rng.next(grid.worldWidth);
        tree.posY = rng.next(grid.worldHeight);
        tree.treeType = (i % 7 == 0) ? proto::TreeType::Stump : proto::TreeType::Oak;
        tree.chunkIndex = grid.chunk_for_point(tree.posX, tree.posY);
        service.upsert(tree);

        proto::Stone stone;
        stone.id = static_cast<proto::EntityId>(i + 1);
        stone.posX = rng.next(grid.worldWidth);
        stone.posY = rng.next(grid.worldHeight);
        stone.chunkIndex = grid.chunk_for_point(stone.posX, stone.posY);
        service.upsert(stone);

        proto::Mushroom mushroom;
        mushroom.id = static_cast<proto::EntityId>(i + 1);
        mushroom.posX = rng.next(grid.worldWidth);
        mushroom.posY = rng.next(grid.worldHeight);
        mushroom.chunkIndex = grid.chunk_for_point(mushroom.posX, mushroom.posY);
        service.upsert(mushroom);
    }

    proto::ItemDefinition wood;
    wood.id = 1;
    wood.name = "Wood";
    wood.isStackable = true;
    wood.stackSize = 1000;
    service.upsert(wood);

    proto::ItemDefinition stoneItem;
    stoneItem.id = 2;
    stoneItem.name = "Stone";
    stoneItem.isStackable = true;
    stoneItem.stackSize = 1000;
    service.upsert(stoneItem);

    proto::WorldState world;
    world.id = 1;
    world.timeOfDay = 0.25f;
    service.upsert(world);
}

proto::Player make_actor(const proto::Identity& identity, float x, float y) {
    proto::Player p;
    p.identity = identity;
    p.username = "walker";
    p.positionX = x;
    p.positionY = y;
    return p;
}

void report(const ConnectionLifecycle& lifecycle, const char* label) {
    const auto& replicas = lifecycle.replicas();
    const auto* registry = lifecycle.registry();

    TraceLog(LOG_INFO, "[sim] %s: state=%s replicas=%zu (tree=%zu stone=%zu mushroom=%zu) live=%zu",
             label,
             client::replication::lifecycle_state_name(lifecycle.state()),
             replicas.total_size(),
             replicas.size(proto::EntityType::Tree),
             replicas.size(proto::EntityType::Stone),
             replicas.size(proto::EntityType::Mushroom),
             registry ? registry->live_count() : std::size_t{0});

    if (registry) {
        const auto& st = registry->stats();
        TraceLog(LOG_INFO, "[sim] churn: adds=%zu removes=%zu failures=%zu", st.adds, st.removes, st.failures);
    }
}

// Walks the actor along a circle around the world centre for `steps` steps.
void walk(ConnectionLifecycle& lifecycle,
          client::net::LocalSubscriptionService& service,
          client::interest::ViewportTracker& tracker,
          const proto::Identity& identity,
          const Args& args,
          ConnectionLifecycle::Clock::time_point& now) {
    const auto& grid = lifecycle.settings().grid;
    const float cx = grid.worldWidth * 0.5f;
    const float cy = grid.worldHeight * 0.5f;
    const float radius = std::min(grid.worldWidth, grid.worldHeight) * 0.35f;
    const float circumference = 2.0f * 3.14159265f * radius;

    for (int step = 0; step < args.steps; ++step) {
        const float angle = (args.speed * static_cast<float>(step)) / circumference * 2.0f * 3.14159265f;
        const float x = cx + radius * std::cos(angle);
        const float y = cy + radius * std::sin(angle);

        service.upsert(make_actor(identity, x, y));
        lifecycle.poll(now);

        if (lifecycle.local_actor_registered()) {
            if (auto vp = tracker.update(x, y, now)) {
                lifecycle.set_viewport(vp);
            }
        }

        now += std::chrono::milliseconds(args.stepMs);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    print_banner();

    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& config = core::Config::instance();
    if (!config.load_from_file(args.configPath)) {
        std::cout << "[INFO] No config at " << args.configPath << ", using defaults\n";
    }

    core::LoggingConfig logging = config.logging();
    if (args.quiet) {
        logging.level = LOG_WARNING;
    } else if (args.verbose) {
        logging.level = LOG_DEBUG;
    }
    core::Logger::instance().init(logging);

    client::replication::InterestSettings settings;
    try {
        settings = client::replication::InterestSettings::from_config(config.get());
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    auto service = std::make_shared<client::net::LocalSubscriptionService>();
    populate_world(*service, settings.grid, args.resources);

    ConnectionLifecycle lifecycle(service, settings);
    client::interest::ViewportTracker tracker(
        client::replication::tracker_settings_from_config(config.interest()));
    lifecycle.on_viewport_cleared().connect<&client::interest::ViewportTracker::reset>(tracker);

    const proto::Identity identity{0x51u, 0x6874u};
    auto now = ConnectionLifecycle::Clock::now();

    // First session.
    service->connect(identity);
    walk(lifecycle, *service, tracker, identity, args, now);
    report(lifecycle, "after first walk");

    // Connection loss: everything connection-scoped goes away.
    service->disconnect("simulated network drop");
    lifecycle.poll(now);
    report(lifecycle, "after disconnect");

    // Reconnect and walk again from a clean slate.
    service->connect(identity);
    walk(lifecycle, *service, tracker, identity, args, now);
    report(lifecycle, "after second walk");

    // Authority removes the local actor: spatial interest is dropped, globals stay.
    service->remove(make_actor(identity, 0.0f, 0.0f));
    lifecycle.poll(now);
    report(lifecycle, "after actor removal");

    core::Logger::instance().shutdown();
    return 0;
}
