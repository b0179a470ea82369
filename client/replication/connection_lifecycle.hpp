#pragma once

#include "interest_settings.hpp"
#include "replica_set.hpp"
#include "subscription_registry.hpp"
#include "viewport_reconciler.hpp"

#include <entt/signal/sigh.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace client::replication {

enum class LifecycleState : std::uint8_t {
    Unbound = 0,
    Bound = 1,
};

const char* lifecycle_state_name(LifecycleState state);

// Per-connection state. Created on bind, destroyed on unbind, never reused.
struct ConnectionContext {
    ConnectionContext(net::ISubscriptionService& service,
                      const InterestSettings& settings,
                      shared::proto::ConnectionId id,
                      shared::proto::Identity identity);

    shared::proto::ConnectionId connectionId;

    // Declaration order matters: the reconciler refers to the registry.
    SubscriptionRegistry registry;
    ReplicaSet replicas;
    ViewportReconciler reconciler;
};

// Owns the connection-scoped replication state and drives it from the service's message
// stream. All calls happen on the caller's loop; nothing here blocks.
class ConnectionLifecycle {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionLifecycle(std::shared_ptr<net::ISubscriptionService> service, InterestSettings settings);
    ~ConnectionLifecycle();

    ConnectionLifecycle(const ConnectionLifecycle&) = delete;
    ConnectionLifecycle& operator=(const ConnectionLifecycle&) = delete;

    // Drains every pending service message, then runs a retry pass if one is due.
    // Returns the number of messages handled.
    std::size_t poll(Clock::time_point now = Clock::now());

    // Sole control input. While Unbound the viewport is only remembered.
    // Unbinding and local actor removal forget the viewport; a caller that throttles its pushes
    // (ViewportTracker) must push again afterwards, see on_viewport_cleared.
    ReconcileResult set_viewport(const std::optional<interest::Viewport>& viewport);

    // Fired when the remembered viewport is dropped by an unbind or by local actor removal.
    // Not fired from the destructor.
    auto on_viewport_cleared() { return entt::sink{viewportCleared_}; }

    // A subscribe failure is waiting for the next retry pass.
    bool retry_pending() const { return retryPending_; }

    LifecycleState state() const { return state_; }
    bool bound() const { return state_ == LifecycleState::Bound; }

    // Empty while Unbound.
    const ReplicaSet& replicas() const;
    // Null while Unbound.
    const SubscriptionRegistry* registry() const;

    bool local_actor_registered() const;

    const std::optional<interest::Viewport>& viewport() const { return viewport_; }
    const std::optional<std::string>& last_error() const { return lastError_; }
    const InterestSettings& settings() const { return settings_; }

    std::optional<shared::proto::ConnectionId> connection_id() const;

private:
    void bind_(const shared::proto::Connected& ev, Clock::time_point now);
    void unbind_(const std::string& reason);

    void handle_(const shared::proto::ServiceMessage& msg, Clock::time_point now);
    void retry_if_due_(Clock::time_point now);

    void on_local_actor_removed_();
    void clear_viewport_();

    std::shared_ptr<net::ISubscriptionService> service_;
    InterestSettings settings_;

    LifecycleState state_{LifecycleState::Unbound};
    std::unique_ptr<ConnectionContext> ctx_;

    std::optional<interest::Viewport> viewport_;
    std::optional<std::string> lastError_;

    bool retryPending_{false};
    Clock::time_point lastRetry_{};

    ReplicaSet empty_;

    entt::sigh<void()> viewportCleared_;
};

} // namespace client::replication
