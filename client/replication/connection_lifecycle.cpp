#include "connection_lifecycle.hpp"

#include <raylib.h>

namespace client::replication {

namespace proto = shared::proto;

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
        case LifecycleState::Unbound: return "unbound";
        case LifecycleState::Bound: return "bound";
    }
    return "unknown";
}

ConnectionContext::ConnectionContext(net::ISubscriptionService& service,
                                     const InterestSettings& settings,
                                     proto::ConnectionId id,
                                     proto::Identity identity)
    : connectionId(id),
      registry(service),
      replicas(settings.change, identity),
      reconciler(registry, settings.grid, settings.spatialTypes) {}

ConnectionLifecycle::ConnectionLifecycle(std::shared_ptr<net::ISubscriptionService> service,
                                         InterestSettings settings)
    : service_(std::move(service)), settings_(std::move(settings)) {}

ConnectionLifecycle::~ConnectionLifecycle() {
    entt::sink{viewportCleared_}.disconnect();
    unbind_("shutdown");
}

std::size_t ConnectionLifecycle::poll(Clock::time_point now) {
    std::size_t handled = 0;

    proto::ServiceMessage msg;
    while (service_->try_recv(msg)) {
        handle_(msg, now);
        ++handled;
    }

    retry_if_due_(now);
    return handled;
}

void ConnectionLifecycle::handle_(const proto::ServiceMessage& msg, Clock::time_point now) {
    if (std::holds_alternative<proto::Connected>(msg)) {
        bind_(std::get<proto::Connected>(msg), now);
    } else if (std::holds_alternative<proto::Disconnected>(msg)) {
        const auto& ev = std::get<proto::Disconnected>(msg);
        lastError_ = ev.reason;
        unbind_(ev.reason);
    } else if (std::holds_alternative<proto::ConnectError>(msg)) {
        const auto& ev = std::get<proto::ConnectError>(msg);
        TraceLog(LOG_ERROR, "[lifecycle] connect error: %s", ev.reason.c_str());
        lastError_ = ev.reason;
        unbind_(ev.reason);
    } else if (std::holds_alternative<proto::SubscriptionApplied>(msg)) {
        if (ctx_) ctx_->registry.on_applied(std::get<proto::SubscriptionApplied>(msg).id);
    } else if (std::holds_alternative<proto::SubscriptionFailed>(msg)) {
        const auto& ev = std::get<proto::SubscriptionFailed>(msg);
        if (ctx_) ctx_->registry.on_failed(ev.id, ev.reason);
    } else if (ctx_) {
        ctx_->replicas.apply(msg);
    } else {
        TraceLog(LOG_DEBUG, "[lifecycle] row event while unbound dropped");
    }
}

void ConnectionLifecycle::bind_(const proto::Connected& ev, Clock::time_point now) {
    if (ctx_) {
        if (ctx_->connectionId == ev.connectionId) {
            TraceLog(LOG_DEBUG, "[lifecycle] connection %llu already bound",
                     static_cast<unsigned long long>(ev.connectionId));
            return;
        }
        // A new connection instance replaces the old one; tear down first.
        unbind_("superseded by a new connection");
    }

    const proto::Identity identity = ev.identity.is_null() ? service_->local_identity() : ev.identity;

    ctx_ = std::make_unique<ConnectionContext>(*service_, settings_, ev.connectionId, identity);
    ctx_->replicas.on_local_actor_removed().connect<&ConnectionLifecycle::on_local_actor_removed_>(*this);

    state_ = LifecycleState::Bound;
    lastError_.reset();
    retryPending_ = false;
    lastRetry_ = now;

    TraceLog(LOG_INFO, "[lifecycle] bound connection %llu as %s (spatial=%zu global=%zu)",
             static_cast<unsigned long long>(ev.connectionId), identity.to_hex().c_str(),
             settings_.spatialTypes.size(), settings_.globalTypes.size());

    for (EntityType type : settings_.globalTypes) {
        ctx_->registry.add_global(type);
    }

    if (viewport_) {
        ctx_->reconciler.reconcile(viewport_);
    }
}

void ConnectionLifecycle::unbind_(const std::string& reason) {
    if (!ctx_) {
        state_ = LifecycleState::Unbound;
        return;
    }

    TraceLog(LOG_INFO, "[lifecycle] unbinding connection %llu: %s",
             static_cast<unsigned long long>(ctx_->connectionId), reason.c_str());

    // Release handles before clearing replicas.
    ctx_->registry.remove_all();
    ctx_->replicas.clear_all();
    ctx_.reset();

    state_ = LifecycleState::Unbound;
    retryPending_ = false;
    clear_viewport_();
}

ReconcileResult ConnectionLifecycle::set_viewport(const std::optional<interest::Viewport>& viewport) {
    viewport_ = viewport;
    if (!ctx_) {
        return {};
    }
    return ctx_->reconciler.reconcile(viewport_);
}

void ConnectionLifecycle::retry_if_due_(Clock::time_point now) {
    if (!ctx_) return;

    if (ctx_->registry.take_retry_request()) {
        retryPending_ = true;
    }
    if (!retryPending_ || now - lastRetry_ < settings_.retryInterval) {
        return;
    }

    retryPending_ = false;
    lastRetry_ = now;

    std::size_t reissued = 0;
    for (EntityType type : settings_.globalTypes) {
        if (ctx_->registry.add_global(type)) ++reissued;
    }
    reissued += ctx_->reconciler.retry().mutations;

    TraceLog(LOG_INFO, "[lifecycle] retry pass reissued %zu subscription(s)", reissued);
}

void ConnectionLifecycle::on_local_actor_removed_() {
    TraceLog(LOG_INFO, "[lifecycle] local actor removed; clearing viewport");
    if (ctx_) {
        ctx_->reconciler.clear();
    }
    clear_viewport_();
}

void ConnectionLifecycle::clear_viewport_() {
    if (!viewport_) return;
    viewport_.reset();
    viewportCleared_.publish();
}

const ReplicaSet& ConnectionLifecycle::replicas() const {
    return ctx_ ? ctx_->replicas : empty_;
}

const SubscriptionRegistry* ConnectionLifecycle::registry() const {
    return ctx_ ? &ctx_->registry : nullptr;
}

bool ConnectionLifecycle::local_actor_registered() const {
    return ctx_ && ctx_->replicas.local_actor_registered();
}

std::optional<proto::ConnectionId> ConnectionLifecycle::connection_id() const {
    if (!ctx_) return std::nullopt;
    return ctx_->connectionId;
}

} // namespace client::replication
