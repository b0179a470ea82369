#pragma once

#include "subscription_handle.hpp"

#include <optional>
#include <string>

namespace client::net {

// Client-side view of the remote authority: issues query channels and delivers connection,
// subscription and row notifications. try_recv() is drained on the caller's loop, so every
// notification is handled on one thread.
class ISubscriptionService {
public:
    virtual ~ISubscriptionService() = default;

    // Identity of the current connection (null when not connected).
    virtual shared::proto::Identity local_identity() const = 0;

    // Fires a subscribe request. A synchronous rejection returns nullopt and fills `err`;
    // otherwise the outcome arrives later as SubscriptionApplied or SubscriptionFailed.
    virtual std::optional<SubscriptionHandle> subscribe(const shared::proto::Query& query, std::string& err) = 0;

    virtual bool try_recv(shared::proto::ServiceMessage& outMsg) = 0;
};

} // namespace client::net
