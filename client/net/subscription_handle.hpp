#pragma once

#include "../../shared/protocol/messages.hpp"

#include <memory>

namespace client::net {

// Implemented by whatever owns the live query channels (the subscription service).
class ISubscriptionCanceller {
public:
    virtual ~ISubscriptionCanceller() = default;

    virtual void cancel(shared::proto::SubscriptionId id) = 0;
};

// Owner of one outstanding query channel. Move-only; releases on destruction.
// release() is idempotent and a no-op once the owning service is gone.
class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(shared::proto::SubscriptionId id, std::weak_ptr<ISubscriptionCanceller> owner);
    ~SubscriptionHandle();

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    SubscriptionHandle(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;

    shared::proto::SubscriptionId id() const { return id_; }
    bool active() const { return id_ != shared::proto::kInvalidSubscriptionId && !released_; }

    void release();

private:
    shared::proto::SubscriptionId id_{shared::proto::kInvalidSubscriptionId};
    std::weak_ptr<ISubscriptionCanceller> owner_;
    bool released_{false};
};

} // namespace client::net
