#include "subscription_handle.hpp"

#include <utility>

namespace client::net {

SubscriptionHandle::SubscriptionHandle(shared::proto::SubscriptionId id, std::weak_ptr<ISubscriptionCanceller> owner)
    : id_(id), owner_(std::move(owner)) {}

SubscriptionHandle::~SubscriptionHandle() {
    release();
}

SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : id_(other.id_), owner_(std::move(other.owner_)), released_(other.released_) {
    other.id_ = shared::proto::kInvalidSubscriptionId;
    other.released_ = true;
}

SubscriptionHandle& SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        release();

        id_ = other.id_;
        owner_ = std::move(other.owner_);
        released_ = other.released_;

        other.id_ = shared::proto::kInvalidSubscriptionId;
        other.released_ = true;
    }
    return *this;
}

void SubscriptionHandle::release() {
    if (released_ || id_ == shared::proto::kInvalidSubscriptionId) {
        released_ = true;
        return;
    }
    released_ = true;

    if (auto owner = owner_.lock()) {
        owner->cancel(id_);
    }
    owner_.reset();
}

} // namespace client::net
