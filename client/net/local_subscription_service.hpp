#pragma once

#include "subscription_service.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace client::net {

// In-process authority: owns the authoritative tables, matches live queries against them and
// queues the resulting notifications. Used by the simulator and integration tests in place of
// a networked service.
//
// Delivery follows the remote service: subscribing delivers the matching rows not already
// covered by another live query as inserts, then SubscriptionApplied; cancelling delivers
// deletes for rows no longer covered by any live query; row changes are delivered as
// insert/update/delete depending on coverage before and after the change.
class LocalSubscriptionService final : public ISubscriptionService {
public:
    LocalSubscriptionService();
    ~LocalSubscriptionService() override;

    LocalSubscriptionService(const LocalSubscriptionService&) = delete;
    LocalSubscriptionService& operator=(const LocalSubscriptionService&) = delete;

    // --- Connection control ---

    void connect(const shared::proto::Identity& identity);
    void disconnect(const std::string& reason);
    void fail_connect(const std::string& reason);
    bool is_connected() const;

    // --- Authoritative tables ---

    void upsert(const shared::proto::AnyRow& row);
    void remove(const shared::proto::AnyRow& row);
    std::size_t row_count(shared::proto::EntityType type) const;

    // --- Failure injection ---

    // Next subscribe() is rejected synchronously.
    void reject_next_subscribe(const std::string& reason);
    // Next subscribe() is accepted but answered with SubscriptionFailed.
    void fail_next_subscribe(const std::string& reason);

    // --- Diagnostics ---

    std::size_t live_subscription_count() const;
    std::size_t subscribe_calls() const;
    std::size_t cancel_calls() const;
    std::size_t pending_messages() const;

    // --- ISubscriptionService ---

    shared::proto::Identity local_identity() const override;
    std::optional<SubscriptionHandle> subscribe(const shared::proto::Query& query, std::string& err) override;
    bool try_recv(shared::proto::ServiceMessage& outMsg) override;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace client::net
