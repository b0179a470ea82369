#pragma once

/**
 * @file mock_subscription_service.hpp
 * @brief Mock subscription service for testing.
 *
 * Records every subscribe and release issued by the component under test and lets the
 * test inject the service's notifications by hand. Nothing is delivered automatically:
 * a subscribe is neither applied nor failed until the test says so.
 */

#include "net/subscription_service.hpp"
#include "protocol/messages.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace test_helpers {

/**
 * @brief Mock service that records subscriptions and allows injecting messages.
 *
 * Usage:
 *   auto service = std::make_shared<MockSubscriptionService>();
 *   SubscriptionRegistry registry(*service);
 *   registry.add(EntityType::Tree, 3);
 *   REQUIRE(service->live_count() == 1);
 */
class MockSubscriptionService final : public client::net::ISubscriptionService {
public:
    struct Record {
        shared::proto::SubscriptionId id{shared::proto::kInvalidSubscriptionId};
        shared::proto::Query query;
        std::size_t releases{0};
    };

    MockSubscriptionService() : canceller_(std::make_shared<Canceller>(*this)) {}

    shared::proto::Identity local_identity() const override { return identity_; }

    std::optional<client::net::SubscriptionHandle> subscribe(const shared::proto::Query& query,
                                                              std::string& err) override {
        if (rejectAll_ || rejectNext_ > 0) {
            if (rejectNext_ > 0) --rejectNext_;
            ++rejected_;
            err = "rejected by mock";
            return std::nullopt;
        }

        Record r;
        r.id = nextId_++;
        r.query = query;
        records_.push_back(r);
        return client::net::SubscriptionHandle(r.id, canceller_);
    }

    bool try_recv(shared::proto::ServiceMessage& outMsg) override {
        if (incoming_.empty()) {
            return false;
        }
        outMsg = std::move(incoming_.front());
        incoming_.pop();
        return true;
    }

    // =========================================================================
    // Test helpers
    // =========================================================================

    /** @brief Inject a message to be received by the component under test. */
    void inject_message(shared::proto::ServiceMessage msg) {
        incoming_.push(std::move(msg));
    }

    /** @brief Queue a Connected notification and adopt its identity. */
    void inject_connected(shared::proto::ConnectionId id, shared::proto::Identity identity) {
        identity_ = identity;
        shared::proto::Connected ev;
        ev.connectionId = id;
        ev.identity = identity;
        inject_message(ev);
    }

    void inject_disconnected(const std::string& reason = "test") {
        shared::proto::Disconnected ev;
        ev.reason = reason;
        inject_message(ev);
    }

    /** @brief Acknowledge every subscription that is still live. */
    void apply_all() {
        for (const auto& r : records_) {
            if (r.releases == 0) {
                shared::proto::SubscriptionApplied ev;
                ev.id = r.id;
                inject_message(ev);
            }
        }
    }

    /** @brief Reject the next `n` subscribe calls synchronously. */
    void reject_next(std::size_t n = 1) { rejectNext_ = n; }
    void reject_all(bool on) { rejectAll_ = on; }

    /** @brief Every subscribe that returned a handle, in call order. */
    const std::vector<Record>& records() const { return records_; }

    const Record* find(shared::proto::SubscriptionId id) const {
        auto it = std::find_if(records_.begin(), records_.end(),
                               [id](const Record& r) { return r.id == id; });
        return it == records_.end() ? nullptr : &*it;
    }

    /** @brief Subscriptions issued and not yet released. */
    std::size_t live_count() const {
        return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
                                                      [](const Record& r) { return r.releases == 0; }));
    }

    /** @brief Live subscriptions matching `query` exactly. */
    std::size_t live_count(const shared::proto::Query& query) const {
        return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
            [&](const Record& r) { return r.releases == 0 && r.query == query; }));
    }

    std::size_t subscribe_count() const { return records_.size(); }
    std::size_t release_count() const { return releaseCount_; }
    std::size_t rejected_count() const { return rejected_; }
    std::size_t pending_count() const { return incoming_.size(); }

    /** @brief Forget recorded calls (live state included). */
    void clear_records() {
        records_.clear();
        releaseCount_ = 0;
        rejected_ = 0;
    }

private:
    struct Canceller final : client::net::ISubscriptionCanceller {
        explicit Canceller(MockSubscriptionService& owner) : owner(owner) {}

        void cancel(shared::proto::SubscriptionId id) override {
            ++owner.releaseCount_;
            for (auto& r : owner.records_) {
                if (r.id == id) ++r.releases;
            }
        }

        MockSubscriptionService& owner;
    };

    std::shared_ptr<Canceller> canceller_;

    shared::proto::Identity identity_{};
    shared::proto::SubscriptionId nextId_{1};

    std::vector<Record> records_;
    std::queue<shared::proto::ServiceMessage> incoming_;

    std::size_t releaseCount_{0};
    std::size_t rejected_{0};
    std::size_t rejectNext_{0};
    bool rejectAll_{false};
};

} // namespace test_helpers
