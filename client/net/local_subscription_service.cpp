#include "local_subscription_service.hpp"

#include <raylib.h>

#include <deque>
#include <map>
#include <tuple>
#include <unordered_map>

namespace client::net {

namespace proto = shared::proto;

namespace {

template <typename Row>
using Table = std::unordered_map<typename proto::RowTraits<Row>::Key, Row,
                                 proto::RowKeyHash<typename proto::RowTraits<Row>::Key>>;

using Tables = std::tuple<Table<proto::Player>,
                          Table<proto::Tree>,
                          Table<proto::Stone>,
                          Table<proto::Mushroom>,
                          Table<proto::Campfire>,
                          Table<proto::WoodenStorageBox>,
                          Table<proto::DroppedItem>,
                          Table<proto::ItemDefinition>,
                          Table<proto::InventoryItem>,
                          Table<proto::Recipe>,
                          Table<proto::ActiveEquipment>,
                          Table<proto::CraftingQueueItem>,
                          Table<proto::WorldState>>;

} // namespace

struct LocalSubscriptionService::State final : ISubscriptionCanceller {
    std::deque<proto::ServiceMessage> inbox;

    bool connected{false};
    proto::ConnectionId connectionId{0};
    proto::Identity identity;

    proto::SubscriptionId nextId{1};
    std::map<proto::SubscriptionId, proto::Query> live;

    std::optional<std::string> rejectNext;
    std::optional<std::string> failNext;

    std::size_t subscribeCalls{0};
    std::size_t cancelCalls{0};

    Tables tables;

    template <typename Row>
    Table<Row>& table() { return std::get<Table<Row>>(tables); }

    template <typename Row>
    const Table<Row>& table() const { return std::get<Table<Row>>(tables); }

    // Calls fn(row) for every row of `type`.
    template <typename Fn>
    void for_each_row(proto::EntityType type, Fn&& fn) const {
        std::apply([&](const auto&... t) { (visit_table(t, type, fn), ...); }, tables);
    }

    template <typename Row, typename Fn>
    static void visit_table(const Table<Row>& t, proto::EntityType type, Fn& fn) {
        if (proto::RowTraits<Row>::kType != type) return;
        for (const auto& [key, row] : t) {
            (void)key;
            fn(proto::AnyRow{row});
        }
    }

    bool covered(const proto::AnyRow& row) const {
        if (!connected) return false;
        for (const auto& [id, query] : live) {
            (void)id;
            if (query.matches(row)) return true;
        }
        return false;
    }

    void cancel(proto::SubscriptionId id) override {
        ++cancelCalls;
        if (!connected) return;

        auto it = live.find(id);
        if (it == live.end()) return;

        const proto::Query query = it->second;
        live.erase(it);

        TraceLog(LOG_DEBUG, "[local] cancel id=%u query=%s", id, query.to_sql().c_str());

        for_each_row(query.type, [&](const proto::AnyRow& row) {
            if (query.matches(row) && !covered(row)) {
                inbox.push_back(proto::make_row_message(proto::RowOp::Delete, row));
            }
        });
    }
};

LocalSubscriptionService::LocalSubscriptionService()
    : state_(std::make_shared<State>()) {}

LocalSubscriptionService::~LocalSubscriptionService() = default;

void LocalSubscriptionService::connect(const proto::Identity& identity) {
    state_->live.clear();
    state_->connected = true;
    state_->identity = identity;
    ++state_->connectionId;

    proto::Connected ev;
    ev.connectionId = state_->connectionId;
    ev.identity = identity;
    state_->inbox.push_back(ev);
}

void LocalSubscriptionService::disconnect(const std::string& reason) {
    if (!state_->connected) return;

    state_->connected = false;
    state_->live.clear();
    state_->identity = {};

    proto::Disconnected ev;
    ev.reason = reason;
    state_->inbox.push_back(std::move(ev));
}

void LocalSubscriptionService::fail_connect(const std::string& reason) {
    state_->connected = false;
    state_->live.clear();
    state_->identity = {};

    proto::ConnectError ev;
    ev.reason = reason;
    state_->inbox.push_back(std::move(ev));
}

bool LocalSubscriptionService::is_connected() const {
    return state_->connected;
}

void LocalSubscriptionService::upsert(const proto::AnyRow& row) {
    std::visit([&](const auto& r) {
        using Row = std::decay_t<decltype(r)>;
        auto& t = state_->table<Row>();
        const auto key = proto::RowTraits<Row>::key(r);

        const proto::AnyRow next{r};
        const bool nextCovered = state_->covered(next);

        auto it = t.find(key);
        if (it == t.end()) {
            t.emplace(key, r);
            if (nextCovered) {
                state_->inbox.push_back(proto::make_insert(r));
            }
            return;
        }

        const Row prev = it->second;
        const bool prevCovered = state_->covered(proto::AnyRow{prev});
        it->second = r;

        if (prevCovered && nextCovered) {
            state_->inbox.push_back(proto::make_update(prev, r));
        } else if (nextCovered) {
            state_->inbox.push_back(proto::make_insert(r));
        } else if (prevCovered) {
            state_->inbox.push_back(proto::make_delete(prev));
        }
    }, row);
}

void LocalSubscriptionService::remove(const proto::AnyRow& row) {
    std::visit([&](const auto& r) {
        using Row = std::decay_t<decltype(r)>;
        auto& t = state_->table<Row>();

        auto it = t.find(proto::RowTraits<Row>::key(r));
        if (it == t.end()) return;

        const Row prev = it->second;
        t.erase(it);

        // Coverage is evaluated against the stored row, not the caller's copy.
        if (state_->covered(proto::AnyRow{prev})) {
            state_->inbox.push_back(proto::make_delete(prev));
        }
    }, row);
}

std::size_t LocalSubscriptionService::row_count(proto::EntityType type) const {
    std::size_t n = 0;
    state_->for_each_row(type, [&](const proto::AnyRow&) { ++n; });
    return n;
}

void LocalSubscriptionService::reject_next_subscribe(const std::string& reason) {
    state_->rejectNext = reason;
}

void LocalSubscriptionService::fail_next_subscribe(const std::string& reason) {
    state_->failNext = reason;
}

std::size_t LocalSubscriptionService::live_subscription_count() const {
    return state_->live.size();
}

std::size_t LocalSubscriptionService::subscribe_calls() const {
    return state_->subscribeCalls;
}

std::size_t LocalSubscriptionService::cancel_calls() const {
    return state_->cancelCalls;
}

std::size_t LocalSubscriptionService::pending_messages() const {
    return state_->inbox.size();
}

proto::Identity LocalSubscriptionService::local_identity() const {
    return state_->connected ? state_->identity : proto::Identity{};
}

std::optional<SubscriptionHandle> LocalSubscriptionService::subscribe(const proto::Query& query, std::string& err) {
    ++state_->subscribeCalls;

    if (!state_->connected) {
        err = "not connected";
        return std::nullopt;
    }

    if (state_->rejectNext) {
        err = *state_->rejectNext;
        state_->rejectNext.reset();
        return std::nullopt;
    }

    const proto::SubscriptionId id = state_->nextId++;
    std::weak_ptr<ISubscriptionCanceller> owner = state_;

    if (state_->failNext) {
        proto::SubscriptionFailed ev;
        ev.id = id;
        ev.reason = *state_->failNext;
        state_->failNext.reset();
        state_->inbox.push_back(std::move(ev));
        return SubscriptionHandle(id, std::move(owner));
    }

    state_->for_each_row(query.type, [&](const proto::AnyRow& row) {
        if (query.matches(row) && !state_->covered(row)) {
            state_->inbox.push_back(proto::make_row_message(proto::RowOp::Insert, row));
        }
    });

    state_->live.emplace(id, query);
    TraceLog(LOG_DEBUG, "[local] subscribe id=%u query=%s", id, query.to_sql().c_str());

    proto::SubscriptionApplied applied;
    applied.id = id;
    state_->inbox.push_back(applied);

    return SubscriptionHandle(id, std::move(owner));
}

bool LocalSubscriptionService::try_recv(proto::ServiceMessage& outMsg) {
    if (state_->inbox.empty()) {
        return false;
    }

    outMsg = std::move(state_->inbox.front());
    state_->inbox.pop_front();
    return true;
}

} // namespace client::net
