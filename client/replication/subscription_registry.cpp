#include "subscription_registry.hpp"

#include <raylib.h>

namespace client::replication {

namespace proto = shared::proto;

SubscriptionRegistry::SubscriptionRegistry(net::ISubscriptionService& service)
    : service_(service) {}

SubscriptionRegistry::~SubscriptionRegistry() {
    remove_all();
}

bool SubscriptionRegistry::subscribe_(const proto::Query& query, Entry& out) {
    std::string err;
    auto handle = service_.subscribe(query, err);
    if (!handle) {
        ++stats_.failures;
        retryRequested_ = true;
        TraceLog(LOG_WARNING, "[sub] subscribe rejected: %s (%s)", query.to_sql().c_str(), err.c_str());
        return false;
    }

    byId_[handle->id()] = query;
    out.handle = std::move(*handle);
    out.applied = false;
    ++stats_.adds;
    TraceLog(LOG_DEBUG, "[sub] + id=%u %s", out.handle.id(), query.to_sql().c_str());
    return true;
}

void SubscriptionRegistry::forget_(proto::SubscriptionId id) {
    byId_.erase(id);
}

bool SubscriptionRegistry::add(EntityType type, ChunkId chunk) {
    const SpatialKey key{type, chunk};
    if (spatial_.find(key) != spatial_.end()) {
        return false;
    }

    proto::Query query;
    query.type = type;
    query.chunk = chunk;

    Entry entry;
    if (!subscribe_(query, entry)) {
        return false;
    }

    spatial_.emplace(key, std::move(entry));
    return true;
}

bool SubscriptionRegistry::remove(EntityType type, ChunkId chunk) {
    auto it = spatial_.find(SpatialKey{type, chunk});
    if (it == spatial_.end()) {
        return false;
    }

    const proto::SubscriptionId id = it->second.handle.id();
    TraceLog(LOG_DEBUG, "[sub] - id=%u %s chunk=%u", id, proto::entity_type_name(type), chunk);

    it->second.handle.release();
    forget_(id);
    spatial_.erase(it);
    ++stats_.removes;
    return true;
}

bool SubscriptionRegistry::add_global(EntityType type) {
    if (global_.find(type) != global_.end()) {
        return false;
    }

    proto::Query query;
    query.type = type;

    Entry entry;
    if (!subscribe_(query, entry)) {
        return false;
    }

    global_.emplace(type, std::move(entry));
    return true;
}

bool SubscriptionRegistry::remove_global(EntityType type) {
    auto it = global_.find(type);
    if (it == global_.end()) {
        return false;
    }

    const proto::SubscriptionId id = it->second.handle.id();
    TraceLog(LOG_DEBUG, "[sub] - id=%u %s", id, proto::entity_type_name(type));

    it->second.handle.release();
    forget_(id);
    global_.erase(it);
    ++stats_.removes;
    return true;
}

void SubscriptionRegistry::remove_all() {
    if (spatial_.empty() && global_.empty()) {
        return;
    }

    TraceLog(LOG_INFO, "[sub] releasing all: spatial=%zu global=%zu", spatial_.size(), global_.size());

    for (auto& [key, entry] : spatial_) {
        (void)key;
        entry.handle.release();
        ++stats_.removes;
    }
    for (auto& [type, entry] : global_) {
        (void)type;
        entry.handle.release();
        ++stats_.removes;
    }

    spatial_.clear();
    global_.clear();
    byId_.clear();
}

void SubscriptionRegistry::on_applied(proto::SubscriptionId id) {
    auto q = byId_.find(id);
    if (q == byId_.end()) {
        return;
    }

    const proto::Query& query = q->second;
    if (query.chunk) {
        auto it = spatial_.find(SpatialKey{query.type, *query.chunk});
        if (it != spatial_.end()) it->second.applied = true;
    } else {
        auto it = global_.find(query.type);
        if (it != global_.end()) it->second.applied = true;
        TraceLog(LOG_INFO, "[sub] global %s applied", proto::entity_type_name(query.type));
    }
}

bool SubscriptionRegistry::on_failed(proto::SubscriptionId id, const std::string& reason) {
    auto q = byId_.find(id);
    if (q == byId_.end()) {
        // Already released (viewport moved on) or not ours.
        return false;
    }

    const proto::Query query = q->second;
    byId_.erase(q);

    ++stats_.failures;
    retryRequested_ = true;
    TraceLog(LOG_WARNING, "[sub] subscription failed: %s (%s)", query.to_sql().c_str(), reason.c_str());

    if (query.chunk) {
        auto it = spatial_.find(SpatialKey{query.type, *query.chunk});
        if (it != spatial_.end() && it->second.handle.id() == id) {
            it->second.handle.release();
            spatial_.erase(it);
        }
    } else {
        auto it = global_.find(query.type);
        if (it != global_.end() && it->second.handle.id() == id) {
            it->second.handle.release();
            global_.erase(it);
        }
    }
    return true;
}

bool SubscriptionRegistry::contains(EntityType type, ChunkId chunk) const {
    return spatial_.find(SpatialKey{type, chunk}) != spatial_.end();
}

bool SubscriptionRegistry::contains_global(EntityType type) const {
    return global_.find(type) != global_.end();
}

bool SubscriptionRegistry::is_applied(EntityType type, ChunkId chunk) const {
    auto it = spatial_.find(SpatialKey{type, chunk});
    return it != spatial_.end() && it->second.applied;
}

std::set<ChunkId> SubscriptionRegistry::tracked_chunks() const {
    std::set<ChunkId> out;
    for (const auto& [key, entry] : spatial_) {
        (void)entry;
        out.insert(key.second);
    }
    return out;
}

std::set<ChunkId> SubscriptionRegistry::tracked_chunks(EntityType type) const {
    std::set<ChunkId> out;
    for (const auto& [key, entry] : spatial_) {
        (void)entry;
        if (key.first == type) out.insert(key.second);
    }
    return out;
}

bool SubscriptionRegistry::take_retry_request() {
    const bool r = retryRequested_;
    retryRequested_ = false;
    return r;
}

} // namespace client::replication
