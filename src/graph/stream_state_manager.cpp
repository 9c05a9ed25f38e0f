#include "graph/stream_state_manager.hpp"
#include <algorithm>
#include <iostream>

namespace af {

StreamStateManager::StreamStateManager(const StateLimits& limits, Clock clock)
    : limits_(limits), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

// ==========================================
// Node identity
// ==========================================

void StreamStateManager::register_node(const std::string& original_id, const std::string& display_id) {
    register_node(original_id, display_id, NodeState::Emitted);
}

void StreamStateManager::register_node(
    const std::string& original_id,
    const std::string& display_id,
    NodeState state
) {
    // A display id is being assigned, so Known is not a valid target here
    if (state == NodeState::Known) {
        state = NodeState::Mapped;
    }

    identities_.insert_or_assign(original_id, NodeEntry{display_id, state});
    if (state == NodeState::Emitted) {
        emitted_display_ids_.insert(display_id);
    }

    if (identities_.size() > limits_.max_cache_size ||
        emitted_display_ids_.size() > limits_.max_cache_size) {
        cleanup_old_entries();
    }
}

void StreamStateManager::mark_node_known(const std::string& original_id) {
    if (identities_.contains(original_id)) {
        return;
    }
    identities_.insert_or_assign(original_id, NodeEntry{});
    if (identities_.size() > limits_.max_cache_size) {
        cleanup_old_entries();
    }
}

bool StreamStateManager::mark_node_emitted(const std::string& display_id) {
    bool found = false;
    for (const auto& [original_id, entry] : identities_) {
        if (entry.state == NodeState::Mapped && entry.display_id == display_id) {
            identities_.find(original_id)->state = NodeState::Emitted;
            found = true;
        } else if (entry.state == NodeState::Emitted && entry.display_id == display_id) {
            found = true;
        }
    }

    if (found) {
        emitted_display_ids_.insert(display_id);
        if (emitted_display_ids_.size() > limits_.max_cache_size) {
            cleanup_old_entries();
        }
    }
    return found;
}

bool StreamStateManager::has_processed_node(const std::string& original_id) const {
    const NodeEntry* entry = identities_.find(original_id);
    return entry != nullptr && entry->state != NodeState::Known;
}

bool StreamStateManager::has_emitted_node(const std::string& display_id) const {
    return emitted_display_ids_.contains(display_id);
}

std::optional<std::string> StreamStateManager::get_display_id(const std::string& original_id) const {
    const NodeEntry* entry = identities_.find(original_id);
    if (entry == nullptr || entry->state == NodeState::Known) {
        return std::nullopt;
    }
    return entry->display_id;
}

std::optional<NodeState> StreamStateManager::node_state(const std::string& original_id) const {
    const NodeEntry* entry = identities_.find(original_id);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->state;
}

// ==========================================
// Pending edges
// ==========================================

bool StreamStateManager::add_pending_edge(
    const GraphEdge& edge,
    const std::string& source_original_id,
    const std::string& target_original_id
) {
    if (pending_edge_ids_.count(edge.id) > 0) {
        return false;
    }

    prune_expired_pending_edges();

    if (pending_edges_.size() >= limits_.max_pending_edges) {
        std::cerr << "[StreamStateManager] Pending edges limit reached ("
                  << limits_.max_pending_edges << "). Oldest edges will be dropped." << std::endl;

        size_t remove_count = static_cast<size_t>(
            static_cast<double>(limits_.max_pending_edges) * (1.0 - limits_.retention_fraction)
        );
        remove_count = std::max<size_t>(remove_count, 1);
        size_t keep = pending_edges_.size() > remove_count ? pending_edges_.size() - remove_count : 0;
        size_t room = limits_.max_pending_edges > 0 ? limits_.max_pending_edges - 1 : 0;
        evicted_pending_edges_ += trim_pending_edges(std::min(keep, room));
    }

    pending_edges_.push_back(PendingEdge{edge, source_original_id, target_original_id, clock_()});
    pending_edge_ids_.insert(edge.id);
    return true;
}

std::vector<PendingEdge> StreamStateManager::get_pending_edges() const {
    return std::vector<PendingEdge>(pending_edges_.begin(), pending_edges_.end());
}

std::vector<PendingEdge> StreamStateManager::get_pending_edges_for_node(const std::string& original_id) const {
    std::vector<PendingEdge> result;
    for (const auto& pending : pending_edges_) {
        if (pending.source_id == original_id || pending.target_id == original_id) {
            result.push_back(pending);
        }
    }
    return result;
}

bool StreamStateManager::remove_pending_edge(const std::string& edge_id) {
    if (pending_edge_ids_.erase(edge_id) == 0) {
        return false;
    }
    pending_edges_.erase(
        std::remove_if(pending_edges_.begin(), pending_edges_.end(),
                       [&](const PendingEdge& pe) { return pe.edge.id == edge_id; }),
        pending_edges_.end()
    );
    return true;
}

void StreamStateManager::clear_pending_edges() {
    pending_edges_.clear();
    pending_edge_ids_.clear();
}

size_t StreamStateManager::process_pending_edges(const EdgeCallback& emit) {
    prune_expired_pending_edges();

    // Ready edges leave the queue before the callback runs, so the callback
    // may modify the queue
    std::vector<GraphEdge> ready;
    std::deque<PendingEdge> waiting;

    for (auto& pending : pending_edges_) {
        auto source_display = get_display_id(pending.source_id);
        auto target_display = get_display_id(pending.target_id);

        if (source_display && target_display &&
            has_emitted_node(*source_display) &&
            has_emitted_node(*target_display)) {
            pending_edge_ids_.erase(pending.edge.id);
            ready.push_back(std::move(pending.edge));
        } else {
            waiting.push_back(std::move(pending));
        }
    }
    pending_edges_.swap(waiting);

    if (emit) {
        for (const auto& edge : ready) {
            emit(edge);
        }
    }
    return ready.size();
}

// ==========================================
// Edge deduplication
// ==========================================

void StreamStateManager::mark_edge_processed(const std::string& edge_id) {
    processed_edge_ids_.insert(edge_id);

    if (processed_edge_ids_.size() > limits_.max_cache_size) {
        evicted_edge_ids_ += processed_edge_ids_.trim_to(limits_.retained_cache_entries());
    }
}

bool StreamStateManager::has_processed_edge(const std::string& edge_id) const {
    return processed_edge_ids_.contains(edge_id);
}

// ==========================================
// Session lifecycle
// ==========================================

void StreamStateManager::reset() {
    identities_.clear();
    emitted_display_ids_.clear();
    processed_edge_ids_.clear();
    clear_pending_edges();

    evicted_nodes_ = 0;
    evicted_pending_edges_ = 0;
    expired_pending_edges_ = 0;
    evicted_edge_ids_ = 0;
}

StateStats StreamStateManager::get_stats() const {
    StateStats stats;
    stats.node_count = identities_.size();
    for (const auto& entry : identities_) {
        if (entry.second.state != NodeState::Known) {
            ++stats.processed_node_count;
        }
    }
    stats.emitted_node_count = emitted_display_ids_.size();
    stats.pending_edge_count = pending_edges_.size();
    stats.processed_edge_count = processed_edge_ids_.size();

    stats.evicted_node_count = evicted_nodes_;
    stats.evicted_pending_edge_count = evicted_pending_edges_;
    stats.expired_pending_edge_count = expired_pending_edges_;
    stats.evicted_edge_id_count = evicted_edge_ids_;
    return stats;
}

// ==========================================
// Cleanup
// ==========================================

void StreamStateManager::cleanup_old_entries() {
    const size_t threshold = limits_.retained_cache_entries();

    evicted_nodes_ += identities_.trim_to(threshold);
    emitted_display_ids_.trim_to(threshold);
    size_t expired = prune_expired_pending_edges();

    if (limits_.verbose) {
        std::cerr << "[StreamStateManager] Cleaned up old entries: kept "
                  << identities_.size() << " node identities, dropped "
                  << expired << " expired pending edges" << std::endl;
    }
}

size_t StreamStateManager::prune_expired_pending_edges() {
    if (pending_edges_.empty()) {
        return 0;
    }

    // Queue order is creation order, so expired edges form a prefix
    const auto cutoff = clock_() - limits_.pending_edge_max_age;
    size_t removed = 0;

    while (!pending_edges_.empty() && pending_edges_.front().created_at <= cutoff) {
        pending_edge_ids_.erase(pending_edges_.front().edge.id);
        pending_edges_.pop_front();
        ++removed;
    }

    expired_pending_edges_ += removed;
    return removed;
}

size_t StreamStateManager::trim_pending_edges(size_t max_size) {
    size_t removed = 0;
    while (pending_edges_.size() > max_size) {
        pending_edge_ids_.erase(pending_edges_.front().edge.id);
        pending_edges_.pop_front();
        ++removed;
    }
    return removed;
}

} // namespace af
