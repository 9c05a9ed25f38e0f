#pragma once

#include "graph/graph_types.hpp"
#include "graph/insertion_ordered.hpp"
#include <algorithm>
#include <string>
#include <vector>
#include <deque>
#include <unordered_set>
#include <optional>
#include <functional>
#include <chrono>

namespace af {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Capacity limits for the per-session graph state
 */
struct StateLimits {
    size_t max_cache_size = 500;                        ///< Node identities and processed edge ids
    size_t max_pending_edges = 1000;                    ///< Edges waiting for endpoints
    std::chrono::seconds pending_edge_max_age{300};     ///< Age bound for pending edges
    double retention_fraction = 0.75;                   ///< Share kept when trimming
    bool verbose = false;                               ///< Log cleanup passes

    /**
     * @brief Number of entries kept when a cache is trimmed
     *
     * Never less than one, so the entry that triggered the trim survives it.
     */
    size_t retained_cache_entries() const {
        return std::max<size_t>(
            1, static_cast<size_t>(static_cast<double>(max_cache_size) * retention_fraction));
    }
};

// ============================================================================
// Stream State Manager
// ============================================================================

/**
 * @brief Tracks node identities, pending edges and emitted ids for one stream
 *
 * Resolves the model's original node ids to display ids, holds edges whose
 * endpoints have not been emitted yet, and suppresses duplicate emissions.
 * Every collection is bounded: once a cache grows past its capacity the
 * oldest entries (by insertion order) are dropped, and pending edges are
 * also dropped once they exceed the configured age.
 *
 * Nothing in this class throws. Eviction is a silent degradation that is
 * at most reported on std::cerr.
 */
class StreamStateManager {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using EdgeCallback = std::function<void(const GraphEdge&)>;

    /**
     * @brief Constructor
     *
     * @param limits Capacity limits
     * @param clock Time source for pending-edge ages (default: steady_clock)
     */
    explicit StreamStateManager(const StateLimits& limits = StateLimits(), Clock clock = nullptr);

    // ==========================================
    // Node identity
    // ==========================================

    /**
     * @brief Map an original id to a display id and mark the node emitted
     *
     * Re-registering an existing original id overwrites its display id
     * (last write wins).
     */
    void register_node(const std::string& original_id, const std::string& display_id);

    /**
     * @brief Map an original id to a display id with an explicit state
     *
     * NodeState::Mapped records the mapping without surfacing the node;
     * mark_node_emitted() completes the transition later.
     */
    void register_node(const std::string& original_id, const std::string& display_id, NodeState state);

    /**
     * @brief Record that the model referenced an id that is not mapped yet
     *
     * Has no effect on ids that are already mapped or emitted.
     */
    void mark_node_known(const std::string& original_id);

    /**
     * @brief Promote a mapped node to emitted
     * @return false if no node carries this display id
     */
    bool mark_node_emitted(const std::string& display_id);

    bool has_processed_node(const std::string& original_id) const;
    bool has_emitted_node(const std::string& display_id) const;
    std::optional<std::string> get_display_id(const std::string& original_id) const;
    std::optional<NodeState> node_state(const std::string& original_id) const;

    // ==========================================
    // Pending edges
    // ==========================================

    /**
     * @brief Hold an edge until both of its endpoints have been emitted
     *
     * An edge whose id is already pending is ignored. When the queue is full
     * the oldest quarter is dropped before the new edge is appended.
     *
     * @return true if the edge was queued
     */
    bool add_pending_edge(
        const GraphEdge& edge,
        const std::string& source_original_id,
        const std::string& target_original_id
    );

    /**
     * @brief Snapshot of every pending edge, oldest first
     */
    std::vector<PendingEdge> get_pending_edges() const;

    /**
     * @brief Snapshot of pending edges touching one original node id
     */
    std::vector<PendingEdge> get_pending_edges_for_node(const std::string& original_id) const;

    bool remove_pending_edge(const std::string& edge_id);
    void clear_pending_edges();

    /**
     * @brief Emit every pending edge whose endpoints are both emitted
     *
     * Ready edges leave the queue before the first callback runs. The
     * callback may modify the queue or reset this manager; edges it removes
     * stay removed.
     *
     * @return Number of edges emitted
     */
    size_t process_pending_edges(const EdgeCallback& emit);

    // ==========================================
    // Edge deduplication
    // ==========================================

    void mark_edge_processed(const std::string& edge_id);
    bool has_processed_edge(const std::string& edge_id) const;

    // ==========================================
    // Session lifecycle
    // ==========================================

    /**
     * @brief Clear every collection and counter
     */
    void reset();

    StateStats get_stats() const;

    const StateLimits& limits() const { return limits_; }

private:
    struct NodeEntry {
        std::string display_id;
        NodeState state = NodeState::Known;
    };

    StateLimits limits_;
    Clock clock_;

    InsertionOrderedMap<std::string, NodeEntry> identities_;
    InsertionOrderedSet<std::string> emitted_display_ids_;
    InsertionOrderedSet<std::string> processed_edge_ids_;
    std::deque<PendingEdge> pending_edges_;
    std::unordered_set<std::string> pending_edge_ids_;

    size_t evicted_nodes_ = 0;
    size_t evicted_pending_edges_ = 0;
    size_t expired_pending_edges_ = 0;
    size_t evicted_edge_ids_ = 0;

    /**
     * @brief Trim the node caches and drop expired pending edges
     *
     * Runs whenever a node cache grows past max_cache_size.
     */
    void cleanup_old_entries();

    /**
     * @brief Remove pending edges older than pending_edge_max_age
     * @return Number of edges removed
     */
    size_t prune_expired_pending_edges();

    /**
     * @brief Drop the oldest pending edges until at most max_size remain
     */
    size_t trim_pending_edges(size_t max_size);
};

} // namespace af
