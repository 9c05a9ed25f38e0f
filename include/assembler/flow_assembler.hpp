#pragma once

#include "graph/graph_types.hpp"
#include "graph/stream_state_manager.hpp"
#include "stream/stream_parser.hpp"
#include <string>
#include <functional>
#include <random>
#include <nlohmann/json.hpp>

namespace af {

// ============================================================================
// Callbacks
// ============================================================================

/**
 * @brief Consumer of assembled graph elements
 *
 * on_node and on_edge are required; the rest are optional.
 */
struct FlowCallbacks {
    std::function<void(const GraphNode&)> on_node;
    std::function<void(const GraphEdge&)> on_edge;
    std::function<void(const RecordError&)> on_error;
    std::function<void(const nlohmann::json&)> on_ioc_analysis;
    std::function<void(const std::string& stage, const std::string& message)> on_progress;
};

/**
 * @brief Produces the display id for a newly seen node
 */
using DisplayIdGenerator = std::function<std::string(const GraphNode&)>;

/**
 * @brief Options controlling node and edge validation
 */
struct AssemblyOptions {
    bool require_node_type = false;    ///< Reject nodes without a string "type"
    bool require_node_data = false;    ///< Nodes without an object "data" are rejected
    bool verbose = false;              ///< Trace rejected descriptors to stderr
};

/**
 * @brief Counters for one process_record() call
 */
struct AssemblyResult {
    size_t nodes_emitted = 0;
    size_t edges_emitted = 0;
    size_t edges_deferred = 0;
    size_t nodes_rejected = 0;
    size_t edges_rejected = 0;
    size_t duplicates_suppressed = 0;

    AssemblyResult& operator+=(const AssemblyResult& other);
};

// ============================================================================
// Flow Assembler
// ============================================================================

/**
 * @brief Turns parsed records into ordered node and edge emissions
 *
 * Nodes are emitted the first time their original id is seen, under a
 * freshly generated display id. Edges are rewritten into display-id space
 * and emitted only once both endpoints have been emitted; until then they
 * wait in the state manager's pending queue. An edge never reaches the
 * caller before the nodes it references.
 */
class FlowAssembler {
public:
    /**
     * @brief Constructor
     *
     * @param state State manager for this session (not owned)
     * @param options Validation options
     * @param generator Display id generator (default: type-sequence-random)
     */
    explicit FlowAssembler(
        StreamStateManager& state,
        const AssemblyOptions& options = AssemblyOptions(),
        DisplayIdGenerator generator = nullptr
    );

    /**
     * @brief Route every node, edge, error and analysis block of a record
     */
    AssemblyResult process_record(const ParsedRecord& record, const FlowCallbacks& callbacks);

    /**
     * @brief Emit pending edges whose endpoints have become available
     * @return Number of edges emitted
     */
    size_t drain_pending(const FlowCallbacks& callbacks);

    /**
     * @brief Restart the display id sequence for a new session
     */
    void reset();

    /**
     * @brief Identifier used for an edge once both endpoints are resolved
     */
    static std::string display_edge_id(const std::string& source_display, const std::string& target_display);

    bool is_valid_node(const nlohmann::json& node) const;
    static bool is_valid_edge(const nlohmann::json& edge);

private:
    StreamStateManager& state_;
    AssemblyOptions options_;
    DisplayIdGenerator generator_;
    size_t sequence_ = 0;
    std::mt19937 rng_;

    std::string default_display_id(const GraphNode& node);

    /**
     * @brief Rewrite an edge into display space and emit it unless seen before
     * @return true if the callback was invoked
     */
    bool emit_resolved_edge(
        const GraphEdge& edge,
        const std::string& source_display,
        const std::string& target_display,
        const FlowCallbacks& callbacks
    );

    void process_node(const nlohmann::json& raw, const FlowCallbacks& callbacks, AssemblyResult& result);
    void process_edge(const nlohmann::json& raw, const FlowCallbacks& callbacks, AssemblyResult& result);
};

} // namespace af
