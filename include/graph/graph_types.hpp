#ifndef AF_GRAPH_TYPES_HPP
#define AF_GRAPH_TYPES_HPP

#include <string>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace af {

/**
 * @brief A node of the attack-flow graph as decoded from the model output
 *
 * The payload is opaque to the assembler beyond its identifier and type.
 * `id` and `type` are extracted copies; the payload keeps every other field
 * (technique ids, tactics, labels) exactly as the model produced them.
 */
struct GraphNode {
    std::string id;                                    // Original or display identifier
    std::string type;                                  // Node kind ("action", "tool", "asset", ...)
    nlohmann::json payload = nlohmann::json::object(); // Full descriptor

    /**
     * @brief Convert node to JSON, with the current id written back
     */
    nlohmann::json to_json() const;

    /**
     * @brief Create node from a raw descriptor
     *
     * Missing or non-string `id`/`type` fields leave the members empty.
     */
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief A directed edge between two graph nodes
 */
struct GraphEdge {
    std::string id;                                    // Edge identifier
    std::string source;                                // Source node id
    std::string target;                                // Target node id
    nlohmann::json payload = nlohmann::json::object(); // Full descriptor

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Lifecycle of a node identity within one session
 *
 * Absence from the identity map is the implicit Unknown state.
 */
enum class NodeState {
    Known,    // Mentioned by the model, not yet mapped to a display id
    Mapped,   // Display id assigned, not yet surfaced to the caller
    Emitted   // Handed to the caller
};

const char* to_string(NodeState state);

/**
 * @brief An edge waiting for its source and/or target node
 */
struct PendingEdge {
    GraphEdge edge;
    std::string source_id;                             // Original source id
    std::string target_id;                             // Original target id
    std::chrono::steady_clock::time_point created_at;
};

/**
 * @brief Read-only counters describing the state manager
 */
struct StateStats {
    size_t node_count = 0;
    size_t processed_node_count = 0;
    size_t emitted_node_count = 0;
    size_t pending_edge_count = 0;
    size_t processed_edge_count = 0;

    // Eviction counters since the last reset
    size_t evicted_node_count = 0;
    size_t evicted_pending_edge_count = 0;
    size_t expired_pending_edge_count = 0;
    size_t evicted_edge_id_count = 0;

    nlohmann::json to_json() const;
};

} // namespace af

#endif // AF_GRAPH_TYPES_HPP
