#pragma once

#include "graph/graph_types.hpp"
#include "assembler/flow_assembler.hpp"
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace af {

/**
 * @brief Caller-side collector for streamed graph elements
 *
 * Keeps nodes and edges in arrival order, keyed by display id. An edge is
 * only accepted when both of its endpoints are already present, which makes
 * the collector a direct check of the assembler's ordering guarantee.
 */
class FlowGraph {
public:
    FlowGraph() = default;

    /**
     * @brief Add or replace a node
     * @return true if the node id was new
     */
    bool add_node(const GraphNode& node);

    /**
     * @brief Add an edge between two known nodes
     * @return false if an endpoint is missing or the edge id already exists
     */
    bool add_edge(const GraphEdge& edge);

    bool has_node(const std::string& node_id) const;
    bool has_edge(const std::string& edge_id) const;

    const GraphNode* get_node(const std::string& node_id) const;
    const GraphEdge* get_edge(const std::string& edge_id) const;

    std::vector<GraphNode> get_all_nodes() const;
    std::vector<GraphEdge> get_all_edges() const;

    /**
     * @brief Edges leaving a node
     */
    std::vector<GraphEdge> get_outgoing_edges(const std::string& node_id) const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }

    /**
     * @brief Edges refused because an endpoint was unknown
     */
    size_t num_rejected_edges() const { return rejected_edges_; }

    void clear();

    // ==========================================
    // Serialization
    // ==========================================

    /**
     * @brief {"nodes":[...],"edges":[...]} in arrival order
     */
    nlohmann::json to_json() const;

    static FlowGraph from_json(const nlohmann::json& j);

    void save_to_json(const std::string& path) const;

    /**
     * @brief Callbacks that feed this graph; other handlers stay empty
     */
    FlowCallbacks callbacks();

private:
    std::map<std::string, GraphNode> nodes_;
    std::map<std::string, GraphEdge> edges_;
    std::vector<std::string> node_order_;
    std::vector<std::string> edge_order_;
    size_t rejected_edges_ = 0;
};

} // namespace af
