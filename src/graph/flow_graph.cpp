#include "graph/flow_graph.hpp"
#include <fstream>
#include <stdexcept>

namespace af {

bool FlowGraph::add_node(const GraphNode& node) {
    auto it = nodes_.find(node.id);
    if (it != nodes_.end()) {
        it->second = node;
        return false;
    }
    nodes_.emplace(node.id, node);
    node_order_.push_back(node.id);
    return true;
}

bool FlowGraph::add_edge(const GraphEdge& edge) {
    if (!has_node(edge.source) || !has_node(edge.target)) {
        rejected_edges_++;
        return false;
    }
    if (has_edge(edge.id)) {
        return false;
    }
    edges_.emplace(edge.id, edge);
    edge_order_.push_back(edge.id);
    return true;
}

bool FlowGraph::has_node(const std::string& node_id) const {
    return nodes_.count(node_id) > 0;
}

bool FlowGraph::has_edge(const std::string& edge_id) const {
    return edges_.count(edge_id) > 0;
}

const GraphNode* FlowGraph::get_node(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const GraphEdge* FlowGraph::get_edge(const std::string& edge_id) const {
    auto it = edges_.find(edge_id);
    return it == edges_.end() ? nullptr : &it->second;
}

std::vector<GraphNode> FlowGraph::get_all_nodes() const {
    std::vector<GraphNode> result;
    result.reserve(node_order_.size());
    for (const auto& id : node_order_) {
        result.push_back(nodes_.at(id));
    }
    return result;
}

std::vector<GraphEdge> FlowGraph::get_all_edges() const {
    std::vector<GraphEdge> result;
    result.reserve(edge_order_.size());
    for (const auto& id : edge_order_) {
        result.push_back(edges_.at(id));
    }
    return result;
}

std::vector<GraphEdge> FlowGraph::get_outgoing_edges(const std::string& node_id) const {
    std::vector<GraphEdge> result;
    for (const auto& id : edge_order_) {
        const GraphEdge& edge = edges_.at(id);
        if (edge.source == node_id) {
            result.push_back(edge);
        }
    }
    return result;
}

void FlowGraph::clear() {
    nodes_.clear();
    edges_.clear();
    node_order_.clear();
    edge_order_.clear();
    rejected_edges_ = 0;
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json FlowGraph::to_json() const {
    nlohmann::json j;
    j["nodes"] = nlohmann::json::array();
    j["edges"] = nlohmann::json::array();

    for (const auto& id : node_order_) {
        j["nodes"].push_back(nodes_.at(id).to_json());
    }
    for (const auto& id : edge_order_) {
        j["edges"].push_back(edges_.at(id).to_json());
    }
    return j;
}

FlowGraph FlowGraph::from_json(const nlohmann::json& j) {
    FlowGraph graph;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            graph.add_node(GraphNode::from_json(node_json));
        }
    }
    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            graph.add_edge(GraphEdge::from_json(edge_json));
        }
    }
    return graph;
}

void FlowGraph::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

FlowCallbacks FlowGraph::callbacks() {
    FlowCallbacks cb;
    cb.on_node = [this](const GraphNode& node) { add_node(node); };
    cb.on_edge = [this](const GraphEdge& edge) { add_edge(edge); };
    return cb;
}

} // namespace af
