#include "graph/graph_types.hpp"

namespace af {

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.is_object()) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // anonymous namespace

// ==========================================
// GraphNode Implementation
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j = payload.is_object() ? payload : nlohmann::json::object();
    j["id"] = id;
    if (!type.empty()) {
        j["type"] = type;
    }
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = string_field(j, "id");
    node.type = string_field(j, "type");
    if (j.is_object()) {
        node.payload = j;
    }
    return node;
}

// ==========================================
// GraphEdge Implementation
// ==========================================

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j = payload.is_object() ? payload : nlohmann::json::object();
    j["id"] = id;
    j["source"] = source;
    j["target"] = target;
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.id = string_field(j, "id");
    edge.source = string_field(j, "source");
    edge.target = string_field(j, "target");
    if (j.is_object()) {
        edge.payload = j;
    }
    return edge;
}

const char* to_string(NodeState state) {
    switch (state) {
        case NodeState::Known: return "known";
        case NodeState::Mapped: return "mapped";
        case NodeState::Emitted: return "emitted";
        default: return "unknown";
    }
}

// ==========================================
// StateStats Implementation
// ==========================================

nlohmann::json StateStats::to_json() const {
    nlohmann::json j;
    j["node_count"] = node_count;
    j["processed_node_count"] = processed_node_count;
    j["emitted_node_count"] = emitted_node_count;
    j["pending_edge_count"] = pending_edge_count;
    j["processed_edge_count"] = processed_edge_count;
    j["evicted_node_count"] = evicted_node_count;
    j["evicted_pending_edge_count"] = evicted_pending_edge_count;
    j["expired_pending_edge_count"] = expired_pending_edge_count;
    j["evicted_edge_id_count"] = evicted_edge_id_count;
    return j;
}

} // namespace af
