#include "assembler/flow_assembler.hpp"
#include <iostream>

using json = nlohmann::json;

namespace af {

namespace {

const char BASE36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

bool is_non_empty_string(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_string() && !it->get<std::string>().empty();
}

} // anonymous namespace

AssemblyResult& AssemblyResult::operator+=(const AssemblyResult& other) {
    nodes_emitted += other.nodes_emitted;
    edges_emitted += other.edges_emitted;
    edges_deferred += other.edges_deferred;
    nodes_rejected += other.nodes_rejected;
    edges_rejected += other.edges_rejected;
    duplicates_suppressed += other.duplicates_suppressed;
    return *this;
}

FlowAssembler::FlowAssembler(
    StreamStateManager& state,
    const AssemblyOptions& options,
    DisplayIdGenerator generator
)
    : state_(state),
      options_(options),
      generator_(std::move(generator)),
      rng_(std::random_device{}()) {}

// ============================================================================
// Record routing
// ============================================================================

AssemblyResult FlowAssembler::process_record(const ParsedRecord& record, const FlowCallbacks& callbacks) {
    AssemblyResult result;

    if (record.error && callbacks.on_error) {
        callbacks.on_error(*record.error);
    }

    for (const auto& raw : record.nodes) {
        process_node(raw, callbacks, result);
    }

    for (const auto& raw : record.edges) {
        process_edge(raw, callbacks, result);
    }

    // New nodes may complete edges queued by earlier records
    result.edges_emitted += drain_pending(callbacks);

    if (record.ioc_analysis && callbacks.on_ioc_analysis) {
        callbacks.on_ioc_analysis(*record.ioc_analysis);
    }

    return result;
}

size_t FlowAssembler::drain_pending(const FlowCallbacks& callbacks) {
    size_t emitted = 0;

    state_.process_pending_edges([&](const GraphEdge& edge) {
        auto source_display = state_.get_display_id(edge.source);
        auto target_display = state_.get_display_id(edge.target);
        if (source_display && target_display &&
            emit_resolved_edge(edge, *source_display, *target_display, callbacks)) {
            ++emitted;
        }
    });

    return emitted;
}

void FlowAssembler::reset() {
    sequence_ = 0;
}

// ============================================================================
// Nodes
// ============================================================================

void FlowAssembler::process_node(const json& raw, const FlowCallbacks& callbacks, AssemblyResult& result) {
    if (!is_valid_node(raw)) {
        result.nodes_rejected++;
        if (options_.verbose) {
            std::cerr << "[FlowAssembler] Rejected node descriptor: " << raw.dump() << std::endl;
        }
        return;
    }

    GraphNode node = GraphNode::from_json(raw);

    // Model repeated a node it already described
    if (state_.has_processed_node(node.id)) {
        result.duplicates_suppressed++;
        return;
    }

    std::string display_id = generator_ ? generator_(node) : default_display_id(node);
    state_.register_node(node.id, display_id);

    GraphNode emitted = node;
    emitted.id = display_id;
    if (callbacks.on_node) {
        callbacks.on_node(emitted);
    }
    result.nodes_emitted++;
}

bool FlowAssembler::is_valid_node(const json& node) const {
    if (!node.is_object() || !is_non_empty_string(node, "id")) {
        return false;
    }
    if (options_.require_node_type) {
        auto type = node.find("type");
        if (type == node.end() || !type->is_string()) {
            return false;
        }
    }
    if (options_.require_node_data) {
        auto data = node.find("data");
        if (data == node.end() || !data->is_object()) {
            return false;
        }
    }
    return true;
}

std::string FlowAssembler::default_display_id(const GraphNode& node) {
    std::uniform_int_distribution<int> digit(0, 35);
    std::string suffix;
    for (int i = 0; i < 9; ++i) {
        suffix += BASE36[digit(rng_)];
    }

    std::string prefix = node.type.empty() ? "node" : node.type;
    return prefix + "-" + std::to_string(++sequence_) + "-" + suffix;
}

// ============================================================================
// Edges
// ============================================================================

void FlowAssembler::process_edge(const json& raw, const FlowCallbacks& callbacks, AssemblyResult& result) {
    if (!is_valid_edge(raw)) {
        result.edges_rejected++;
        if (options_.verbose) {
            std::cerr << "[FlowAssembler] Rejected edge descriptor: " << raw.dump() << std::endl;
        }
        return;
    }

    GraphEdge edge = GraphEdge::from_json(raw);
    if (edge.id.empty()) {
        edge.id = edge.source + "-" + edge.target;
    }

    auto source_display = state_.get_display_id(edge.source);
    auto target_display = state_.get_display_id(edge.target);

    if (source_display && target_display &&
        state_.has_emitted_node(*source_display) &&
        state_.has_emitted_node(*target_display)) {
        if (emit_resolved_edge(edge, *source_display, *target_display, callbacks)) {
            result.edges_emitted++;
        } else {
            result.duplicates_suppressed++;
        }
        return;
    }

    if (!source_display) {
        state_.mark_node_known(edge.source);
    }
    if (!target_display) {
        state_.mark_node_known(edge.target);
    }

    if (state_.add_pending_edge(edge, edge.source, edge.target)) {
        result.edges_deferred++;
    } else {
        result.duplicates_suppressed++;
    }
}

bool FlowAssembler::is_valid_edge(const json& edge) {
    return edge.is_object() &&
           is_non_empty_string(edge, "source") &&
           is_non_empty_string(edge, "target");
}

std::string FlowAssembler::display_edge_id(const std::string& source_display, const std::string& target_display) {
    return source_display + "-to-" + target_display;
}

bool FlowAssembler::emit_resolved_edge(
    const GraphEdge& edge,
    const std::string& source_display,
    const std::string& target_display,
    const FlowCallbacks& callbacks
) {
    std::string edge_id = display_edge_id(source_display, target_display);
    if (state_.has_processed_edge(edge_id)) {
        return false;
    }

    GraphEdge resolved = edge;
    resolved.id = edge_id;
    resolved.source = source_display;
    resolved.target = target_display;

    state_.mark_edge_processed(edge_id);
    if (callbacks.on_edge) {
        callbacks.on_edge(resolved);
    }
    return true;
}

} // namespace af
