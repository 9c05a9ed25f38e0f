#include "graph/flow_graph.hpp"
#include "session/streaming_session.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace af;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

int main() {
    print_separator("Incremental Attack-Flow Assembly Example");

    // Model output as it might arrive over a streaming connection. The edge
    // in the first record references nodes that only appear later.
    const std::string model_output =
        "Here is the attack flow extracted from the report:\n"
        "```json\n"
        "{\"edges\":[{\"id\":\"e1\",\"source\":\"phish\",\"target\":\"macro\",\"label\":\"leads to\"}]}\n"
        "{\"nodes\":[{\"id\":\"phish\",\"type\":\"action\",\"data\":{\"name\":\"Spearphishing Attachment\",\"technique_id\":\"T1566.001\"}}]}\n"
        "{\"nodes\":[{\"id\":\"macro\",\"type\":\"action\",\"data\":{\"name\":\"Malicious Macro\",\"technique_id\":\"T1204.002\"}},"
        "{\"id\":\"c2\",\"type\":\"infrastructure\",\"data\":{\"name\":\"C2 Server\"}}],"
        "\"edges\":[{\"id\":\"e2\",\"source\":\"macro\",\"target\":\"c2\",\"label\":\"beacons to\"}]}\n"
        "```\n";

    FlowGraph graph;
    FlowCallbacks callbacks;
    callbacks.on_node = [&graph](const GraphNode& node) {
        std::string name = "?";
        auto data = node.payload.find("data");
        if (data != node.payload.end() && data->is_object()) {
            name = data->value("name", "?");
        }
        std::cout << "  + node " << node.id << " (" << name << ")\n";
        graph.add_node(node);
    };
    callbacks.on_edge = [&graph](const GraphEdge& edge) {
        std::cout << "  + edge " << edge.source << " -> " << edge.target << "\n";
        graph.add_edge(edge);
    };

    SessionConfig config;
    StreamingSession session(config, callbacks);

    // Deliver the output in awkward 7-byte fragments
    print_separator("Streaming");
    for (size_t offset = 0; offset < model_output.size(); offset += 7) {
        session.feed(model_output.substr(offset, 7));
    }
    session.finish();

    session.statistics().print_summary();

    print_separator("Assembled Graph");
    std::cout << graph.to_json().dump(2) << "\n";

    return 0;
}
