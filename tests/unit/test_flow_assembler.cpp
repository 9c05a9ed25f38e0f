#include <gtest/gtest.h>
#include "assembler/flow_assembler.hpp"
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace af;
using json = nlohmann::json;

namespace {

ParsedRecord record(const std::string& text) {
    auto parsed = ParsedRecord::from_json(json::parse(text));
    if (!parsed) {
        throw std::runtime_error("test record has no routable content: " + text);
    }
    return *parsed;
}

} // namespace

class FlowAssemblerTest : public ::testing::Test {
protected:
    StreamStateManager state;
    FlowAssembler assembler{state, AssemblyOptions(),
                            [](const GraphNode& node) { return "d-" + node.id; }};

    std::vector<std::string> log;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    std::vector<RecordError> errors;
    FlowCallbacks callbacks;

    void SetUp() override {
        callbacks.on_node = [this](const GraphNode& node) {
            log.push_back("node:" + node.id);
            nodes.push_back(node);
        };
        callbacks.on_edge = [this](const GraphEdge& edge) {
            log.push_back("edge:" + edge.id);
            edges.push_back(edge);
        };
        callbacks.on_error = [this](const RecordError& error) {
            log.push_back("error:" + error.code);
            errors.push_back(error);
        };
    }
};

// ==========================================
// Node Tests
// ==========================================

TEST_F(FlowAssemblerTest, NodeIsEmittedUnderDisplayId) {
    auto result = assembler.process_record(
        record(R"({"nodes":[{"id":"n1","type":"action","data":{"name":"Phishing"}}]})"), callbacks);

    EXPECT_EQ(result.nodes_emitted, 1);
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes[0].id, "d-n1");
    EXPECT_EQ(nodes[0].type, "action");
    EXPECT_EQ(nodes[0].payload["data"]["name"], "Phishing");
    EXPECT_EQ(nodes[0].to_json()["id"], "d-n1");
    EXPECT_EQ(*state.get_display_id("n1"), "d-n1");
}

TEST_F(FlowAssemblerTest, RepeatedNodeIsSuppressed) {
    assembler.process_record(record(R"({"nodes":[{"id":"n1","type":"action"}]})"), callbacks);
    auto result = assembler.process_record(
        record(R"({"nodes":[{"id":"n1","type":"action","data":{"name":"changed"}}]})"), callbacks);

    EXPECT_EQ(result.nodes_emitted, 0);
    EXPECT_EQ(result.duplicates_suppressed, 1);
    EXPECT_EQ(nodes.size(), 1);
}

TEST_F(FlowAssemblerTest, InvalidNodesAreRejected) {
    auto result = assembler.process_record(record(
        R"({"nodes":[{"type":"action"},{"id":"","type":"action"},{"id":"n2"},"text",{"id":"n3","type":"tool"}]})"),
        callbacks);

    EXPECT_EQ(result.nodes_rejected, 3);
    EXPECT_EQ(result.nodes_emitted, 2);
    ASSERT_EQ(nodes.size(), 2);
    EXPECT_EQ(nodes[0].id, "d-n2");
    EXPECT_EQ(nodes[0].type, "");
    EXPECT_EQ(nodes[1].id, "d-n3");
}

TEST(FlowAssemblerOptionsTest, NodeValidationOptions) {
    StreamStateManager state;

    FlowAssembler relaxed(state, AssemblyOptions());
    EXPECT_TRUE(relaxed.is_valid_node({{"id", "n1"}}));

    AssemblyOptions typed;
    typed.require_node_type = true;
    FlowAssembler checked(state, typed);
    EXPECT_FALSE(checked.is_valid_node({{"id", "n1"}}));
    EXPECT_FALSE(checked.is_valid_node({{"id", "n1"}, {"type", 3}}));
    EXPECT_TRUE(checked.is_valid_node({{"id", "n1"}, {"type", "action"}}));

    AssemblyOptions strict;
    strict.require_node_data = true;
    FlowAssembler demanding(state, strict);
    EXPECT_FALSE(demanding.is_valid_node({{"id", "n1"}, {"type", "action"}}));
    EXPECT_FALSE(demanding.is_valid_node({{"id", "n1"}, {"type", "action"}, {"data", "x"}}));
    EXPECT_TRUE(demanding.is_valid_node({{"id", "n1"}, {"type", "action"}, {"data", json::object()}}));
}

TEST(FlowAssemblerDisplayIdTest, DefaultDisplayIdFormat) {
    StreamStateManager state;
    FlowAssembler assembler(state);

    std::vector<std::string> ids;
    FlowCallbacks callbacks;
    callbacks.on_node = [&](const GraphNode& node) { ids.push_back(node.id); };

    assembler.process_record(
        record(R"({"nodes":[{"id":"a","type":"action"},{"id":"b","type":"tool"},{"id":"c"}]})"), callbacks);

    ASSERT_EQ(ids.size(), 3);
    EXPECT_TRUE(std::regex_match(ids[0], std::regex("action-1-[0-9a-z]{9}"))) << ids[0];
    EXPECT_TRUE(std::regex_match(ids[1], std::regex("tool-2-[0-9a-z]{9}"))) << ids[1];
    EXPECT_TRUE(std::regex_match(ids[2], std::regex("node-3-[0-9a-z]{9}"))) << ids[2];

    // A new session starts the sequence over
    assembler.reset();
    state.reset();
    ids.clear();
    assembler.process_record(record(R"({"nodes":[{"id":"a","type":"action"}]})"), callbacks);
    ASSERT_EQ(ids.size(), 1);
    EXPECT_TRUE(std::regex_match(ids[0], std::regex("action-1-[0-9a-z]{9}"))) << ids[0];
}

// ==========================================
// Edge Tests
// ==========================================

TEST_F(FlowAssemblerTest, EdgeBetweenKnownNodesIsEmittedImmediately) {
    auto result = assembler.process_record(record(
        R"({"nodes":[{"id":"a","type":"action"},{"id":"b","type":"tool"}],)"
        R"("edges":[{"id":"e1","source":"a","target":"b","label":"uses"}]})"), callbacks);

    EXPECT_EQ(result.nodes_emitted, 2);
    EXPECT_EQ(result.edges_emitted, 1);
    EXPECT_EQ(result.edges_deferred, 0);

    ASSERT_EQ(edges.size(), 1);
    EXPECT_EQ(edges[0].id, "d-a-to-d-b");
    EXPECT_EQ(edges[0].source, "d-a");
    EXPECT_EQ(edges[0].target, "d-b");
    EXPECT_EQ(edges[0].payload["label"], "uses");

    std::vector<std::string> expected = {"node:d-a", "node:d-b", "edge:d-a-to-d-b"};
    EXPECT_EQ(log, expected);
}

TEST_F(FlowAssemblerTest, EdgeBeforeNodesIsDeferred) {
    auto first = assembler.process_record(
        record(R"({"edges":[{"id":"e1","source":"a","target":"b"}]})"), callbacks);
    EXPECT_EQ(first.edges_deferred, 1);
    EXPECT_TRUE(edges.empty());
    EXPECT_EQ(state.node_state("a"), NodeState::Known);

    auto second = assembler.process_record(record(R"({"nodes":[{"id":"a","type":"action"}]})"), callbacks);
    EXPECT_EQ(second.edges_emitted, 0);
    EXPECT_TRUE(edges.empty());

    auto third = assembler.process_record(record(R"({"nodes":[{"id":"b","type":"tool"}]})"), callbacks);
    EXPECT_EQ(third.edges_emitted, 1);

    std::vector<std::string> expected = {"node:d-a", "node:d-b", "edge:d-a-to-d-b"};
    EXPECT_EQ(log, expected);
    EXPECT_TRUE(state.get_pending_edges().empty());
}

TEST_F(FlowAssemblerTest, EdgeNeverPrecedesItsNodes) {
    assembler.process_record(record(
        R"({"edges":[{"id":"e2","source":"b","target":"c"},{"id":"e1","source":"a","target":"b"}]})"),
        callbacks);
    assembler.process_record(record(R"({"nodes":[{"id":"c","type":"asset"},{"id":"b","type":"tool"}]})"),
                             callbacks);
    assembler.process_record(record(R"({"nodes":[{"id":"a","type":"action"}]})"), callbacks);

    ASSERT_EQ(edges.size(), 2);
    for (const auto& edge : edges) {
        auto position = [this](const std::string& entry) {
            return std::distance(log.begin(), std::find(log.begin(), log.end(), entry));
        };
        auto edge_pos = position("edge:" + edge.id);
        auto source_pos = position("node:" + edge.source);
        auto target_pos = position("node:" + edge.target);
        ASSERT_LT(source_pos, static_cast<long>(log.size()));
        ASSERT_LT(target_pos, static_cast<long>(log.size()));
        EXPECT_LT(source_pos, edge_pos);
        EXPECT_LT(target_pos, edge_pos);
    }
}

TEST_F(FlowAssemblerTest, DuplicateEdgesAreSuppressed) {
    assembler.process_record(
        record(R"({"nodes":[{"id":"a","type":"action"},{"id":"b","type":"tool"}]})"), callbacks);

    auto result = assembler.process_record(record(
        R"({"edges":[{"id":"e1","source":"a","target":"b"},{"id":"e1-again","source":"a","target":"b"}]})"),
        callbacks);

    EXPECT_EQ(result.edges_emitted, 1);
    EXPECT_EQ(result.duplicates_suppressed, 1);
    EXPECT_EQ(edges.size(), 1);
}

TEST_F(FlowAssemblerTest, DuplicatePendingEdgeIsSuppressed) {
    auto result = assembler.process_record(record(
        R"({"edges":[{"id":"e1","source":"a","target":"b"},{"id":"e1","source":"a","target":"b"}]})"),
        callbacks);

    EXPECT_EQ(result.edges_deferred, 1);
    EXPECT_EQ(result.duplicates_suppressed, 1);
    EXPECT_EQ(state.get_pending_edges().size(), 1);
}

TEST_F(FlowAssemblerTest, EdgeWithoutIdIsKeyedByEndpoints) {
    assembler.process_record(record(R"({"edges":[{"source":"a","target":"b"}]})"), callbacks);

    auto pending = state.get_pending_edges();
    ASSERT_EQ(pending.size(), 1);
    EXPECT_EQ(pending[0].edge.id, "a-b");
}

TEST_F(FlowAssemblerTest, InvalidEdgesAreRejected) {
    auto result = assembler.process_record(record(
        R"({"edges":[{"id":"e1","target":"b"},{"id":"e2","source":"a","target":""},{"id":"e3","source":1,"target":"b"}]})"),
        callbacks);

    EXPECT_EQ(result.edges_rejected, 3);
    EXPECT_TRUE(state.get_pending_edges().empty());
    EXPECT_TRUE(FlowAssembler::is_valid_edge({{"source", "a"}, {"target", "b"}}));
    EXPECT_FALSE(FlowAssembler::is_valid_edge(json::array()));
}

// ==========================================
// Error and Analysis Tests
// ==========================================

TEST_F(FlowAssemblerTest, ErrorRecordReachesCallbackFirst) {
    assembler.process_record(record(
        R"({"error":{"code":"partial","message":"Truncated"},"nodes":[{"id":"a","type":"action"}]})"),
        callbacks);

    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, "partial");
    ASSERT_EQ(log.size(), 2);
    EXPECT_EQ(log[0], "error:partial");
    EXPECT_EQ(log[1], "node:d-a");
}

TEST_F(FlowAssemblerTest, IocAnalysisIsForwarded) {
    json received;
    callbacks.on_ioc_analysis = [&](const json& analysis) { received = analysis; };

    assembler.process_record(record(R"({"ioc_analysis":{"indicators":[{"value":"evil.example"}]}})"),
                             callbacks);

    ASSERT_TRUE(received.contains("indicators"));
    EXPECT_EQ(received["indicators"][0]["value"], "evil.example");
}

TEST_F(FlowAssemblerTest, OptionalCallbacksMayBeEmpty) {
    FlowCallbacks minimal;
    minimal.on_node = callbacks.on_node;
    minimal.on_edge = callbacks.on_edge;

    EXPECT_NO_THROW(assembler.process_record(record(
        R"({"error":"oops","ioc_analysis":{},"nodes":[{"id":"a","type":"action"}]})"), minimal));
    EXPECT_EQ(nodes.size(), 1);
}

TEST(FlowAssemblerStaticTest, DisplayEdgeId) {
    EXPECT_EQ(FlowAssembler::display_edge_id("action-1-x", "tool-2-y"), "action-1-x-to-tool-2-y");
}
