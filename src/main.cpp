#include "cli/cli.hpp"
#include "graph/flow_graph.hpp"
#include "session/streaming_session.hpp"
#include "stream/stream_parser.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace af;

// ============== Helper Functions ==============

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Split captured output into fixed-size fragments, as a transport would deliver it
std::vector<std::string> split_fragments(const std::string& text, size_t chunk_size) {
    std::vector<std::string> fragments;
    for (size_t offset = 0; offset < text.size(); offset += chunk_size) {
        fragments.push_back(text.substr(offset, chunk_size));
    }
    return fragments;
}

// ============== attackflow assemble ==============
int cmd_assemble(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.get("output", "").value;
    size_t chunk_size = args.get("chunk-size", "64").as_size(64);

    SessionConfig config = load_config_with_fallback(args.get("config", "").value);
    if (args.has("sse")) config.sse_input = true;
    if (args.has("verbose")) config.verbose = true;

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    std::string text = read_file(input_path);

    FlowGraph graph;
    FlowCallbacks callbacks = graph.callbacks();
    callbacks.on_error = [](const RecordError& e) {
        std::cerr << "Stream error [" << e.code << "]: " << e.message << "\n";
    };
    callbacks.on_progress = [&config](const std::string& stage, const std::string& message) {
        if (config.verbose) std::cerr << "  " << stage << ": " << message << "\n";
    };

    StreamingSession session(config, callbacks);

    try {
        for (const auto& fragment : split_fragments(text, chunk_size)) {
            if (session.state() == SessionState::Complete) break;
            session.feed(fragment);
        }
        session.finish();
    } catch (const BufferOverflowError& e) {
        std::cerr << "Stream aborted: " << e.what() << "\n";
        return 1;
    }

    if (config.verbose) {
        session.statistics().print_summary();
        std::cerr << "State: " << session.state_stats().to_json().dump() << "\n";
    }

    if (output_path.empty()) {
        std::cout << graph.to_json().dump(2) << "\n";
    } else {
        graph.save_to_json(output_path);
        std::cout << "Wrote " << graph.num_nodes() << " nodes and " << graph.num_edges()
                  << " edges to " << output_path << "\n";
    }

    return 0;
}

// ============== attackflow records ==============
int cmd_records(const Args& args) {
    std::string input_path = args.require("input");
    size_t chunk_size = args.get("chunk-size", "64").as_size(64);

    std::string text = read_file(input_path);

    StreamParserOptions options;
    options.verbose = args.has("verbose");
    StreamParser parser(options);

    size_t records = 0;
    size_t skipped = 0;

    auto print = [&](const ParseResult& result) {
        for (const auto& record : result.records) {
            nlohmann::json j;
            if (record.has_nodes) j["nodes"] = record.nodes;
            if (record.has_edges) j["edges"] = record.edges;
            if (record.error) j["error"] = record.error->to_json();
            if (record.ioc_analysis) j["ioc_analysis"] = *record.ioc_analysis;
            std::cout << j.dump() << "\n";
        }
        records += result.records.size();
        skipped += result.lines_skipped;
    };

    try {
        for (const auto& fragment : split_fragments(text, chunk_size)) {
            print(parser.feed(fragment));
        }
        print(parser.flush());
    } catch (const BufferOverflowError& e) {
        std::cerr << "Stream aborted: " << e.what() << "\n";
        return 1;
    }

    std::cerr << records << " records, " << skipped << " lines skipped\n";
    return 0;
}

// ============== attackflow config ==============
int cmd_config(const Args& args) {
    std::string output_path = args.require("output");
    SessionConfig config;
    config.to_json_file(output_path);
    std::cout << "Default configuration written to " << output_path << "\n";
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("attackflow", "1.0.0", "Incremental attack-flow graph assembler");

    cli.register_command({
        "assemble",
        "Replay a captured model stream and assemble the attack-flow graph",
        {
            {"input", "i", "Captured stream (JSON lines, or SSE with --sse)", "", true, false},
            {"output", "o", "Output graph JSON (default: stdout)", "", false, false},
            {"chunk-size", "c", "Fragment size in bytes", "64", false, false},
            {"config", "", "Session config JSON file", "", false, false},
            {"sse", "", "Input carries SSE 'data:' framing", "", false, true},
            {"verbose", "V", "Print statistics and trace skipped lines", "", false, true}
        },
        cmd_assemble
    });

    cli.register_command({
        "records",
        "Print the JSON records found in a captured stream",
        {
            {"input", "i", "Captured stream (JSON lines)", "", true, false},
            {"chunk-size", "c", "Fragment size in bytes", "64", false, false},
            {"verbose", "V", "Trace skipped lines", "", false, true}
        },
        cmd_records
    });

    cli.register_command({
        "config",
        "Write the default session configuration",
        {
            {"output", "o", "Output config JSON file", "", true, false}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
