#include "cli/cli.hpp"
#include "core/engine_config.hpp"
#include "core/errors.hpp"
#include "graph/cycle_resolver.hpp"
#include "net/http_transport.hpp"
#include "pipeline/data_source.hpp"
#include "pipeline/chunk_streamer.hpp"
#include "session/graph_session.hpp"
#include <algorithm>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace gv;
using gv::cli::Args;
using json = nlohmann::json;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

EngineConfig load_config(const Args& args) {
    EngineConfig config = load_config_with_fallback(args.value_or("config", ""));
    if (args.has("verbose")) {
        config.verbose = true;
        config.virtualization.verbose = true;
        config.streaming.verbose = true;
        config.edge_cases.verbose = true;
    }
    return config;
}

void write_json(const json& j, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << j.dump(2);
    std::cout << "Saved: " << path << "\n";
}

json read_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return json::parse(file);
}

// Longest a single chunk load may take with every retry used
std::chrono::milliseconds worst_case_load_time(const EngineConfig& config) {
    const auto& edge = config.edge_cases;
    int64_t total = 0;
    double delay = edge.retry_delay_ms;
    for (int attempt = 1; attempt <= edge.max_retry_attempts; ++attempt) {
        total += edge.network_timeout_ms;
        if (attempt < edge.max_retry_attempts) {
            total += static_cast<int64_t>(delay);
            delay *= edge.retry_backoff;
        }
    }
    return std::chrono::milliseconds(total + 1000);
}

// ============== gv simulate ==============
int cmd_simulate(const Args& args) {
    EngineConfig config = load_config(args);

    const int steps = static_cast<int>(args.get("steps").as_count());
    const double width = args.get("width").as_double();
    const double height = args.get("height").as_double();
    const double zoom = args.get("zoom").as_double();
    const double step_x = args.get("step-x").as_double();
    const double step_y = args.get("step-y").as_double();
    if (width <= 0 || height <= 0 || zoom <= 0) {
        throw cli::UsageError("--width, --height and --zoom must be positive");
    }

    SyntheticDataSource::Options options;
    options.nodes_per_chunk = static_cast<size_t>(args.get("chunk-nodes").as_count());
    options.latency = args.get("latency-ms").as_millis();
    options.seed = args.get("seed").as_count();

    SyntheticDataSource source(options);
    CurlTransport transport;
    GraphSession session(config, source, transport);

    std::cout << "Simulating " << steps << " viewport updates ("
              << width << "x" << height << " at zoom " << zoom << ")\n";

    const auto start = std::chrono::steady_clock::now();
    const auto settle_limit = std::chrono::seconds(5);

    for (int step = 0; step < steps; ++step) {
        session.update_viewport(step * step_x, step * step_y, width, height, zoom);

        // Let this step's chunks arrive before panning again
        const auto deadline = std::chrono::steady_clock::now() + settle_limit;
        while (session.streamer().loading_count() > 0 &&
               std::chrono::steady_clock::now() < deadline) {
            session.pump(std::chrono::milliseconds(10));
        }
        session.pump();

        PerformanceMetrics metrics = session.get_performance_metrics();
        std::cout << "  Step " << std::setw(3) << step + 1
                  << ": " << std::setw(6) << metrics.node_count << " nodes, "
                  << std::setw(5) << metrics.visible_node_count << " visible, "
                  << std::setw(4) << metrics.cached_chunks << " chunks\n";
    }

    // Jump around the visible graph to exercise navigation
    auto visible = session.virtualizer().visible_nodes();
    std::vector<std::string> targets(visible.begin(), visible.end());
    std::sort(targets.begin(), targets.end());
    if (targets.size() > 3) {
        targets.resize(3);
    }
    if (!targets.empty()) {
        targets.push_back(targets.front());
    }
    for (const auto& target : targets) {
        NavigationResult result = session.navigate_to(target);
        std::cout << "  Navigate " << target << ": " << result.outcome_string()
                  << (result.cycle ? " (cycle detected)" : "") << "\n";
    }

    std::cout << "\nSimulation time: " << format_duration(std::chrono::steady_clock::now() - start) << "\n";

    json stats = session.get_statistics();
    std::cout << stats.dump(2) << "\n";

    if (args.has("output")) {
        write_json(stats, args.get("output").value);
    }

    return cli::EXIT_OK;
}

// ============== gv fetch-chunk ==============
int cmd_fetch_chunk(const Args& args) {
    EngineConfig config = load_config(args);

    std::string base_url = args.value_or("url", config.streaming.data_source_url);
    if (base_url.empty()) {
        throw cli::UsageError("No data source URL: pass --url or set GV_DATA_SOURCE_URL");
    }
    std::string chunk_id = args.require("chunk");
    BoundingBox bounds = chunk_bounds_from_id(chunk_id, config.streaming.chunk_size);

    CurlTransport transport;
    HttpDataSource source(
        transport,
        base_url,
        config.streaming.compression_enabled,
        std::chrono::milliseconds(config.edge_cases.network_timeout_ms)
    );
    GraphSession session(config, source, transport);

    session.network().set_failure_handler([](const NetworkFailureContext& failure) {
        std::cerr << "Attempt " << failure.attempts << " for " << failure.url
                  << " failed: " << failure.last_error;
        if (failure.retry_after_ms) {
            std::cerr << " (retrying in " << *failure.retry_after_ms << "ms)";
        }
        std::cerr << "\n";
    });

    std::cout << "Fetching " << source.chunk_url(chunk_id) << "\n";

    const auto start = std::chrono::steady_clock::now();
    ChunkFuture future = session.streamer().load_chunk(chunk_id, bounds);
    ChunkHandle chunk = session.streamer().wait_for_chunk(future, worst_case_load_time(config));

    std::cout << "Loaded " << chunk->nodes.size() << " nodes and " << chunk->edges.size()
              << " edges in " << format_duration(std::chrono::steady_clock::now() - start) << "\n";

    if (args.has("output")) {
        ChunkData data{chunk->nodes, chunk->edges};
        write_json(data.to_json(), args.get("output").value);
    } else {
        std::cout << chunk->to_json().dump(2) << "\n";
    }

    return cli::EXIT_OK;
}

// ============== gv cycles ==============
int cmd_cycles(const Args& args) {
    std::string input_path = args.require("input");
    std::vector<std::string> path = args.get("path").as_list();
    std::string node_id = args.require("node");
    std::string target = args.value_or("target", node_id);
    int max_depth = static_cast<int>(args.get("max-depth").as_count());

    json input = read_json(input_path);
    if (!input.is_object()) {
        throw std::runtime_error("Adjacency file must hold an object of id -> [neighbors]");
    }

    Adjacency adjacency;
    for (auto it = input.begin(); it != input.end(); ++it) {
        adjacency[it.key()] = it.value().get<std::vector<std::string>>();
    }

    CycleResolver resolver(max_depth);
    json result;
    result["node"] = node_id;
    result["path"] = path;

    auto cycle = resolver.detect_circular_reference(node_id, path);
    if (!cycle) {
        std::cout << "No cycle: " << node_id << " does not appear on the path\n";
        result["cycle"] = nullptr;
    } else {
        std::cout << "Cycle of depth " << cycle->depth << " detected at " << node_id << "\n";
        result["cycle"] = cycle->to_json();

        const std::string start = path.empty() ? node_id : path.back();
        auto alternate = resolver.break_circular_reference(start, target, adjacency);
        if (alternate) {
            std::cout << "Alternate route " << start << " -> " << target << ": ";
            for (size_t i = 0; i < alternate->size(); ++i) {
                if (i > 0) std::cout << " -> ";
                std::cout << (*alternate)[i];
            }
            std::cout << "\n";
            result["alternate_path"] = *alternate;
        } else {
            std::cout << "No alternate route within depth " << max_depth << "\n";
            result["alternate_path"] = nullptr;
        }
    }

    if (args.has("output")) {
        write_json(result, args.get("output").value);
    }

    return cli::EXIT_OK;
}

// ============== gv config ==============
int cmd_config(const Args& args) {
    EngineConfig config = load_config(args);

    std::string error;
    bool valid = config.validate(error);

    std::cout << config.to_json().dump(2) << "\n";
    if (!valid) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return cli::EXIT_FAILURE_GENERIC;
    }

    if (args.has("output")) {
        config.to_json_file(args.get("output").value);
        std::cout << "Saved: " << args.get("output").value << "\n";
    }

    return cli::EXIT_OK;
}

// ============== Main ==============
int main(int argc, char** argv) {
    cli::CLI app("gv", "1.0.0");

    app.add_shared_option({"config", "c", "Path to engine config JSON (optional)", "", false, false});
    app.add_shared_option({"verbose", "v", "Verbose logging", "", false, true});

    // gv simulate
    app.register_command({
        "simulate",
        "Pan a viewport across a synthetic graph and report streaming metrics",
        {
            {"steps", "n", "Number of viewport updates", "20", false, false},
            {"width", "w", "Viewport width", "800", false, false},
            {"height", "H", "Viewport height", "600", false, false},
            {"zoom", "z", "Zoom factor", "1.0", false, false},
            {"step-x", "x", "Horizontal pan per step", "150", false, false},
            {"step-y", "y", "Vertical pan per step", "0", false, false},
            {"chunk-nodes", "k", "Nodes generated per chunk", "20", false, false},
            {"latency-ms", "l", "Simulated fetch latency", "5", false, false},
            {"seed", "s", "Generator seed", "0", false, false},
            {"output", "o", "Write final statistics JSON here", "", false, false}
        },
        cmd_simulate,
        {
            "gv simulate --steps 40 --zoom 0.25",
            "gv simulate -x -100 -y 50 --output stats.json"
        }
    });

    // gv fetch-chunk
    app.register_command({
        "fetch-chunk",
        "Fetch one chunk from an HTTP data source with retry",
        {
            {"chunk", "k", "Chunk id, e.g. chunk_3_-2", "", true, false},
            {"url", "u", "Data source base URL (default: config / GV_DATA_SOURCE_URL)", "", false, false},
            {"output", "o", "Write chunk JSON here instead of stdout", "", false, false}
        },
        cmd_fetch_chunk,
        {
            "gv fetch-chunk --chunk chunk_0_0 --url http://localhost:8080"
        }
    });

    // gv cycles
    app.register_command({
        "cycles",
        "Detect a cycle on a traversal path and search for an alternate route",
        {
            {"input", "i", "Adjacency JSON file ({\"A\": [\"B\", ...], ...})", "", true, false},
            {"node", "n", "Node about to be visited", "", true, false},
            {"path", "p", "Comma-separated traversal path so far", "", false, false},
            {"target", "t", "Route target (default: --node)", "", false, false},
            {"max-depth", "d", "Maximum alternate route length", "10", false, false},
            {"output", "o", "Write result JSON here", "", false, false}
        },
        cmd_cycles,
        {
            "gv cycles --input graph.json --path A,B,C --node A"
        }
    });

    // gv config
    app.register_command({
        "config",
        "Print the effective configuration",
        {
            {"output", "o", "Save the effective configuration here", "", false, false}
        },
        cmd_config,
        {}
    });

    return app.run(argc, argv);
}
