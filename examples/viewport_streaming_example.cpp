#include "session/graph_session.hpp"
#include "pipeline/data_source.hpp"
#include "net/http_transport.hpp"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <chrono>
#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>

using namespace gv;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_metrics(const PerformanceMetrics& metrics) {
    std::cout << "   Nodes in index:   " << metrics.node_count << "\n";
    std::cout << "   Visible nodes:    " << metrics.visible_node_count << "\n";
    std::cout << "   Visible edges:    " << metrics.visible_edge_count << "\n";
    std::cout << "   Chunks cached:    " << metrics.cached_chunks
              << " (" << metrics.loading_chunks << " loading)\n";
    std::cout << "   Cache hit ratio:  " << std::fixed << std::setprecision(2)
              << metrics.cache_hit_ratio << "\n";
    std::cout << "   Render time:      " << std::setprecision(3)
              << metrics.render_time_ms << " ms\n";
    std::cout.unsetf(std::ios::fixed);
}

// Pump until nothing is loading or the deadline passes
void settle(GraphSession& session) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((session.streamer().loading_count() > 0 || session.streamer().deferred_count() > 0) &&
           std::chrono::steady_clock::now() < deadline) {
        session.pump(std::chrono::milliseconds(10));
    }
}

int main() {
    print_separator("Viewport Streaming Example - Virtualized Transaction Graph");

    // Create output directory
    const std::string output_dir = "output_json";
    #ifdef _WIN32
        _mkdir(output_dir.c_str());
    #else
        mkdir(output_dir.c_str(), 0755);
    #endif

    EngineConfig config;
    config.streaming.chunk_size = 250.0;
    config.streaming.prefetch_distance = 1;
    config.virtualization.buffer_zone = 100.0;

    SyntheticDataSource::Options options;
    options.nodes_per_chunk = 40;
    options.latency = std::chrono::milliseconds(2);
    SyntheticDataSource source(options);

    // The synthetic source never touches the network
    CurlTransport transport;
    GraphSession session(config, source, transport);

    // Step 1: initial viewport
    std::cout << "1. Opening an 800x600 viewport at the origin (zoom 1.0):\n";
    session.update_viewport(0, 0, 800, 600, 1.0);
    settle(session);
    print_metrics(session.get_performance_metrics());

    // Step 2: pan right; new chunks stream in, old ones stay cached
    std::cout << "\n2. Panning right in five steps:\n";
    for (int step = 1; step <= 5; ++step) {
        session.update_viewport(step * 200.0, 0, 800, 600, 1.0);
        settle(session);
        std::cout << "   Step " << step << ": "
                  << session.virtualizer().visible_nodes().size() << " visible, "
                  << session.streamer().chunk_count() << " chunks cached\n";
    }

    // Step 3: zoom out; the LOD tier drops deep levels and caps the count
    std::cout << "\n3. Zooming out:\n";
    for (double zoom : {1.0, 0.5, 0.25, 0.1}) {
        session.update_viewport(1000, 0, 800, 600, zoom);
        settle(session);
        const LodTier& tier = session.virtualizer().current_tier();
        std::cout << "   Zoom " << std::setw(4) << zoom << ": "
                  << std::setw(4) << session.virtualizer().visible_nodes().size()
                  << " visible (cap " << tier.max_nodes << ")\n";
    }

    // Step 4: navigate along visible nodes and back to the first one
    std::cout << "\n4. Navigating:\n";
    session.update_viewport(1000, 0, 800, 600, 1.0);
    settle(session);

    auto visible = session.virtualizer().visible_nodes();
    std::vector<std::string> route(visible.begin(), visible.end());
    std::sort(route.begin(), route.end());
    if (route.size() > 3) {
        route.resize(3);
    }
    if (!route.empty()) {
        route.push_back(route.front());
    }

    for (const auto& node_id : route) {
        NavigationResult result = session.navigate_to(node_id);
        std::cout << "   -> " << node_id << ": " << result.outcome_string();
        if (result.cycle) {
            std::cout << " (cycle of depth " << result.cycle->depth << ")";
        }
        std::cout << ", trail length " << result.trail.size() << "\n";
    }

    // Step 5: export statistics
    print_separator("Session Statistics");

    nlohmann::json stats = session.get_statistics();
    std::cout << stats.dump(2) << "\n";

    const std::string stats_file = output_dir + "/viewport_streaming_stats.json";
    std::ofstream out(stats_file);
    if (!out.is_open()) {
        std::cerr << "Cannot write " << stats_file << "\n";
        return 1;
    }
    out << stats.dump(2);
    std::cout << "\nSaved: " << stats_file << "\n";

    return 0;
}
