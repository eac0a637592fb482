#include "pipeline/data_source.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gv {

namespace {

// FNV-1a; std::hash is not stable across standard libraries
uint64_t stable_hash(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // anonymous namespace

// ============================================================================
// HttpDataSource
// ============================================================================

HttpDataSource::HttpDataSource(
    HttpTransport& transport,
    const std::string& base_url,
    bool compression_enabled,
    std::chrono::milliseconds timeout
) : transport_(transport),
    base_url_(base_url),
    compression_enabled_(compression_enabled),
    timeout_(timeout) {

    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string HttpDataSource::chunk_url(const std::string& chunk_id) const {
    return base_url_ + "/api/graph/chunk/" + chunk_id;
}

ChunkData HttpDataSource::fetch_chunk_data(
    const std::string& chunk_id,
    const BoundingBox& /*bounds*/
) {
    HttpRequest request;
    request.method = "GET";
    request.url = chunk_url(chunk_id);
    request.headers.push_back("Accept: application/json");
    if (compression_enabled_) {
        request.headers.push_back("Accept-Encoding: gzip, deflate, br");
    }

    HttpResponse response = transport_.perform(request, timeout_);

    if (!response.ok()) {
        throw HttpStatusError(response.status, response.body.substr(0, 200));
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed chunk payload for " + chunk_id + ": " + e.what());
    }

    return ChunkData::from_json(body);
}

// ============================================================================
// SyntheticDataSource
// ============================================================================

SyntheticDataSource::SyntheticDataSource(const Options& options)
    : options_(options) {}

ChunkData SyntheticDataSource::fetch_chunk_data(
    const std::string& chunk_id,
    const BoundingBox& bounds
) {
    if (options_.latency.count() > 0) {
        std::this_thread::sleep_for(options_.latency);
    }

    std::mt19937_64 rng(stable_hash(chunk_id) ^ options_.seed);
    std::uniform_real_distribution<double> x_dist(bounds.min_x, bounds.max_x);
    std::uniform_real_distribution<double> y_dist(bounds.min_y, bounds.max_y);
    std::uniform_int_distribution<int> level_dist(0, std::max(0, options_.max_level));

    ChunkData data;
    data.nodes.reserve(options_.nodes_per_chunk);

    for (size_t i = 0; i < options_.nodes_per_chunk; ++i) {
        GraphNode node;
        node.id = chunk_id + ":n" + std::to_string(i);
        node.x = x_dist(rng);
        node.y = y_dist(rng);
        node.level = level_dist(rng);
        node.data = {{"chunk", chunk_id}, {"index", i}};
        data.nodes.push_back(std::move(node));
    }

    if (data.nodes.size() < 2) {
        return data;
    }

    std::uniform_int_distribution<size_t> target_dist(0, data.nodes.size() - 1);
    std::uniform_int_distribution<size_t> count_dist(0, options_.connections_per_node);

    for (size_t i = 0; i < data.nodes.size(); ++i) {
        const size_t count = count_dist(rng);
        for (size_t c = 0; c < count; ++c) {
            size_t j = target_dist(rng);
            if (j == i) continue;

            GraphNode& source = data.nodes[i];
            const std::string& target_id = data.nodes[j].id;
            if (std::find(source.connections.begin(), source.connections.end(), target_id)
                != source.connections.end()) {
                continue;
            }
            source.connections.push_back(target_id);

            GraphEdge edge;
            edge.source = source.id;
            edge.target = target_id;
            edge.id = GraphEdge::derived_id(edge.source, edge.target);
            data.edges.push_back(std::move(edge));
        }
    }

    return data;
}

} // namespace gv
