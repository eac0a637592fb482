#include "session/graph_session.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace gv {

// ============================================================================
// Data Structures
// ============================================================================

json PerformanceMetrics::to_json() const {
    json j;
    j["node_count"] = node_count;
    j["edge_count"] = edge_count;
    j["render_time_ms"] = render_time_ms;
    j["cache_hit_ratio"] = cache_hit_ratio;
    j["data_streaming_rate"] = data_streaming_rate;
    j["visible_node_count"] = visible_node_count;
    j["visible_edge_count"] = visible_edge_count;
    j["loading_chunks"] = loading_chunks;
    j["cached_chunks"] = cached_chunks;
    return j;
}

std::string NavigationResult::outcome_string() const {
    switch (outcome) {
        case Outcome::Navigated: return "navigated";
        case Outcome::Rejected: return "rejected";
        case Outcome::Cancelled: return "cancelled";
        default: return "navigated";
    }
}

json NavigationResult::to_json() const {
    json j;
    j["outcome"] = outcome_string();
    j["node_id"] = node_id;
    j["centered"] = centered;
    j["trail"] = trail;
    if (cycle) {
        j["cycle"] = cycle->to_json();
    }
    if (alternate_path) {
        j["alternate_path"] = *alternate_path;
    }
    return j;
}

// ============================================================================
// GraphSession
// ============================================================================

EngineConfig GraphSession::prepare(const EngineConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid engine configuration: " + error);
    }

    EngineConfig prepared = config;
    if (prepared.verbose) {
        prepared.virtualization.verbose = true;
        prepared.streaming.verbose = true;
        prepared.edge_cases.verbose = true;
    }
    return prepared;
}

GraphSession::GraphSession(
    const EngineConfig& config,
    DataSource& source,
    HttpTransport& transport,
    const Clock& clock
) : config_(prepare(config)),
    retry_(transport, config_.edge_cases, clock),
    index_(config_.spatial),
    virtualizer_(index_, config_.virtualization, clock),
    operations_(config_.edge_cases, clock),
    cycles_(config_.edge_cases.max_circular_depth, clock),
    streamer_(index_, source, retry_, config_.streaming, clock) {

    streamer_.set_loaded_handler([this](const DataChunk& chunk) { on_chunk_loaded(chunk); });
    streamer_.set_evicted_handler([this](const ChunkEviction& eviction) { on_chunk_evicted(eviction); });

    if (config_.verbose) {
        std::cout << "Graph session ready (source: " << source.get_source_name()
                  << ", chunk size " << config_.streaming.chunk_size << ")" << std::endl;
    }
}

// ==========================================
// Viewport / streaming
// ==========================================

void GraphSession::update_viewport(double x, double y, double width, double height, double zoom) {
    virtualizer_.update_viewport(x, y, width, height, zoom);
    streamer_.load_visible_chunks(virtualizer_.expanded_viewport());
}

size_t GraphSession::pump(std::chrono::milliseconds wait) {
    const size_t changed = streamer_.pump(wait);
    if (changed > 0) {
        virtualizer_.refresh();
    }

    operations_.sweep();

    const auto max_age = std::chrono::milliseconds(config_.edge_cases.failure_max_age_ms);
    retry_.prune_failures(max_age);
    cycles_.prune(max_age);

    return changed;
}

void GraphSession::on_chunk_loaded(const DataChunk& chunk) {
    for (const auto& node : chunk.nodes) {
        link_node(node);
    }
    for (const auto& edge : chunk.edges) {
        link_edge(edge);
    }
    virtualizer_.add_edges(chunk.edges);
}

// Only ids the chunk still owned arrive here; newer chunks keep theirs
void GraphSession::on_chunk_evicted(const ChunkEviction& eviction) {
    for (const auto& id : eviction.node_ids) {
        adjacency_.erase(id);
    }

    virtualizer_.remove_edges(eviction.edge_ids);
    virtualizer_.forget_nodes(eviction.node_ids);
}

void GraphSession::link_node(const GraphNode& node) {
    adjacency_[node.id] = node.connections;
}

void GraphSession::link_edge(const GraphEdge& edge) {
    auto& neighbors = adjacency_[edge.source];
    if (std::find(neighbors.begin(), neighbors.end(), edge.target) == neighbors.end()) {
        neighbors.push_back(edge.target);
    }
}

// ==========================================
// Direct data injection
// ==========================================

size_t GraphSession::add_nodes(const std::vector<GraphNode>& nodes) {
    std::vector<std::string> accepted_ids;
    for (const auto& node : nodes) {
        if (index_.insert(node)) {
            link_node(node);
            accepted_ids.push_back(node.id);
        } else if (config_.verbose) {
            std::cerr << "Warning: node " << node.id << " at (" << node.x << ", " << node.y
                      << ") lies outside the world bounds" << std::endl;
        }
    }

    streamer_.release_nodes(accepted_ids);
    if (!accepted_ids.empty()) {
        virtualizer_.refresh();
    }
    return accepted_ids.size();
}

void GraphSession::add_edges(const std::vector<GraphEdge>& edges) {
    std::vector<std::string> edge_ids;
    for (const auto& edge : edges) {
        link_edge(edge);
        edge_ids.push_back(edge.id);
    }
    streamer_.release_edges(edge_ids);
    virtualizer_.add_edges(edges);
    virtualizer_.refresh();
}

size_t GraphSession::remove_nodes(const std::vector<std::string>& node_ids) {
    size_t removed = 0;
    for (const auto& id : node_ids) {
        if (index_.remove(id)) {
            ++removed;
        }
        adjacency_.erase(id);
    }

    streamer_.release_nodes(node_ids);
    virtualizer_.forget_nodes(node_ids);
    virtualizer_.refresh();
    return removed;
}

// ==========================================
// Navigation
// ==========================================

NavigationResult GraphSession::navigate_to(const std::string& node_id) {
    NavigationResult result;
    result.node_id = node_id;

    const std::string operation_id = "navigate:" + node_id;

    if (!operations_.track_operation(operation_id, OperationType::Navigation,
                                     config_.edge_cases.navigation_priority)) {
        result.outcome = NavigationResult::Outcome::Rejected;
        result.trail = trail_;
        return result;
    }

    auto cycle = cycles_.detect_circular_reference(node_id, trail_);
    if (cycle) {
        result.cycle = cycle;
        const size_t first = trail_.size() - cycle->depth;

        if (!trail_.empty()) {
            result.alternate_path = cycles_.break_circular_reference(
                trail_.back(), node_id, adjacency_
            );
        }

        if (result.alternate_path) {
            trail_.resize(first);
            trail_.insert(trail_.end(), result.alternate_path->begin(), result.alternate_path->end());
        } else {
            trail_.resize(first + 1);
        }

        if (config_.verbose) {
            std::cout << "Circular navigation to " << node_id << " (depth " << cycle->depth
                      << "), " << (result.alternate_path ? "rerouted" : "trail truncated")
                      << std::endl;
        }
    } else {
        trail_.push_back(node_id);
    }

    auto token = operations_.token(operation_id);
    if (token && token->is_cancelled()) {
        result.outcome = NavigationResult::Outcome::Cancelled;
        result.trail = trail_;
        return result;
    }

    if (const GraphNode* node = index_.find(node_id)) {
        const BoundingBox& current = virtualizer_.viewport();
        const double width = current.width();
        const double height = current.height();
        const double zoom = virtualizer_.has_viewport() ? virtualizer_.zoom() : 1.0;
        const double node_x = node->x;
        const double node_y = node->y;

        update_viewport(node_x - width / 2.0, node_y - height / 2.0, width, height, zoom);
        result.centered = true;
    }

    operations_.complete_operation(operation_id, true);

    result.trail = trail_;
    return result;
}

// ==========================================
// Metrics / lifecycle
// ==========================================

PerformanceMetrics GraphSession::get_performance_metrics() const {
    PerformanceMetrics metrics;
    metrics.node_count = index_.size();
    metrics.edge_count = virtualizer_.edge_count();
    metrics.render_time_ms = virtualizer_.average_render_time_ms();
    metrics.cache_hit_ratio = streamer_.cache_hit_ratio();
    metrics.data_streaming_rate = streamer_.data_streaming_rate();
    metrics.visible_node_count = virtualizer_.visible_nodes().size();
    metrics.visible_edge_count = virtualizer_.visible_edges().size();
    metrics.loading_chunks = streamer_.loading_count();
    metrics.cached_chunks = streamer_.chunk_count();
    return metrics;
}

json GraphSession::get_statistics() {
    json stats;
    stats["performance"] = get_performance_metrics().to_json();
    stats["streaming"] = streamer_.get_statistics();
    stats["operations"] = operations_.get_statistics();
    stats["network_failures"] = retry_.failure_count();
    stats["circular_references"] = cycles_.reference_count();
    stats["trail_length"] = trail_.size();
    stats["index"] = {
        {"regions", index_.region_count()},
        {"max_depth_reached", index_.max_depth_reached()}
    };
    return stats;
}

void GraphSession::reset() {
    streamer_.clear();
    virtualizer_.clear();
    index_.clear();
    operations_.reset();
    retry_.clear();
    cycles_.clear();
    adjacency_.clear();
    trail_.clear();
}

} // namespace gv
