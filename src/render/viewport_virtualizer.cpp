#include "render/viewport_virtualizer.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace gv {

ViewportVirtualizer::ViewportVirtualizer(
    SpatialIndex& index,
    const VirtualizationConfig& config,
    const Clock& clock
) : index_(index), config_(config), clock_(clock) {
    if (config_.level_of_detail_enabled && config_.lod_tiers.empty()) {
        throw std::invalid_argument("Level of detail is enabled but no LOD tiers are defined");
    }
}

const LodTier& ViewportVirtualizer::select_tier(const std::vector<LodTier>& tiers, double zoom) {
    static const LodTier unrestricted{0.0, std::numeric_limits<size_t>::max(), LodTier::ALL_LEVELS};
    if (tiers.empty()) {
        return unrestricted;
    }

    for (const auto& tier : tiers) {
        if (zoom >= tier.zoom) {
            return tier;
        }
    }
    return tiers.back();
}

void ViewportVirtualizer::update_viewport(
    double x,
    double y,
    double width,
    double height,
    double zoom
) {
    zoom_ = zoom;
    viewport_ = BoundingBox(x, y, x + std::max(0.0, width), y + std::max(0.0, height));
    expanded_ = viewport_.expanded(config_.buffer_zone);
    has_viewport_ = true;

    refresh();
}

void ViewportVirtualizer::refresh() {
    if (!has_viewport_) {
        return;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    // Candidate pointers stay valid: nothing below inserts into or removes from the index
    std::vector<GraphNode*> candidates;
    index_.visit(expanded_, [&](GraphNode& node) { candidates.push_back(&node); });

    std::vector<GraphNode*> survivors = apply_level_of_detail(std::move(candidates));

    std::unordered_set<std::string> next_visible;
    next_visible.reserve(survivors.size());
    for (const auto* node : survivors) {
        next_visible.insert(node->id);
    }

    // Clear flags on nodes that dropped out, wherever they are now
    for (const auto& id : visible_nodes_) {
        if (next_visible.count(id) == 0) {
            if (GraphNode* node = index_.find(id)) {
                node->is_visible = false;
            }
        }
    }

    const int64_t now_ms = clock_.now_ms();
    for (auto* node : survivors) {
        node->is_visible = true;
        node->last_render_time = now_ms;
    }

    visible_nodes_ = std::move(next_visible);
    recompute_edges();

    ++update_count_;

    auto end_time = std::chrono::high_resolution_clock::now();
    record_render_time(std::chrono::duration<double, std::milli>(end_time - start_time).count());

    if (config_.verbose) {
        std::cout << "Viewport [" << viewport_.min_x << ", " << viewport_.min_y << " .. "
                  << viewport_.max_x << ", " << viewport_.max_y << "] zoom " << zoom_
                  << ": " << visible_nodes_.size() << " nodes, "
                  << visible_edges_.size() << " edges visible\n";
    }
}

void ViewportVirtualizer::clear() {
    for (const auto& id : visible_nodes_) {
        if (GraphNode* node = index_.find(id)) {
            node->is_visible = false;
        }
    }

    visible_nodes_.clear();
    visible_edges_.clear();
    edges_.clear();
    incident_.clear();
    render_times_ms_.clear();

    viewport_ = BoundingBox();
    expanded_ = BoundingBox();
    zoom_ = 1.0;
    has_viewport_ = false;
    update_count_ = 0;
}

std::vector<GraphNode*> ViewportVirtualizer::apply_level_of_detail(
    std::vector<GraphNode*> nodes
) const {
    size_t cap = config_.max_visible_nodes;

    if (config_.level_of_detail_enabled) {
        const LodTier& tier = current_tier();

        nodes.erase(
            std::remove_if(nodes.begin(), nodes.end(), [&](const GraphNode* node) {
                // Level-0 anchors survive at every zoom
                if (node->level == 0) return false;
                return node->level > tier.skip_level;
            }),
            nodes.end()
        );

        cap = std::min(cap, tier.max_nodes);
    }

    std::sort(nodes.begin(), nodes.end(), [](const GraphNode* a, const GraphNode* b) {
        if (a->level != b->level) return a->level < b->level;
        return a->id < b->id;
    });

    if (nodes.size() > cap) {
        nodes.resize(cap);
    }

    return nodes;
}

void ViewportVirtualizer::recompute_edges() {
    for (const auto& id : visible_edges_) {
        auto it = edges_.find(id);
        if (it != edges_.end()) {
            it->second.is_visible = false;
        }
    }
    visible_edges_.clear();

    for (const auto& node_id : visible_nodes_) {
        // Explicit edges registered from chunk payloads
        auto inc = incident_.find(node_id);
        if (inc != incident_.end()) {
            for (const auto& edge_id : inc->second) {
                auto edge_it = edges_.find(edge_id);
                if (edge_it == edges_.end()) continue;

                GraphEdge& edge = edge_it->second;
                if (visible_nodes_.count(edge.source) && visible_nodes_.count(edge.target)) {
                    edge.is_visible = true;
                    visible_edges_.insert(edge.id);
                }
            }
        }

        // Edges implied by node connections
        const GraphNode* node = index_.find(node_id);
        if (!node) continue;

        for (const auto& connection : node->connections) {
            if (visible_nodes_.count(connection)) {
                std::string edge_id = GraphEdge::derived_id(node_id, connection);
                visible_edges_.insert(edge_id);

                auto edge_it = edges_.find(edge_id);
                if (edge_it != edges_.end()) {
                    edge_it->second.is_visible = true;
                }
            }
        }
    }
}

// ==========================================
// Edge registry
// ==========================================

void ViewportVirtualizer::add_edges(const std::vector<GraphEdge>& edges) {
    for (const auto& edge : edges) {
        if (edges_.count(edge.id)) {
            remove_edges({edge.id});
        }

        GraphEdge stored = edge;
        stored.is_visible = false;
        edges_[stored.id] = stored;

        incident_[stored.source].push_back(stored.id);
        if (stored.target != stored.source) {
            incident_[stored.target].push_back(stored.id);
        }
    }
}

void ViewportVirtualizer::remove_edges(const std::vector<std::string>& edge_ids) {
    for (const auto& edge_id : edge_ids) {
        auto it = edges_.find(edge_id);
        if (it == edges_.end()) continue;

        for (const auto& endpoint : {it->second.source, it->second.target}) {
            auto inc = incident_.find(endpoint);
            if (inc == incident_.end()) continue;

            auto& ids = inc->second;
            ids.erase(std::remove(ids.begin(), ids.end(), edge_id), ids.end());
            if (ids.empty()) {
                incident_.erase(inc);
            }
        }

        visible_edges_.erase(edge_id);
        edges_.erase(it);
    }
}

const GraphEdge* ViewportVirtualizer::find_edge(const std::string& edge_id) const {
    auto it = edges_.find(edge_id);
    return it != edges_.end() ? &it->second : nullptr;
}

void ViewportVirtualizer::forget_nodes(const std::vector<std::string>& node_ids) {
    for (const auto& id : node_ids) {
        visible_nodes_.erase(id);
    }
}

// ==========================================
// Metrics
// ==========================================

void ViewportVirtualizer::record_render_time(double ms) {
    render_times_ms_.push_back(ms);
    while (render_times_ms_.size() > std::max<size_t>(1, config_.render_time_window)) {
        render_times_ms_.pop_front();
    }
}

double ViewportVirtualizer::average_render_time_ms() const {
    if (render_times_ms_.empty()) {
        return 0.0;
    }
    double total = std::accumulate(render_times_ms_.begin(), render_times_ms_.end(), 0.0);
    return total / static_cast<double>(render_times_ms_.size());
}

} // namespace gv
