#pragma once

#include "graph/graph_types.hpp"
#include "index/spatial_index.hpp"
#include "core/engine_config.hpp"
#include "core/clock.hpp"
#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace gv {

/**
 * @brief Computes the visible, level-of-detail filtered element set
 *
 * Each viewport update queries the SpatialIndex with the viewport grown by
 * the buffer zone, keeps level-0 anchors plus whatever the matching LOD
 * tier allows, and caps the result so frame cost is bounded by the tier's
 * max_nodes regardless of graph size. This is the only component that
 * writes GraphNode::is_visible, GraphNode::last_render_time and
 * GraphEdge::is_visible.
 */
class ViewportVirtualizer {
public:
    ViewportVirtualizer(
        SpatialIndex& index,
        const VirtualizationConfig& config = VirtualizationConfig{},
        const Clock& clock = SteadyClock::instance()
    );

    /**
     * @brief Recompute the visible set for a new pan/zoom
     *
     * @param x Left edge of the viewport in layout coordinates
     * @param y Top edge of the viewport in layout coordinates
     * @param width Viewport width
     * @param height Viewport height
     * @param zoom Current zoom factor (1.0 = native)
     */
    void update_viewport(double x, double y, double width, double height, double zoom);

    /**
     * @brief Recompute for the current viewport (after nodes were added or removed)
     */
    void refresh();

    /**
     * @brief Drop the viewport, edge registry and timing history
     */
    void clear();

    bool is_node_visible(const std::string& node_id) const {
        return visible_nodes_.count(node_id) > 0;
    }

    bool is_edge_visible(const std::string& edge_id) const {
        return visible_edges_.count(edge_id) > 0;
    }

    std::unordered_set<std::string> visible_nodes() const { return visible_nodes_; }
    std::unordered_set<std::string> visible_edges() const { return visible_edges_; }

    // ==========================================
    // Edge registry
    // ==========================================

    /**
     * @brief Register explicit edges (replaces edges with the same id)
     */
    void add_edges(const std::vector<GraphEdge>& edges);

    void remove_edges(const std::vector<std::string>& edge_ids);

    const GraphEdge* find_edge(const std::string& edge_id) const;

    size_t edge_count() const { return edges_.size(); }

    /**
     * @brief Drop ids that left the index from the visible sets
     */
    void forget_nodes(const std::vector<std::string>& node_ids);

    // ==========================================
    // State
    // ==========================================

    const BoundingBox& viewport() const { return viewport_; }
    const BoundingBox& expanded_viewport() const { return expanded_; }
    double zoom() const { return zoom_; }
    bool has_viewport() const { return has_viewport_; }

    /**
     * @brief LOD tier that applies at the current zoom
     */
    const LodTier& current_tier() const { return select_tier(config_.lod_tiers, zoom_); }

    /**
     * @brief First tier whose threshold the zoom meets; the last tier below all thresholds
     */
    static const LodTier& select_tier(const std::vector<LodTier>& tiers, double zoom);

    /**
     * @brief Mean duration of the recent recomputations in milliseconds
     */
    double average_render_time_ms() const;

    size_t update_count() const { return update_count_; }

private:
    SpatialIndex& index_;
    VirtualizationConfig config_;
    const Clock& clock_;

    BoundingBox viewport_;
    BoundingBox expanded_;
    double zoom_ = 1.0;
    bool has_viewport_ = false;

    std::unordered_set<std::string> visible_nodes_;
    std::unordered_set<std::string> visible_edges_;

    std::unordered_map<std::string, GraphEdge> edges_;                    // edge id -> edge
    std::unordered_map<std::string, std::vector<std::string>> incident_;  // node id -> edge ids

    std::deque<double> render_times_ms_;
    size_t update_count_ = 0;

    /**
     * @brief Level-of-detail filter, sort and cap
     */
    std::vector<GraphNode*> apply_level_of_detail(std::vector<GraphNode*> nodes) const;

    void recompute_edges();
    void record_render_time(double ms);
};

} // namespace gv
