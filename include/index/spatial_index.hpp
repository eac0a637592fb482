#pragma once

#include "graph/graph_types.hpp"
#include "core/engine_config.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>

namespace gv {

/**
 * @brief Quadtree over 2D node positions
 *
 * Regions live in a flat arena and reference their children by index, so
 * there are no parent/child ownership cycles. A split region keeps its four
 * children contiguous starting at first_child, in the order lower-left,
 * lower-right, upper-left, upper-right. Entries are routed to the first
 * child whose inclusive bounds contain them, which keeps membership of
 * boundary points unique.
 *
 * Not thread-safe; owned and mutated by the session's owner thread.
 */
class SpatialIndex {
public:
    explicit SpatialIndex(const SpatialIndexConfig& config = SpatialIndexConfig{});

    // ==========================================
    // Mutation
    // ==========================================

    /**
     * @brief Insert a node, replacing any stored node with the same id
     * @return false if the node lies outside the world bounds
     */
    bool insert(const GraphNode& node);

    /**
     * @brief Remove a node by id
     * @return true if the node was present
     */
    bool remove(const std::string& node_id);

    /**
     * @brief Drop every node and collapse the tree back to a single leaf
     */
    void clear();

    // ==========================================
    // Queries
    // ==========================================

    /**
     * @brief Copies of all nodes whose position lies inside bounds
     */
    std::vector<GraphNode> query(const BoundingBox& bounds) const;

    /**
     * @brief Ids of all nodes whose position lies inside bounds
     */
    std::vector<std::string> query_ids(const BoundingBox& bounds) const;

    /**
     * @brief Call fn on every stored node inside bounds
     *
     * fn may modify the node but must not move it or touch the index.
     */
    void visit(const BoundingBox& bounds, const std::function<void(GraphNode&)>& fn);

    const GraphNode* find(const std::string& node_id) const;
    GraphNode* find(const std::string& node_id);

    bool contains(const std::string& node_id) const {
        return owner_.find(node_id) != owner_.end();
    }

    // ==========================================
    // Introspection
    // ==========================================

    size_t size() const { return owner_.size(); }
    bool empty() const { return owner_.empty(); }
    size_t region_count() const { return regions_.size(); }
    int max_depth_reached() const { return max_depth_reached_; }
    const BoundingBox& bounds() const { return config_.world_bounds; }
    const SpatialIndexConfig& config() const { return config_; }

private:
    struct Region {
        BoundingBox bounds;
        int depth = 0;
        int first_child = -1;               // -1 while the region is a leaf
        std::vector<GraphNode> entries;

        bool is_leaf() const { return first_child < 0; }
    };

    SpatialIndexConfig config_;
    std::vector<Region> regions_;                       // regions_[0] is the root
    std::unordered_map<std::string, int> owner_;        // node id -> leaf region index
    int max_depth_reached_ = 0;

    void reset_root();

    /**
     * @brief Route node down from region_index and store it in a leaf
     */
    void insert_into(int region_index, GraphNode node);

    /**
     * @brief Turn a full leaf into four quadrants and redistribute its entries
     */
    void subdivide(int region_index);

    /**
     * @brief Index of the first child of a split region containing (x, y)
     */
    int child_for(int region_index, double x, double y) const;

    /**
     * @brief Leaf regions whose rectangle intersects bounds
     */
    std::vector<int> leaves_intersecting(const BoundingBox& bounds) const;
};

} // namespace gv
