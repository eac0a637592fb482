#include "index/spatial_index.hpp"
#include <algorithm>
#include <stdexcept>

namespace gv {

SpatialIndex::SpatialIndex(const SpatialIndexConfig& config)
    : config_(config) {
    if (!config_.world_bounds.is_valid()) {
        throw std::invalid_argument("Spatial index world bounds are inverted");
    }
    if (config_.max_nodes_per_region == 0) {
        throw std::invalid_argument("Spatial index region capacity must be positive");
    }
    reset_root();
}

void SpatialIndex::reset_root() {
    regions_.clear();
    owner_.clear();
    max_depth_reached_ = 0;

    Region root;
    root.bounds = config_.world_bounds;
    root.depth = 0;
    regions_.push_back(std::move(root));
}

// ==========================================
// Mutation
// ==========================================

bool SpatialIndex::insert(const GraphNode& node) {
    if (!config_.world_bounds.contains(node.x, node.y)) {
        return false;
    }

    // Last write wins: a re-fetched node replaces the stored copy
    if (contains(node.id)) {
        remove(node.id);
    }

    insert_into(0, node);
    return true;
}

bool SpatialIndex::remove(const std::string& node_id) {
    auto it = owner_.find(node_id);
    if (it == owner_.end()) {
        return false;
    }

    auto& entries = regions_[it->second].entries;
    entries.erase(
        std::remove_if(entries.begin(), entries.end(),
            [&](const GraphNode& n) { return n.id == node_id; }),
        entries.end()
    );

    owner_.erase(it);
    return true;
}

void SpatialIndex::clear() {
    reset_root();
}

void SpatialIndex::insert_into(int region_index, GraphNode node) {
    int idx = region_index;

    while (true) {
        Region& region = regions_[idx];

        if (region.is_leaf()) {
            if (region.entries.size() < config_.max_nodes_per_region ||
                region.depth >= config_.max_depth) {
                owner_[node.id] = idx;
                region.entries.push_back(std::move(node));
                return;
            }
            subdivide(idx);
        }

        idx = child_for(idx, node.x, node.y);
    }
}

void SpatialIndex::subdivide(int region_index) {
    // Copy what we need: push_back below may reallocate regions_
    const BoundingBox b = regions_[region_index].bounds;
    const int child_depth = regions_[region_index].depth + 1;
    const double mid_x = b.center_x();
    const double mid_y = b.center_y();

    const BoundingBox quadrants[4] = {
        BoundingBox(b.min_x, b.min_y, mid_x, mid_y),
        BoundingBox(mid_x, b.min_y, b.max_x, mid_y),
        BoundingBox(b.min_x, mid_y, mid_x, b.max_y),
        BoundingBox(mid_x, mid_y, b.max_x, b.max_y)
    };

    const int first_child = static_cast<int>(regions_.size());
    for (const auto& q : quadrants) {
        Region child;
        child.bounds = q;
        child.depth = child_depth;
        regions_.push_back(std::move(child));
    }

    std::vector<GraphNode> entries = std::move(regions_[region_index].entries);
    regions_[region_index].entries.clear();
    regions_[region_index].first_child = first_child;
    max_depth_reached_ = std::max(max_depth_reached_, child_depth);

    for (auto& entry : entries) {
        int child = child_for(region_index, entry.x, entry.y);
        insert_into(child, std::move(entry));
    }
}

int SpatialIndex::child_for(int region_index, double x, double y) const {
    const int first = regions_[region_index].first_child;
    for (int i = 0; i < 4; ++i) {
        if (regions_[first + i].bounds.contains(x, y)) {
            return first + i;
        }
    }

    // Unreachable for points inside the parent; fall back on the midpoint test
    const BoundingBox& b = regions_[region_index].bounds;
    int quadrant = (x > b.center_x() ? 1 : 0) + (y > b.center_y() ? 2 : 0);
    return first + quadrant;
}

// ==========================================
// Queries
// ==========================================

std::vector<int> SpatialIndex::leaves_intersecting(const BoundingBox& bounds) const {
    std::vector<int> leaves;
    std::vector<int> stack = {0};

    while (!stack.empty()) {
        int idx = stack.back();
        stack.pop_back();

        const Region& region = regions_[idx];
        if (!region.bounds.intersects(bounds)) {
            continue;
        }

        if (region.is_leaf()) {
            leaves.push_back(idx);
        } else {
            // Push in reverse so children are visited in quadrant order
            for (int i = 3; i >= 0; --i) {
                stack.push_back(region.first_child + i);
            }
        }
    }

    return leaves;
}

std::vector<GraphNode> SpatialIndex::query(const BoundingBox& bounds) const {
    std::vector<GraphNode> result;

    for (int leaf : leaves_intersecting(bounds)) {
        for (const auto& node : regions_[leaf].entries) {
            if (bounds.contains(node.x, node.y)) {
                result.push_back(node);
            }
        }
    }

    return result;
}

std::vector<std::string> SpatialIndex::query_ids(const BoundingBox& bounds) const {
    std::vector<std::string> result;

    for (int leaf : leaves_intersecting(bounds)) {
        for (const auto& node : regions_[leaf].entries) {
            if (bounds.contains(node.x, node.y)) {
                result.push_back(node.id);
            }
        }
    }

    return result;
}

void SpatialIndex::visit(const BoundingBox& bounds, const std::function<void(GraphNode&)>& fn) {
    for (int leaf : leaves_intersecting(bounds)) {
        for (auto& node : regions_[leaf].entries) {
            if (bounds.contains(node.x, node.y)) {
                fn(node);
            }
        }
    }
}

const GraphNode* SpatialIndex::find(const std::string& node_id) const {
    auto it = owner_.find(node_id);
    if (it == owner_.end()) {
        return nullptr;
    }

    for (const auto& node : regions_[it->second].entries) {
        if (node.id == node_id) {
            return &node;
        }
    }
    return nullptr;
}

GraphNode* SpatialIndex::find(const std::string& node_id) {
    return const_cast<GraphNode*>(static_cast<const SpatialIndex&>(*this).find(node_id));
}

} // namespace gv
