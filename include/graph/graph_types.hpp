#ifndef GRAPH_TYPES_HPP
#define GRAPH_TYPES_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace gv {

/**
 * @brief Axis-aligned rectangle in graph-layout coordinates
 *
 * All containment and intersection tests are inclusive on every side.
 */
struct BoundingBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    BoundingBox() = default;
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool is_valid() const { return min_x <= max_x && min_y <= max_y; }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double center_x() const { return (min_x + max_x) / 2.0; }
    double center_y() const { return (min_y + max_y) / 2.0; }

    bool contains(double x, double y) const {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }

    bool intersects(const BoundingBox& other) const {
        return !(other.max_x < min_x || other.min_x > max_x ||
                 other.max_y < min_y || other.min_y > max_y);
    }

    /**
     * @brief Grow the box by margin on every side
     */
    BoundingBox expanded(double margin) const {
        return BoundingBox(min_x - margin, min_y - margin, max_x + margin, max_y + margin);
    }

    bool operator==(const BoundingBox& o) const {
        return min_x == o.min_x && min_y == o.min_y && max_x == o.max_x && max_y == o.max_y;
    }
    bool operator!=(const BoundingBox& o) const { return !(*this == o); }

    nlohmann::json to_json() const;
    static BoundingBox from_json(const nlohmann::json& j);
};

/**
 * @brief A positioned graph node (account, program, transaction...)
 *
 * Owned by the SpatialIndex once inserted. Only the ViewportVirtualizer
 * flips is_visible and last_render_time.
 */
struct GraphNode {
    std::string id;                                    // Unique identifier
    double x = 0.0;                                    // Layout position
    double y = 0.0;
    int level = 0;                                     // Importance tier, 0 = most important
    std::vector<std::string> connections;              // Ordered neighbor ids
    bool is_visible = false;
    int64_t last_render_time = 0;                      // Milliseconds on the session clock

    // Opaque payload from the data source; never interpreted by the core
    nlohmann::json data;

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief Edge between two nodes; visible iff both endpoints are visible
 */
struct GraphEdge {
    std::string id;
    std::string source;
    std::string target;
    bool is_visible = false;

    nlohmann::json data;

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);

    /**
     * @brief Id used for edges derived from GraphNode::connections
     */
    static std::string derived_id(const std::string& source, const std::string& target) {
        return source + "-" + target;
    }
};

/**
 * @brief Payload returned by a data source for one chunk
 */
struct ChunkData {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    /**
     * @brief Parse {"nodes": [...], "edges": [...]}; missing arrays are empty
     */
    static ChunkData from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

/**
 * @brief Fixed-size spatial cell of graph data, loaded and evicted as a unit
 */
struct DataChunk {
    std::string id;
    BoundingBox bounds;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    bool is_loaded = false;
    bool is_loading = false;
    double priority = 0.0;
    std::chrono::steady_clock::time_point loaded_at{};
    int attempts = 0;                                  // Number of launched fetches
    std::string last_error;                            // Set when the last fetch failed

    nlohmann::json to_json() const;
};

} // namespace gv

#endif // GRAPH_TYPES_HPP
