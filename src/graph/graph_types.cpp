#include "graph/graph_types.hpp"
#include <stdexcept>

namespace gv {

// ==========================================
// BoundingBox Implementation
// ==========================================

nlohmann::json BoundingBox::to_json() const {
    return {
        {"min_x", min_x},
        {"min_y", min_y},
        {"max_x", max_x},
        {"max_y", max_y}
    };
}

BoundingBox BoundingBox::from_json(const nlohmann::json& j) {
    BoundingBox box(
        j.at("min_x").get<double>(),
        j.at("min_y").get<double>(),
        j.at("max_x").get<double>(),
        j.at("max_y").get<double>()
    );
    if (!box.is_valid()) {
        throw std::invalid_argument("Bounding box has min greater than max");
    }
    return box;
}

// ==========================================
// GraphNode Implementation
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["x"] = x;
    j["y"] = y;
    j["level"] = level;
    j["connections"] = connections;
    j["is_visible"] = is_visible;
    j["last_render_time"] = last_render_time;
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();
    node.x = j.value("x", 0.0);
    node.y = j.value("y", 0.0);
    node.level = j.value("level", 0);

    if (j.contains("connections")) {
        node.connections = j["connections"].get<std::vector<std::string>>();
    }
    if (j.contains("data")) {
        node.data = j["data"];
    }

    // Visibility is always recomputed locally, never trusted from the wire
    node.is_visible = false;
    node.last_render_time = 0;
    return node;
}

// ==========================================
// GraphEdge Implementation
// ==========================================

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["source"] = source;
    j["target"] = target;
    j["is_visible"] = is_visible;
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    edge.id = j.value("id", derived_id(edge.source, edge.target));
    if (j.contains("data")) {
        edge.data = j["data"];
    }
    return edge;
}

// ==========================================
// ChunkData / DataChunk
// ==========================================

ChunkData ChunkData::from_json(const nlohmann::json& j) {
    ChunkData data;

    if (j.contains("nodes") && j["nodes"].is_array()) {
        for (const auto& node_json : j["nodes"]) {
            data.nodes.push_back(GraphNode::from_json(node_json));
        }
    }

    if (j.contains("edges") && j["edges"].is_array()) {
        for (const auto& edge_json : j["edges"]) {
            data.edges.push_back(GraphEdge::from_json(edge_json));
        }
    }

    return data;
}

nlohmann::json ChunkData::to_json() const {
    nlohmann::json j;
    j["nodes"] = nlohmann::json::array();
    for (const auto& node : nodes) {
        j["nodes"].push_back(node.to_json());
    }
    j["edges"] = nlohmann::json::array();
    for (const auto& edge : edges) {
        j["edges"].push_back(edge.to_json());
    }
    return j;
}

nlohmann::json DataChunk::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["bounds"] = bounds.to_json();
    j["node_count"] = nodes.size();
    j["edge_count"] = edges.size();
    j["is_loaded"] = is_loaded;
    j["is_loading"] = is_loading;
    j["priority"] = priority;
    j["attempts"] = attempts;
    if (!last_error.empty()) {
        j["last_error"] = last_error;
    }
    return j;
}

} // namespace gv
