#include "core/engine_config.hpp"
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

namespace gv {

namespace {

json lod_tier_to_json(const LodTier& tier) {
    return {
        {"zoom", tier.zoom},
        {"max_nodes", tier.max_nodes},
        // -1 stands for "every level" on disk
        {"skip_level", tier.skip_level == LodTier::ALL_LEVELS ? -1 : tier.skip_level}
    };
}

LodTier lod_tier_from_json(const json& j) {
    LodTier tier;
    tier.zoom = j.at("zoom").get<double>();
    tier.max_nodes = j.at("max_nodes").get<size_t>();
    int skip = j.value("skip_level", -1);
    tier.skip_level = skip < 0 ? LodTier::ALL_LEVELS : skip;
    return tier;
}

bool env_flag(const char* value) {
    std::string v(value);
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

}  // namespace

// ============================================================================
// EngineConfig
// ============================================================================

json EngineConfig::to_json() const {
    json j;

    j["verbose"] = verbose;

    j["spatial"] = {
        {"world_bounds", spatial.world_bounds.to_json()},
        {"max_depth", spatial.max_depth},
        {"max_nodes_per_region", spatial.max_nodes_per_region}
    };

    json tiers = json::array();
    for (const auto& tier : virtualization.lod_tiers) {
        tiers.push_back(lod_tier_to_json(tier));
    }
    j["virtualization"] = {
        {"buffer_zone", virtualization.buffer_zone},
        {"max_visible_nodes", virtualization.max_visible_nodes},
        {"level_of_detail_enabled", virtualization.level_of_detail_enabled},
        {"render_time_window", virtualization.render_time_window},
        {"lod_tiers", tiers}
    };

    j["streaming"] = {
        {"chunk_size", streaming.chunk_size},
        {"max_concurrent_chunks", streaming.max_concurrent_chunks},
        {"prefetch_distance", streaming.prefetch_distance},
        {"compression_enabled", streaming.compression_enabled},
        {"cache_expiration_ms", streaming.cache_expiration_ms},
        {"cleanup_interval_ms", streaming.cleanup_interval_ms},
        {"data_source_url", streaming.data_source_url}
    };

    j["edge_cases"] = {
        {"max_circular_depth", edge_cases.max_circular_depth},
        {"max_retry_attempts", edge_cases.max_retry_attempts},
        {"retry_delay_ms", edge_cases.retry_delay_ms},
        {"retry_backoff", edge_cases.retry_backoff},
        {"network_timeout_ms", edge_cases.network_timeout_ms},
        {"race_condition_timeout_ms", edge_cases.race_condition_timeout_ms},
        {"cleanup_delay_ms", edge_cases.cleanup_delay_ms},
        {"failure_max_age_ms", edge_cases.failure_max_age_ms},
        {"navigation_priority", edge_cases.navigation_priority}
    };

    return j;
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    if (j.contains("spatial")) {
        const auto& s = j["spatial"];
        if (s.contains("world_bounds")) config.spatial.world_bounds = BoundingBox::from_json(s["world_bounds"]);
        if (s.contains("max_depth")) config.spatial.max_depth = s["max_depth"];
        if (s.contains("max_nodes_per_region")) config.spatial.max_nodes_per_region = s["max_nodes_per_region"];
    }

    if (j.contains("virtualization")) {
        const auto& v = j["virtualization"];
        if (v.contains("buffer_zone")) config.virtualization.buffer_zone = v["buffer_zone"];
        if (v.contains("max_visible_nodes")) config.virtualization.max_visible_nodes = v["max_visible_nodes"];
        if (v.contains("level_of_detail_enabled")) config.virtualization.level_of_detail_enabled = v["level_of_detail_enabled"];
        if (v.contains("render_time_window")) config.virtualization.render_time_window = v["render_time_window"];
        if (v.contains("lod_tiers")) {
            config.virtualization.lod_tiers.clear();
            for (const auto& tier : v["lod_tiers"]) {
                config.virtualization.lod_tiers.push_back(lod_tier_from_json(tier));
            }
        }
    }

    if (j.contains("streaming")) {
        const auto& s = j["streaming"];
        if (s.contains("chunk_size")) config.streaming.chunk_size = s["chunk_size"];
        if (s.contains("max_concurrent_chunks")) config.streaming.max_concurrent_chunks = s["max_concurrent_chunks"];
        if (s.contains("prefetch_distance")) config.streaming.prefetch_distance = s["prefetch_distance"];
        if (s.contains("compression_enabled")) config.streaming.compression_enabled = s["compression_enabled"];
        if (s.contains("cache_expiration_ms")) config.streaming.cache_expiration_ms = s["cache_expiration_ms"];
        if (s.contains("cleanup_interval_ms")) config.streaming.cleanup_interval_ms = s["cleanup_interval_ms"];
        if (s.contains("data_source_url")) config.streaming.data_source_url = s["data_source_url"].get<std::string>();
    }

    if (j.contains("edge_cases")) {
        const auto& e = j["edge_cases"];
        if (e.contains("max_circular_depth")) config.edge_cases.max_circular_depth = e["max_circular_depth"];
        if (e.contains("max_retry_attempts")) config.edge_cases.max_retry_attempts = e["max_retry_attempts"];
        if (e.contains("retry_delay_ms")) config.edge_cases.retry_delay_ms = e["retry_delay_ms"];
        if (e.contains("retry_backoff")) config.edge_cases.retry_backoff = e["retry_backoff"];
        if (e.contains("network_timeout_ms")) config.edge_cases.network_timeout_ms = e["network_timeout_ms"];
        if (e.contains("race_condition_timeout_ms")) config.edge_cases.race_condition_timeout_ms = e["race_condition_timeout_ms"];
        if (e.contains("cleanup_delay_ms")) config.edge_cases.cleanup_delay_ms = e["cleanup_delay_ms"];
        if (e.contains("failure_max_age_ms")) config.edge_cases.failure_max_age_ms = e["failure_max_age_ms"];
        if (e.contains("navigation_priority")) config.edge_cases.navigation_priority = e["navigation_priority"];
    }

    if (j.contains("verbose")) {
        config.verbose = j["verbose"];
        config.virtualization.verbose = config.verbose;
        config.streaming.verbose = config.verbose;
        config.edge_cases.verbose = config.verbose;
    }

    return config;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    return from_json(j);
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    const char* url = std::getenv("GV_DATA_SOURCE_URL");
    if (url) config.streaming.data_source_url = url;

    const char* chunk_size = std::getenv("GV_CHUNK_SIZE");
    if (chunk_size) config.streaming.chunk_size = std::stod(chunk_size);

    const char* max_chunks = std::getenv("GV_MAX_CONCURRENT_CHUNKS");
    if (max_chunks) config.streaming.max_concurrent_chunks = std::stoi(max_chunks);

    const char* timeout = std::getenv("GV_NETWORK_TIMEOUT_MS");
    if (timeout) config.edge_cases.network_timeout_ms = std::stoll(timeout);

    const char* verbose = std::getenv("GV_VERBOSE");
    if (verbose && env_flag(verbose)) {
        config.verbose = true;
        config.virtualization.verbose = true;
        config.streaming.verbose = true;
        config.edge_cases.verbose = true;
    }

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (!spatial.world_bounds.is_valid()) {
        error_message = "World bounds must have min <= max on both axes";
        return false;
    }

    if (spatial.max_depth < 0) {
        error_message = "Spatial index max depth must not be negative";
        return false;
    }

    if (spatial.max_nodes_per_region == 0) {
        error_message = "Spatial index region capacity must be positive";
        return false;
    }

    if (virtualization.buffer_zone < 0.0) {
        error_message = "Buffer zone must not be negative";
        return false;
    }

    if (virtualization.level_of_detail_enabled && virtualization.lod_tiers.empty()) {
        error_message = "Level of detail is enabled but no LOD tiers are defined";
        return false;
    }

    for (size_t i = 1; i < virtualization.lod_tiers.size(); ++i) {
        if (virtualization.lod_tiers[i].zoom >= virtualization.lod_tiers[i - 1].zoom) {
            error_message = "LOD tiers must be ordered by strictly decreasing zoom";
            return false;
        }
    }

    if (streaming.chunk_size <= 0.0) {
        error_message = "Chunk size must be positive";
        return false;
    }

    if (streaming.max_concurrent_chunks < 1) {
        error_message = "At least one concurrent chunk load is required";
        return false;
    }

    if (streaming.prefetch_distance < 0) {
        error_message = "Prefetch distance must not be negative";
        return false;
    }

    if (streaming.cache_expiration_ms <= 0) {
        error_message = "Cache expiration must be positive";
        return false;
    }

    if (edge_cases.max_retry_attempts < 1) {
        error_message = "At least one request attempt is required";
        return false;
    }

    if (edge_cases.retry_backoff < 1.0) {
        error_message = "Retry backoff must be >= 1.0";
        return false;
    }

    if (edge_cases.network_timeout_ms <= 0 || edge_cases.race_condition_timeout_ms <= 0) {
        error_message = "Timeouts must be positive";
        return false;
    }

    if (edge_cases.max_circular_depth < 1) {
        error_message = "Max circular depth must be at least 1";
        return false;
    }

    return true;
}

// ============================================================================
// Utility Functions
// ============================================================================

EngineConfig create_default_config() {
    return EngineConfig{};
}

EngineConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    paths_to_try.push_back(".gv_config.json");       // Current directory
    paths_to_try.push_back("../.gv_config.json");    // From build/

    for (const auto& path : paths_to_try) {
        std::ifstream probe(path);
        if (!probe.is_open()) {
            continue;
        }
        probe.close();

        try {
            return EngineConfig::from_json_file(path);
        } catch (const std::exception& e) {
            std::cerr << "Ignoring unreadable config " << path << ": " << e.what() << "\n";
        }
    }

    return EngineConfig::from_environment();
}

} // namespace gv
