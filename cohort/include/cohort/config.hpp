#pragma once
// Catalog configuration
//
// Plain defaults; optionally overridden from a JSON document:
//   {
//     "id_length": 36, "kind_length": 55, "location_length": 511,
//     "normalize_locations": true,
//     "default_concurrency": 1,
//     "verbose": false
//   }

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>

namespace cohort {

using json = nlohmann::json;

struct CatalogConfig {
    FieldLimits limits;                 // Encoded width of id/kind/location
    bool normalize_locations = true;    // Store absolute, lexically normal paths
    size_t default_concurrency = 1;     // map() workers when 0 is requested
    bool verbose = false;               // Log resolution detail

    static CatalogConfig from_json(const json& j) {
        CatalogConfig cfg;
        if (!j.is_object()) {
            throw ConfigError("catalog config must be a JSON object");
        }
        cfg.limits.id_length = read_count(j, "id_length", cfg.limits.id_length);
        cfg.limits.kind_length = read_count(j, "kind_length", cfg.limits.kind_length);
        cfg.limits.location_length = read_count(j, "location_length", cfg.limits.location_length);
        cfg.default_concurrency = read_count(j, "default_concurrency", cfg.default_concurrency);
        try {
            cfg.normalize_locations = j.value("normalize_locations", cfg.normalize_locations);
            cfg.verbose = j.value("verbose", cfg.verbose);
        } catch (const json::type_error& e) {
            throw ConfigError(std::string("catalog config: ") + e.what());
        }
        return cfg;
    }

    json to_json() const {
        return {
            {"id_length", limits.id_length},
            {"kind_length", limits.kind_length},
            {"location_length", limits.location_length},
            {"normalize_locations", normalize_locations},
            {"default_concurrency", default_concurrency},
            {"verbose", verbose}
        };
    }

    // Positive integer field; anything else (negative, zero, fractional,
    // non-numeric) is rejected rather than converted
    static size_t read_count(const json& j, const char* key, size_t fallback) {
        auto it = j.find(key);
        if (it == j.end()) return fallback;

        if (it->is_number_unsigned()) {
            uint64_t v = it->get<uint64_t>();
            if (v >= 1) return static_cast<size_t>(v);
        } else if (it->is_number_integer()) {
            int64_t v = it->get<int64_t>();
            if (v >= 1) return static_cast<size_t>(v);
        } else {
            throw ConfigError(std::string("catalog config: ") + key + " must be an integer");
        }
        throw ConfigError(std::string("catalog config: ") + key + " must be at least 1");
    }

    // Load from a JSON file. On failure out is left untouched.
    static bool load(const std::string& path, CatalogConfig& out) {
        std::ifstream in(path);
        if (!in) {
            log::warn("CatalogConfig", "Cannot open " + path);
            return false;
        }
        try {
            out = from_json(json::parse(in));
        } catch (const json::parse_error& e) {
            log::warn("CatalogConfig", "Parse error in " + path + ": " + e.what());
            return false;
        } catch (const ConfigError& e) {
            log::warn("CatalogConfig", e.what());
            return false;
        }
        return true;
    }

    // Defaults, overridden by the file named in COHORT_CONFIG if set
    static CatalogConfig from_env() {
        CatalogConfig cfg;
        if (const char* path = std::getenv("COHORT_CONFIG")) {
            if (!load(path, cfg)) {
                log::warn("CatalogConfig", "Falling back to defaults");
            }
        }
        return cfg;
    }
};

} // namespace cohort
