#include "io/geojson_reader.hpp"
#include "io/coordinate_system_utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <optional>

namespace zonefind {
namespace io {

std::string GeoJSONReader::last_error_ = "";

geo::GeospatialDataset GeoJSONReader::readFromFile(const std::string& filepath) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file: " + filepath);
            throw std::runtime_error(last_error_);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        file.close();

        return readFromString(buffer.str());

    } catch (const std::exception& e) {
        setError("Error reading file " + filepath + ": " + e.what());
        throw std::runtime_error(last_error_);
    }
}

geo::GeospatialDataset GeoJSONReader::readFromString(const std::string& geojson_string) {
    try {
        return readFromJson(nlohmann::json::parse(geojson_string));

    } catch (const nlohmann::json::parse_error& e) {
        setError("JSON parse error: " + std::string(e.what()));
        throw std::runtime_error(last_error_);
    }
}

geo::GeospatialDataset GeoJSONReader::readFromJson(const nlohmann::json& geojson) {
    try {
        // Validate that this is a FeatureCollection
        if (!geojson.is_object() || !geojson.contains("type") || geojson["type"] != "FeatureCollection") {
            setError("Invalid GeoJSON: Expected FeatureCollection type");
            throw std::runtime_error(last_error_);
        }

        // Parse CRS information
        std::string crs = parseCRS(geojson);

        // Zoning and street layers are queried with WGS84 clicks
        if (!CoordinateSystemUtils::isWGS84(crs)) {
            setError("Coordinate system must be WGS84 (EPSG:4326), found " + crs);
            throw std::runtime_error(last_error_);
        }

        // Parse features
        std::vector<geo::GeospatialFeature> features;
        size_t skipped = 0;
        if (geojson.contains("features") && geojson["features"].is_array()) {
            size_t featureIndex = 0;
            for (const auto& feature_json : geojson["features"]) {
                auto feature = parseFeature(feature_json, featureIndex);
                if (feature.has_value()) {
                    features.push_back(feature.value());
                } else {
                    skipped++;
                }
                featureIndex++;
            }
        }

        if (skipped > 0) {
            std::cerr << "Warning: Skipped " << skipped << " features without geometry" << std::endl;
        }

        return geo::GeospatialDataset(crs, features);

    } catch (const std::exception& e) {
        setError("Error parsing GeoJSON: " + std::string(e.what()));
        throw std::runtime_error(last_error_);
    }
}

std::string GeoJSONReader::parseCRS(const nlohmann::json& geojson) {
    try {
        if (geojson.contains("crs") && geojson["crs"].is_object()) {
            const auto& crs_obj = geojson["crs"];

            // Handle standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:4326"}}
            if (crs_obj.contains("type") && crs_obj["type"] == "name" &&
                crs_obj.contains("properties") && crs_obj["properties"].is_object() &&
                crs_obj["properties"].contains("name")) {
                return crs_obj["properties"]["name"].get<std::string>();
            }

            // Handle legacy CRS format: {"type": "EPSG", "properties": {"code": 4326}}
            if (crs_obj.contains("type") && crs_obj["type"] == "EPSG" &&
                crs_obj.contains("properties") && crs_obj["properties"].is_object() &&
                crs_obj["properties"].contains("code")) {
                int code = crs_obj["properties"]["code"].get<int>();
                return "EPSG:" + std::to_string(code);
            }
        }

        // No CRS found, return empty string
        return "";

    } catch (const std::exception& e) {
        setError("Error parsing CRS: " + std::string(e.what()));
        return "";
    }
}

std::optional<geo::GeospatialFeature> GeoJSONReader::parseFeature(const nlohmann::json& feature_json, size_t id) {
    // Anything that is not a Feature with a geometry object is skipped, not fatal
    if (!feature_json.is_object() || !feature_json.contains("type") || feature_json["type"] != "Feature") {
        return std::nullopt;
    }

    if (!feature_json.contains("geometry") || !feature_json["geometry"].is_object()) {
        return std::nullopt;
    }

    // Extract properties - if not present or null, use empty object
    nlohmann::json properties = nlohmann::json::object();
    if (feature_json.contains("properties") && feature_json["properties"].is_object()) {
        properties = feature_json["properties"];
    }

    return geo::GeospatialFeature(id, feature_json["geometry"], properties);
}

} // namespace io
} // namespace zonefind
