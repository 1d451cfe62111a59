#include "io/coordinate_system_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace zonefind {
namespace io {

namespace {

// Expand a running lon/lat extent with every position of a GeoJSON coordinates array
void expandExtent(const nlohmann::json& coords, double& min_x, double& min_y, double& max_x, double& max_y) {
    if (!coords.is_array() || coords.empty()) {
        return;
    }
    if (coords[0].is_number()) {
        if (coords.size() >= 2 && coords[1].is_number()) {
            double x = coords[0].get<double>();
            double y = coords[1].get<double>();
            min_x = std::min(min_x, x);
            min_y = std::min(min_y, y);
            max_x = std::max(max_x, x);
            max_y = std::max(max_y, y);
        }
        return;
    }
    for (const auto& child : coords) {
        expandExtent(child, min_x, min_y, max_x, max_y);
    }
}

} // namespace

int CoordinateSystemUtils::determineUTMZone(double longitude) {
    // UTM zones are 6 degrees wide, starting from -180
    // Zone 1 starts at -180, Zone 60 ends at +180
    int zone = static_cast<int>((longitude + 180.0) / 6.0) + 1;

    // Ensure zone is within valid range
    if (zone < 1) zone = 1;
    if (zone > 60) zone = 60;

    return zone;
}

int CoordinateSystemUtils::determineUTMEPSG(double longitude, double latitude) {
    int zone = determineUTMZone(longitude);

    // Determine hemisphere
    if (latitude >= 0) {
        // Northern hemisphere: EPSG 326xx
        return 32600 + zone;
    } else {
        // Southern hemisphere: EPSG 327xx
        return 32700 + zone;
    }
}

bool CoordinateSystemUtils::getDatasetCenter(const geo::GeospatialDataset& dataset, double& center_x, double& center_y) {
    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();

    for (const auto& feature : dataset.features) {
        if (feature.geometry.is_object() && feature.geometry.contains("coordinates")) {
            expandExtent(feature.geometry["coordinates"], min_x, min_y, max_x, max_y);
        }
    }

    if (min_x > max_x || min_y > max_y) {
        return false;
    }

    // Calculate center
    center_x = (min_x + max_x) / 2.0;
    center_y = (min_y + max_y) / 2.0;

    return true;
}

bool CoordinateSystemUtils::isWGS84(const std::string& crs) {
    if (crs.empty()) {
        // RFC 7946: GeoJSON without a crs member is WGS84
        return true;
    }

    std::string upper = crs;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    return upper.find("CRS84") != std::string::npos ||
           upper.find("EPSG::4326") != std::string::npos ||
           upper.find("EPSG:4326") != std::string::npos;
}

OGRCoordinateTransformationH CoordinateSystemUtils::createTransformation(int source_epsg, int target_epsg) {
    OGRSpatialReferenceH source_srs = OSRNewSpatialReference(nullptr);
    OGRSpatialReferenceH target_srs = OSRNewSpatialReference(nullptr);

    if (OSRImportFromEPSG(source_srs, source_epsg) != OGRERR_NONE ||
        OSRImportFromEPSG(target_srs, target_epsg) != OGRERR_NONE) {
        OSRDestroySpatialReference(source_srs);
        OSRDestroySpatialReference(target_srs);
        return nullptr;
    }

    // Set axis mapping strategy for GDAL 3+ (x = longitude / easting)
    OSRSetAxisMappingStrategy(source_srs, OAMS_TRADITIONAL_GIS_ORDER);
    OSRSetAxisMappingStrategy(target_srs, OAMS_TRADITIONAL_GIS_ORDER);

    // Create coordinate transformation
    OGRCoordinateTransformationH coord_trans = OCTNewCoordinateTransformation(source_srs, target_srs);

    // Clean up spatial references
    OSRDestroySpatialReference(source_srs);
    OSRDestroySpatialReference(target_srs);

    return coord_trans;
}

} // namespace io
} // namespace zonefind
