#include "index/street_index.hpp"
#include "io/coordinate_system_utils.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace zonefind {
namespace index {

namespace bg = geo::bg;
namespace bgi = geo::bgi;

StreetSpatialIndex StreetSpatialIndex::build(const geo::GeospatialDataset& dataset,
                                             std::shared_ptr<const geo::CoordinateProjector> projector) {
    StreetSpatialIndex index;
    if (dataset.features.empty()) {
        std::cerr << "Street dataset is empty; nearest street queries will return nothing" << std::endl;
        return index;
    }
    if (!projector) {
        throw std::invalid_argument("Street index requires a coordinate projector");
    }

    index.projector_ = projector;
    index.geometries_.reserve(dataset.features.size());
    index.properties_.reserve(dataset.features.size());
    index.feature_ids_.reserve(dataset.features.size());

    size_t skipped = 0;
    for (const auto& feature : dataset.features) {
        std::string error;
        auto geometry = geo::FeatureGeometry::fromGeoJSON(feature.geometry, &error);
        if (!geometry) {
            std::cerr << "Warning: Invalid street feature " << feature.id << ": " << error << ". Skipping." << std::endl;
            skipped++;
            continue;
        }
        if (geometry->isAreal()) {
            std::cerr << "Warning: Street feature " << feature.id << " is not a line. Skipping." << std::endl;
            skipped++;
            continue;
        }

        // Project once here so queries only project their own point
        try {
            index.geometries_.push_back(projector->project(*geometry));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to project street feature " << feature.id << ": " << e.what()
                      << ". Skipping." << std::endl;
            skipped++;
            continue;
        }
        index.properties_.push_back(feature.properties.is_object() ? feature.properties : nlohmann::json::object());
        index.feature_ids_.push_back(feature.id);
    }

    if (skipped > 0) {
        std::cerr << "Warning: Skipped " << skipped << " invalid street features" << std::endl;
    }

    index.buildSpatialIndex();
    return index;
}

StreetSpatialIndex StreetSpatialIndex::build(const geo::GeospatialDataset& dataset, int projected_epsg) {
    if (dataset.features.empty()) {
        return build(dataset, nullptr);
    }

    if (projected_epsg == 0) {
        double center_x, center_y;
        if (!io::CoordinateSystemUtils::getDatasetCenter(dataset, center_x, center_y)) {
            throw std::runtime_error("Could not determine street dataset center for UTM zone calculation");
        }
        projected_epsg = io::CoordinateSystemUtils::determineUTMEPSG(center_x, center_y);
        std::cerr << "Street dataset center: (" << center_x << ", " << center_y << ")" << std::endl;
    }

    std::cerr << "Projecting streets to EPSG:" << projected_epsg << std::endl;
    return build(dataset, std::make_shared<const geo::CoordinateProjector>(projected_epsg));
}

void StreetSpatialIndex::buildSpatialIndex() {
    std::vector<geo::StreetRTreeValue> rtree_values;
    rtree_values.reserve(geometries_.size() * 10); // Estimate segments per street

    for (size_t i = 0; i < geometries_.size(); ++i) {
        size_t segment_index = 0;
        for (const auto& linestring : geometries_[i].getLinear()) {
            // Create segments from linestring
            for (size_t j = 0; j + 1 < linestring.size(); ++j) {
                geo::Segment segment(linestring[j], linestring[j + 1]);
                rtree_values.emplace_back(segment, i, segment_index++);
            }
        }
    }

    // Build R-tree
    rtree_ = StreetRTree(rtree_values.begin(), rtree_values.end());

    std::cerr << "Built spatial index for " << rtree_values.size() << " street segments" << std::endl;
}

std::optional<StreetMatch> StreetSpatialIndex::findNearest(const geo::Point& lonlat, double max_distance_m) const {
    auto match = findNearest(lonlat);
    if (!match || match->distance_m > max_distance_m) {
        return std::nullopt;
    }
    return match;
}

std::optional<StreetMatch> StreetSpatialIndex::findNearest(const geo::Point& lonlat) const {
    if (rtree_.empty() || !projector_) {
        return std::nullopt;
    }

    geo::Point query_point = projector_->project(lonlat);

    // Nearest by the R-tree gives an upper bound on the true distance
    std::vector<geo::StreetRTreeValue> nearest;
    rtree_.query(bgi::nearest(query_point, 1), std::back_inserter(nearest));
    if (nearest.empty()) {
        return std::nullopt;
    }
    double bound = bg::distance(query_point, nearest.front().segment);

    // Refine over every segment that could be as close as the bound
    double x = bg::get<0>(query_point);
    double y = bg::get<1>(query_point);
    geo::Box search_box(geo::Point(x - bound, y - bound), geo::Point(x + bound, y + bound));

    std::vector<geo::StreetRTreeValue> candidates;
    rtree_.query(bgi::intersects(search_box), std::back_inserter(candidates));

    geo::CandidateHandle best_street = nearest.front().street_index;
    double best_distance = bound;
    for (const auto& candidate : candidates) {
        double distance = bg::distance(query_point, candidate.segment);
        if (distance < best_distance ||
            (distance == best_distance && candidate.street_index < best_street)) {
            best_distance = distance;
            best_street = candidate.street_index;
        }
    }

    return StreetMatch(best_street, feature_ids_[best_street], properties_[best_street], best_distance);
}

const geo::FeatureGeometry& StreetSpatialIndex::getGeometry(geo::CandidateHandle index) const {
    if (index >= geometries_.size()) {
        throw std::out_of_range("Street index out of range");
    }
    return geometries_[index];
}

} // namespace index
} // namespace zonefind
