#include "index/zone_index.hpp"
#include "index/property_aliases.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace zonefind {
namespace index {

namespace bg = geo::bg;
namespace bgi = geo::bgi;

ZoneSpatialIndex ZoneSpatialIndex::build(const geo::GeospatialDataset& dataset) {
    ZoneSpatialIndex index;
    index.geometries_.reserve(dataset.features.size());
    index.properties_.reserve(dataset.features.size());
    index.feature_ids_.reserve(dataset.features.size());

    size_t skipped = 0;
    for (const auto& feature : dataset.features) {
        std::string error;
        auto geometry = geo::FeatureGeometry::fromGeoJSON(feature.geometry, &error);
        if (!geometry) {
            std::cerr << "Warning: Invalid zone feature " << feature.id << ": " << error << ". Skipping." << std::endl;
            skipped++;
            continue;
        }
        if (!geometry->isAreal()) {
            std::cerr << "Warning: Zone feature " << feature.id << " is not a polygon. Skipping." << std::endl;
            skipped++;
            continue;
        }

        index.geometries_.push_back(std::move(*geometry));
        index.properties_.push_back(PropertyAliases::normalizeZoneProperties(feature.properties));
        index.feature_ids_.push_back(feature.id);
    }

    // Prepared handles point into geometries_, which must not grow past this point
    index.prepared_.reserve(index.geometries_.size());
    for (const auto& geometry : index.geometries_) {
        index.prepared_.emplace_back(geometry);
    }

    if (skipped > 0) {
        std::cerr << "Warning: Skipped " << skipped << " invalid zone features" << std::endl;
    }

    index.buildSpatialIndex();
    return index;
}

void ZoneSpatialIndex::buildSpatialIndex() {
    std::vector<geo::ZoneRTreeValue> rtree_values;
    rtree_values.reserve(prepared_.size());

    for (size_t i = 0; i < prepared_.size(); ++i) {
        rtree_values.emplace_back(prepared_[i].getEnvelope(), i);
    }

    // Build R-tree
    rtree_ = ZoneRTree(rtree_values.begin(), rtree_values.end());

    std::cerr << "Built spatial index for " << rtree_values.size() << " zone polygons" << std::endl;
}

std::optional<ZoneMatch> ZoneSpatialIndex::findZone(const geo::Point& lonlat) const {
    if (rtree_.empty()) {
        return std::nullopt;
    }

    std::vector<geo::ZoneRTreeValue> candidates;
    rtree_.query(bgi::intersects(lonlat), std::back_inserter(candidates));
    if (candidates.empty()) {
        return std::nullopt;
    }

    // Visit candidates in dataset order so overlapping zones resolve deterministically
    std::sort(candidates.begin(), candidates.end(),
              [](const geo::ZoneRTreeValue& a, const geo::ZoneRTreeValue& b) {
                  return a.zone_index < b.zone_index;
              });

    for (const auto& candidate : candidates) {
        const auto& prepared = prepared_[candidate.zone_index];
        if (prepared.contains(lonlat)) {
            return ZoneMatch(candidate.zone_index, feature_ids_[candidate.zone_index],
                             properties_[candidate.zone_index], false);
        }
        // A point exactly on an edge still belongs to the zone
        if (prepared.intersects(lonlat)) {
            return ZoneMatch(candidate.zone_index, feature_ids_[candidate.zone_index],
                             properties_[candidate.zone_index], true);
        }
    }

    return std::nullopt;
}

const geo::FeatureGeometry& ZoneSpatialIndex::getGeometry(geo::CandidateHandle index) const {
    if (index >= geometries_.size()) {
        throw std::out_of_range("Zone index out of range");
    }
    return geometries_[index];
}

const nlohmann::json& ZoneSpatialIndex::getProperties(geo::CandidateHandle index) const {
    if (index >= properties_.size()) {
        throw std::out_of_range("Zone index out of range");
    }
    return properties_[index];
}

} // namespace index
} // namespace zonefind
