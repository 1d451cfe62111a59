#ifndef ZONEFIND_ZONE_INDEX_HPP
#define ZONEFIND_ZONE_INDEX_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "geo/common.hpp"
#include "geo/feature_geometry.hpp"

namespace zonefind {
namespace index {

// Zone index configuration
struct ZoneIndexConfig {
    std::string file_path;          // Zoning GeoJSON file (WGS84 polygons)
};

// Zone polygon containing (or touching) a query point
struct ZoneMatch {
    geo::CandidateHandle zone_index;    // Position in the index feature table
    size_t feature_id;                  // Position in the source collection
    nlohmann::json properties;          // Normalised zone properties
    bool on_boundary;                   // Matched by the boundary test only

    ZoneMatch(geo::CandidateHandle idx, size_t id, const nlohmann::json& props, bool boundary)
        : zone_index(idx), feature_id(id), properties(props), on_boundary(boundary) {}
};

/**
 * Point-in-polygon index over zoning polygons in lon/lat degrees.
 * Immutable after build; safe for concurrent queries.
 */
class ZoneSpatialIndex {
public:
    /**
     * Build the index from a zoning dataset. Features whose geometry is
     * malformed or not a polygon are skipped.
     * @param dataset Zoning features in WGS84
     * @return Built index (inert if no feature is usable)
     */
    static ZoneSpatialIndex build(const geo::GeospatialDataset& dataset);

    ZoneSpatialIndex() = default;

    // Disable copy constructor and assignment
    ZoneSpatialIndex(const ZoneSpatialIndex&) = delete;
    ZoneSpatialIndex& operator=(const ZoneSpatialIndex&) = delete;

    // Moving keeps vector storage, so prepared handles stay valid
    ZoneSpatialIndex(ZoneSpatialIndex&&) = default;
    ZoneSpatialIndex& operator=(ZoneSpatialIndex&&) = default;

    /**
     * Find the zone containing a point. Candidates are tested in dataset order,
     * each by exact containment and then by boundary contact.
     * @param lonlat Query point (x = longitude, y = latitude)
     * @return First matching zone, or nullopt if no polygon covers the point
     */
    std::optional<ZoneMatch> findZone(const geo::Point& lonlat) const;

    /**
     * Get the number of indexed zones
     * @return Number of zones
     */
    size_t getZoneCount() const { return geometries_.size(); }

    bool empty() const { return geometries_.empty(); }

    /**
     * Get a zone geometry by index
     * @param index Zone index
     * @return Zone geometry
     */
    const geo::FeatureGeometry& getGeometry(geo::CandidateHandle index) const;

    /**
     * Get the normalised properties of a zone by index
     * @param index Zone index
     * @return Property mapping
     */
    const nlohmann::json& getProperties(geo::CandidateHandle index) const;

private:
    using ZoneRTree = geo::bgi::rtree<geo::ZoneRTreeValue, geo::bgi::quadratic<16>>;

    std::vector<geo::FeatureGeometry> geometries_;
    std::vector<geo::PreparedArea> prepared_;
    std::vector<nlohmann::json> properties_;
    std::vector<size_t> feature_ids_;
    ZoneRTree rtree_;

    /**
     * Build spatial index for zones
     */
    void buildSpatialIndex();
};

} // namespace index
} // namespace zonefind

#endif // ZONEFIND_ZONE_INDEX_HPP
