#ifndef ZONEFIND_STREET_INDEX_HPP
#define ZONEFIND_STREET_INDEX_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "geo/common.hpp"
#include "geo/coordinate_projector.hpp"
#include "geo/feature_geometry.hpp"

namespace zonefind {
namespace index {

// Street index configuration
struct StreetIndexConfig {
    std::string file_path;          // Street GeoJSON file (WGS84 lines)
    int projected_epsg;             // Planar CRS for distances (0 = UTM zone of the dataset centre)

    StreetIndexConfig()
        : projected_epsg(0) {}
};

// Street nearest to a query point
struct StreetMatch {
    geo::CandidateHandle street_index;  // Position in the index feature table
    size_t feature_id;                  // Position in the source collection
    nlohmann::json properties;          // Raw street properties
    double distance_m;                  // Planar distance in the projected CRS

    StreetMatch(geo::CandidateHandle idx, size_t id, const nlohmann::json& props, double distance)
        : street_index(idx), feature_id(id), properties(props), distance_m(distance) {}
};

/**
 * Nearest-line index over street polylines. Geometries are projected to planar
 * meters once at build time; each query projects its point once.
 * Immutable after build; safe for concurrent queries.
 */
class StreetSpatialIndex {
public:
    /**
     * Build the index from a street dataset with a given projector.
     * Features whose geometry is malformed, not linear or not projectable are skipped.
     * @param dataset Street features in WGS84
     * @param projector Projector to planar meters (may be null only for an empty dataset)
     * @return Built index
     * @throws std::invalid_argument if the dataset has features and no projector is given
     */
    static StreetSpatialIndex build(const geo::GeospatialDataset& dataset,
                                    std::shared_ptr<const geo::CoordinateProjector> projector);

    /**
     * Build the index choosing the projection from an EPSG code
     * @param dataset Street features in WGS84
     * @param projected_epsg Target EPSG code, 0 for the UTM zone of the dataset centre
     * @return Built index
     * @throws std::runtime_error if the projection cannot be created
     */
    static StreetSpatialIndex build(const geo::GeospatialDataset& dataset, int projected_epsg);

    StreetSpatialIndex() = default;

    // Disable copy constructor and assignment
    StreetSpatialIndex(const StreetSpatialIndex&) = delete;
    StreetSpatialIndex& operator=(const StreetSpatialIndex&) = delete;

    StreetSpatialIndex(StreetSpatialIndex&&) = default;
    StreetSpatialIndex& operator=(StreetSpatialIndex&&) = default;

    /**
     * Find the nearest street within a search radius
     * @param lonlat Query point (x = longitude, y = latitude)
     * @param max_distance_m Search radius in meters
     * @return Nearest street, or nullopt if none lies within the radius
     */
    std::optional<StreetMatch> findNearest(const geo::Point& lonlat, double max_distance_m) const;

    /**
     * Find the nearest street regardless of distance
     * @param lonlat Query point (x = longitude, y = latitude)
     * @return Nearest street, or nullopt if the index is empty
     */
    std::optional<StreetMatch> findNearest(const geo::Point& lonlat) const;

    size_t getStreetCount() const { return geometries_.size(); }
    size_t getSegmentCount() const { return rtree_.size(); }
    bool empty() const { return geometries_.empty(); }

    /**
     * Get the projector used by the index
     * @return Projector, null for an empty index
     */
    std::shared_ptr<const geo::CoordinateProjector> getProjector() const { return projector_; }

    /**
     * Get a projected street geometry by index
     * @param index Street index
     * @return Street geometry in planar meters
     */
    const geo::FeatureGeometry& getGeometry(geo::CandidateHandle index) const;

private:
    using StreetRTree = geo::bgi::rtree<geo::StreetRTreeValue, geo::bgi::quadratic<16>>;

    std::shared_ptr<const geo::CoordinateProjector> projector_;
    std::vector<geo::FeatureGeometry> geometries_;
    std::vector<nlohmann::json> properties_;
    std::vector<size_t> feature_ids_;
    StreetRTree rtree_;

    /**
     * Build spatial index for street segments
     */
    void buildSpatialIndex();
};

} // namespace index
} // namespace zonefind

#endif // ZONEFIND_STREET_INDEX_HPP
