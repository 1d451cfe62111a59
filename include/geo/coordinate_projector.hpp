#ifndef ZONEFIND_COORDINATE_PROJECTOR_HPP
#define ZONEFIND_COORDINATE_PROJECTOR_HPP

#include <memory>
#include <mutex>
#include <ogr_srs_api.h>
#include "geo/common.hpp"
#include "geo/feature_geometry.hpp"

namespace zonefind {
namespace geo {

/**
 * Converts WGS84 lon/lat degrees to a planar projected CRS in meters and back.
 * Holds the forward and inverse OGR transformations for its lifetime; calls are
 * serialized internally so a single projector can be shared between readers.
 */
class CoordinateProjector {
public:
    static constexpr int WGS84_EPSG = 4326;

    /**
     * Create a projector to the given projected CRS
     * @param projected_epsg Target EPSG code (e.g. 31985, 3857)
     * @throws std::runtime_error if either transformation cannot be created
     */
    explicit CoordinateProjector(int projected_epsg);
    ~CoordinateProjector();

    // Disable copy constructor and assignment
    CoordinateProjector(const CoordinateProjector&) = delete;
    CoordinateProjector& operator=(const CoordinateProjector&) = delete;

    /**
     * Create a projector to the UTM zone containing a location
     * @param longitude Longitude in degrees
     * @param latitude Latitude in degrees
     * @return Shared projector
     */
    static std::shared_ptr<const CoordinateProjector> forLocation(double longitude, double latitude);

    int getProjectedEPSG() const { return projected_epsg_; }

    /**
     * Project a lon/lat point to planar meters
     * @throws std::runtime_error if the point cannot be transformed
     */
    Point project(const Point& lonlat) const;

    /**
     * Convert a planar point back to lon/lat degrees
     * @throws std::runtime_error if the point cannot be transformed
     */
    Point unproject(const Point& xy) const;

    /**
     * Project every vertex of a lon/lat geometry
     * @throws std::runtime_error if any vertex cannot be transformed
     */
    FeatureGeometry project(const FeatureGeometry& geometry) const;

private:
    int projected_epsg_;
    OGRCoordinateTransformationH forward_;
    OGRCoordinateTransformationH inverse_;
    mutable std::mutex mutex_;

    Point transformPoint(OGRCoordinateTransformationH transformation, const Point& point) const;
};

} // namespace geo
} // namespace zonefind

#endif // ZONEFIND_COORDINATE_PROJECTOR_HPP
