#ifndef ZONEFIND_FEATURE_GEOMETRY_HPP
#define ZONEFIND_FEATURE_GEOMETRY_HPP

#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "geo/common.hpp"

namespace zonefind {
namespace geo {

enum class GeometryKind {
    AREAL,      // Polygon or MultiPolygon
    LINEAR      // LineString or MultiLineString
};

/**
 * Immutable polygon/polyline handle built from a GeoJSON geometry object.
 * Areal geometries are stored as a multi-polygon, linear ones as a multi-linestring,
 * so single and multi variants go through the same predicates.
 */
class FeatureGeometry {
public:
    /**
     * Build a geometry from a GeoJSON geometry object
     * @param geometry GeoJSON geometry (Polygon, MultiPolygon, LineString, MultiLineString)
     * @param error Optional output for the failure reason
     * @return Geometry, or nullopt if the object is malformed or unsupported
     */
    static std::optional<FeatureGeometry> fromGeoJSON(const nlohmann::json& geometry,
                                                      std::string* error = nullptr);

    /**
     * Wrap an existing multi-polygon
     * @param areal Polygon parts (must already be closed and correctly oriented)
     */
    explicit FeatureGeometry(const MultiPolygon& areal);

    /**
     * Wrap an existing multi-linestring
     * @param linear Linestring parts
     */
    explicit FeatureGeometry(const MultiLineString& linear);

    GeometryKind getKind() const { return kind_; }
    bool isAreal() const { return kind_ == GeometryKind::AREAL; }

    const MultiPolygon& getAreal() const { return areal_; }
    const MultiLineString& getLinear() const { return linear_; }

    /**
     * Strict containment test (boundary excluded). Always false for linear geometries.
     * @param point Query point in the geometry's coordinate system
     */
    bool contains(const Point& point) const;

    /**
     * Interior or boundary intersection test
     * @param point Query point in the geometry's coordinate system
     */
    bool intersects(const Point& point) const;

    /**
     * Planar distance to a point (0 inside an areal geometry)
     */
    double distance(const Point& point) const;

    /**
     * Planar distance to another geometry
     */
    double distance(const FeatureGeometry& other) const;

    /**
     * Bounding box of all parts
     */
    Box envelope() const;

    /**
     * Apply a pointwise coordinate mapping, returning a new geometry
     * @param fn Mapping applied to every vertex
     */
    FeatureGeometry transformed(const std::function<Point(const Point&)>& fn) const;

    /**
     * Number of vertices over all parts and rings
     */
    size_t vertexCount() const;

private:
    GeometryKind kind_;
    MultiPolygon areal_;
    MultiLineString linear_;
};

/**
 * Fast containment handle for an areal geometry: rejects by cached envelope before
 * running the exact polygon test.
 */
class PreparedArea {
public:
    explicit PreparedArea(const FeatureGeometry& geometry);

    bool contains(const Point& point) const;
    bool intersects(const Point& point) const;
    const Box& getEnvelope() const { return envelope_; }

private:
    const FeatureGeometry* geometry_;
    Box envelope_;
};

} // namespace geo
} // namespace zonefind

#endif // ZONEFIND_FEATURE_GEOMETRY_HPP
