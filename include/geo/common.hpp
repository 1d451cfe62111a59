#ifndef ZONEFIND_COMMON_HPP
#define ZONEFIND_COMMON_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/segment.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace zonefind {
namespace geo {

// Boost Geometry namespace aliases
namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// 2D Geometry types. Zones are kept in lon/lat degrees, streets in projected meters.
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using LineString = bg::model::linestring<Point>;
using MultiLineString = bg::model::multi_linestring<LineString>;
using Segment = bg::model::segment<Point>;
using Box = bg::model::box<Point>;
using Polygon = bg::model::polygon<Point>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using LinearRing = bg::model::ring<Point>;

// Opaque handle returned by spatial index queries; always a position in the feature table
using CandidateHandle = size_t;

// Raw feature as read from a GeoJSON FeatureCollection
struct GeospatialFeature {
    size_t id;                      // Position of the feature in the source collection
    nlohmann::json geometry;        // GeoJSON geometry object
    nlohmann::json properties;      // Property mapping (scalar values)

    GeospatialFeature(size_t feature_id, const nlohmann::json& geom, const nlohmann::json& props)
        : id(feature_id), geometry(geom), properties(props) {}
};

// In-memory feature collection
struct GeospatialDataset {
    std::string crs;                            // CRS name if the document declares one
    std::vector<GeospatialFeature> features;

    GeospatialDataset() = default;
    GeospatialDataset(const std::string& crs_name, const std::vector<GeospatialFeature>& feature_list)
        : crs(crs_name), features(feature_list) {}
};

// R-tree value for zone polygons (bounding box of the whole feature)
struct ZoneRTreeValue {
    Box bounding_box;
    CandidateHandle zone_index;

    ZoneRTreeValue(const Box& box, CandidateHandle idx)
        : bounding_box(box), zone_index(idx) {}
};

// R-tree value for projected street segments
struct StreetRTreeValue {
    Segment segment;
    CandidateHandle street_index;
    size_t segment_index;

    StreetRTreeValue(const Segment& seg, CandidateHandle street_idx, size_t seg_idx)
        : segment(seg), street_index(street_idx), segment_index(seg_idx) {}
};

// GeoJSON field value utilities
std::optional<double> getFieldValueAsDouble(const nlohmann::json& properties,
                                            const std::string& field_name);

std::string getFieldValueAsString(const nlohmann::json& properties,
                                  const std::string& field_name,
                                  const std::string& default_value = "");

bool getFieldValueAsBool(const nlohmann::json& properties,
                         const std::string& field_name,
                         bool default_value = false);

/**
 * Format a JSON scalar for display
 * @param value JSON value
 * @return String form; numbers without trailing zeros, null as empty string
 */
std::string scalarToString(const nlohmann::json& value);

} // namespace geo
} // namespace zonefind

// Boost Geometry R-tree specializations
namespace boost { namespace geometry { namespace index {

template<>
struct indexable<zonefind::geo::ZoneRTreeValue> {
    using result_type = zonefind::geo::Box;
    result_type const& operator()(zonefind::geo::ZoneRTreeValue const& v) const {
        return v.bounding_box;
    }
};

template<>
struct indexable<zonefind::geo::StreetRTreeValue> {
    using result_type = zonefind::geo::Segment;
    result_type const& operator()(zonefind::geo::StreetRTreeValue const& v) const {
        return v.segment;
    }
};

}}} // namespace boost::geometry::index

#endif // ZONEFIND_COMMON_HPP
