#include "geo/feature_geometry.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace zonefind {
namespace geo {

namespace {

Point parsePosition(const nlohmann::json& coord) {
    if (!coord.is_array() || coord.size() < 2 || !coord[0].is_number() || !coord[1].is_number()) {
        throw std::runtime_error("Invalid coordinate position");
    }
    double x = coord[0].get<double>();
    double y = coord[1].get<double>();
    if (!std::isfinite(x) || !std::isfinite(y)) {
        throw std::runtime_error("Non-finite coordinate");
    }
    return Point(x, y);
}

LinearRing parseRing(const nlohmann::json& ring_json) {
    if (!ring_json.is_array()) {
        throw std::runtime_error("Polygon ring is not an array");
    }

    LinearRing ring;
    for (const auto& coord : ring_json) {
        ring.push_back(parsePosition(coord));
    }

    // Ensure the ring is closed (Boost geometry requirement)
    if (!ring.empty() &&
        (bg::get<0>(ring.front()) != bg::get<0>(ring.back()) ||
         bg::get<1>(ring.front()) != bg::get<1>(ring.back()))) {
        ring.push_back(ring.front());
    }

    if (ring.size() < 4) {
        throw std::runtime_error("Polygon ring has fewer than 3 distinct vertices");
    }
    return ring;
}

Polygon parsePolygon(const nlohmann::json& rings) {
    if (!rings.is_array() || rings.empty()) {
        throw std::runtime_error("Polygon has no rings");
    }

    Polygon polygon;
    polygon.outer() = parseRing(rings[0]);
    for (size_t i = 1; i < rings.size(); ++i) {
        LinearRing inner = parseRing(rings[i]);
        polygon.inners().push_back(inner);
    }
    return polygon;
}

LineString parseLineString(const nlohmann::json& coords) {
    if (!coords.is_array()) {
        throw std::runtime_error("LineString coordinates are not an array");
    }

    LineString linestring;
    for (const auto& coord : coords) {
        linestring.push_back(parsePosition(coord));
    }
    if (linestring.size() < 2) {
        throw std::runtime_error("LineString has fewer than 2 points");
    }
    return linestring;
}

// Self-intersecting rings and holes outside their shell make within() unreliable
void requireValid(const MultiPolygon& areal) {
    std::string reason;
    if (!bg::is_valid(areal, reason)) {
        throw std::runtime_error("Invalid polygon: " + reason);
    }
}

template <typename Range>
Range transformRange(const Range& range, const std::function<Point(const Point&)>& fn) {
    Range out;
    for (const auto& point : range) {
        out.push_back(fn(point));
    }
    return out;
}

} // namespace

std::optional<FeatureGeometry> FeatureGeometry::fromGeoJSON(const nlohmann::json& geometry,
                                                            std::string* error) {
    try {
        if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
            throw std::runtime_error("Geometry has no type");
        }
        if (!geometry.contains("coordinates")) {
            throw std::runtime_error("Geometry has no coordinates");
        }

        const std::string type = geometry["type"].get<std::string>();
        const auto& coords = geometry["coordinates"];

        if (type == "Polygon") {
            MultiPolygon areal;
            areal.push_back(parsePolygon(coords));
            bg::correct(areal);
            requireValid(areal);
            return FeatureGeometry(areal);
        }

        if (type == "MultiPolygon") {
            if (!coords.is_array() || coords.empty()) {
                throw std::runtime_error("MultiPolygon has no parts");
            }
            MultiPolygon areal;
            for (const auto& part : coords) {
                areal.push_back(parsePolygon(part));
            }
            bg::correct(areal);
            requireValid(areal);
            return FeatureGeometry(areal);
        }

        if (type == "LineString") {
            MultiLineString linear;
            linear.push_back(parseLineString(coords));
            return FeatureGeometry(linear);
        }

        if (type == "MultiLineString") {
            if (!coords.is_array() || coords.empty()) {
                throw std::runtime_error("MultiLineString has no parts");
            }
            MultiLineString linear;
            for (const auto& part : coords) {
                linear.push_back(parseLineString(part));
            }
            return FeatureGeometry(linear);
        }

        throw std::runtime_error("Unsupported geometry type: " + type);

    } catch (const std::exception& e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

FeatureGeometry::FeatureGeometry(const MultiPolygon& areal)
    : kind_(GeometryKind::AREAL), areal_(areal) {
}

FeatureGeometry::FeatureGeometry(const MultiLineString& linear)
    : kind_(GeometryKind::LINEAR), linear_(linear) {
}

bool FeatureGeometry::contains(const Point& point) const {
    if (kind_ != GeometryKind::AREAL) {
        return false;
    }
    return bg::within(point, areal_);
}

bool FeatureGeometry::intersects(const Point& point) const {
    if (kind_ == GeometryKind::AREAL) {
        return bg::covered_by(point, areal_);
    }
    return bg::distance(point, linear_) == 0.0;
}

double FeatureGeometry::distance(const Point& point) const {
    if (kind_ == GeometryKind::AREAL) {
        return bg::distance(point, areal_);
    }
    return bg::distance(point, linear_);
}

double FeatureGeometry::distance(const FeatureGeometry& other) const {
    if (kind_ == GeometryKind::AREAL) {
        return other.isAreal() ? bg::distance(areal_, other.areal_)
                               : bg::distance(other.linear_, areal_);
    }
    return other.isAreal() ? bg::distance(linear_, other.areal_)
                           : bg::distance(linear_, other.linear_);
}

Box FeatureGeometry::envelope() const {
    if (kind_ == GeometryKind::AREAL) {
        return bg::return_envelope<Box>(areal_);
    }
    return bg::return_envelope<Box>(linear_);
}

FeatureGeometry FeatureGeometry::transformed(const std::function<Point(const Point&)>& fn) const {
    if (kind_ == GeometryKind::AREAL) {
        MultiPolygon out;
        for (const auto& polygon : areal_) {
            Polygon projected;
            projected.outer() = transformRange(polygon.outer(), fn);
            for (const auto& inner : polygon.inners()) {
                projected.inners().push_back(transformRange(inner, fn));
            }
            out.push_back(projected);
        }
        return FeatureGeometry(out);
    }

    MultiLineString out;
    for (const auto& linestring : linear_) {
        out.push_back(transformRange(linestring, fn));
    }
    return FeatureGeometry(out);
}

size_t FeatureGeometry::vertexCount() const {
    if (kind_ == GeometryKind::AREAL) {
        return bg::num_points(areal_);
    }
    return bg::num_points(linear_);
}

PreparedArea::PreparedArea(const FeatureGeometry& geometry)
    : geometry_(&geometry), envelope_(geometry.envelope()) {
}

bool PreparedArea::contains(const Point& point) const {
    if (!bg::covered_by(point, envelope_)) {
        return false;
    }
    return geometry_->contains(point);
}

bool PreparedArea::intersects(const Point& point) const {
    if (!bg::covered_by(point, envelope_)) {
        return false;
    }
    return geometry_->intersects(point);
}

} // namespace geo
} // namespace zonefind
