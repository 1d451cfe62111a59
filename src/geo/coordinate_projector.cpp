#include "geo/coordinate_projector.hpp"
#include "io/coordinate_system_utils.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace zonefind {
namespace geo {

CoordinateProjector::CoordinateProjector(int projected_epsg)
    : projected_epsg_(projected_epsg), forward_(nullptr), inverse_(nullptr) {
    forward_ = io::CoordinateSystemUtils::createTransformation(WGS84_EPSG, projected_epsg);
    inverse_ = io::CoordinateSystemUtils::createTransformation(projected_epsg, WGS84_EPSG);

    if (!forward_ || !inverse_) {
        if (forward_) OCTDestroyCoordinateTransformation(forward_);
        if (inverse_) OCTDestroyCoordinateTransformation(inverse_);
        throw std::runtime_error("Failed to create coordinate transformation between EPSG:4326 and EPSG:" +
                                 std::to_string(projected_epsg));
    }
}

CoordinateProjector::~CoordinateProjector() {
    if (forward_) {
        OCTDestroyCoordinateTransformation(forward_);
        forward_ = nullptr;
    }
    if (inverse_) {
        OCTDestroyCoordinateTransformation(inverse_);
        inverse_ = nullptr;
    }
}

std::shared_ptr<const CoordinateProjector> CoordinateProjector::forLocation(double longitude, double latitude) {
    int utm_epsg = io::CoordinateSystemUtils::determineUTMEPSG(longitude, latitude);
    return std::make_shared<const CoordinateProjector>(utm_epsg);
}

Point CoordinateProjector::project(const Point& lonlat) const {
    return transformPoint(forward_, lonlat);
}

Point CoordinateProjector::unproject(const Point& xy) const {
    return transformPoint(inverse_, xy);
}

FeatureGeometry CoordinateProjector::project(const FeatureGeometry& geometry) const {
    return geometry.transformed([this](const Point& point) { return project(point); });
}

Point CoordinateProjector::transformPoint(OGRCoordinateTransformationH transformation, const Point& point) const {
    double x = bg::get<0>(point);
    double y = bg::get<1>(point);

    {
        // OGR transformations are not reentrant
        std::lock_guard<std::mutex> lock(mutex_);
        if (!OCTTransform(transformation, 1, &x, &y, nullptr)) {
            throw std::runtime_error("Failed to transform coordinate (" + std::to_string(bg::get<0>(point)) +
                                     ", " + std::to_string(bg::get<1>(point)) + ")");
        }
    }

    if (!std::isfinite(x) || !std::isfinite(y)) {
        throw std::runtime_error("Coordinate transformation produced a non-finite value");
    }
    return Point(x, y);
}

} // namespace geo
} // namespace zonefind
