#ifndef ZONEFIND_COORDINATE_SYSTEM_UTILS_HPP
#define ZONEFIND_COORDINATE_SYSTEM_UTILS_HPP

#include <string>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <ogr_spatialref.h>
#include "geo/common.hpp"

namespace zonefind {
namespace io {

/**
 * Coordinate system utility functions for UTM reprojection and validation
 */
class CoordinateSystemUtils {
public:
    /**
     * Determine UTM zone from longitude coordinate
     * @param longitude Longitude in degrees
     * @return UTM zone number (1-60)
     */
    static int determineUTMZone(double longitude);

    /**
     * Determine UTM EPSG code from longitude and latitude
     * @param longitude Longitude in degrees
     * @param latitude Latitude in degrees
     * @return EPSG code for UTM zone (326xx for northern, 327xx for southern)
     */
    static int determineUTMEPSG(double longitude, double latitude);

    /**
     * Compute the center of a dataset's extent from its feature coordinates
     * @param dataset Feature collection in lon/lat degrees
     * @param center_x Output center longitude
     * @param center_y Output center latitude
     * @return true if at least one coordinate was found, false otherwise
     */
    static bool getDatasetCenter(const geo::GeospatialDataset& dataset, double& center_x, double& center_y);

    /**
     * Check if a GeoJSON CRS name denotes geographic WGS84 (EPSG:4326 or CRS84)
     * @param crs CRS name as declared by the document (empty means default WGS84)
     * @return true if WGS84, false otherwise
     */
    static bool isWGS84(const std::string& crs);

    /**
     * Create coordinate transformation between two EPSG codes
     * @param source_epsg Source EPSG code
     * @param target_epsg Target EPSG code
     * @return Coordinate transformation handle (caller owns the handle), nullptr on failure
     */
    static OGRCoordinateTransformationH createTransformation(int source_epsg, int target_epsg);

private:
    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace io
} // namespace zonefind

#endif // ZONEFIND_COORDINATE_SYSTEM_UTILS_HPP
