#ifndef ZONEFIND_LOCATION_RESOLVER_HPP
#define ZONEFIND_LOCATION_RESOLVER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "index/index_cache.hpp"
#include "index/street_index.hpp"
#include "index/zone_index.hpp"

namespace zonefind {
namespace index {

// Location resolver configuration
struct ResolverConfig {
    double max_street_distance_m;   // Search radius for the nearest street (default: 120.0)

    ResolverConfig()
        : max_street_distance_m(120.0) {}
};

// Zone and street found for a clicked location
struct LocationResult {
    std::string zone_code;
    std::string zone_name;
    std::string street_name;
    std::string street_class;
    std::optional<double> street_distance_m;
    nlohmann::json raw_zone_props;          // Empty object when no zone matched
    nlohmann::json raw_street_props;        // Empty object when no street matched
    bool zone_found;
    bool street_found;

    LocationResult()
        : raw_zone_props(nlohmann::json::object()), raw_street_props(nlohmann::json::object()),
          zone_found(false), street_found(false) {}
};

/**
 * Answers "which zone contains this point and which street is nearest".
 * Indexes are either supplied pre-built or obtained lazily from an IndexCache
 * on the first resolve call.
 */
class LocationResolver {
public:
    /**
     * Create a resolver over dataset files; indexes are built on first use
     * @param zone_config Zone dataset (file_path may be empty only if resolve is never called)
     * @param street_config Street dataset (empty file_path means no street lookup)
     * @param config Resolver options
     * @param cache Index cache shared between resolvers
     */
    LocationResolver(const ZoneIndexConfig& zone_config,
                     const StreetIndexConfig& street_config,
                     const ResolverConfig& config,
                     std::shared_ptr<IndexCache> cache = IndexCache::global());

    /**
     * Create a resolver over already built indexes
     * @param zone_index Zone index (null means no zone dataset attached)
     * @param street_index Street index (null means no street lookup)
     * @param config Resolver options
     */
    LocationResolver(std::shared_ptr<const ZoneSpatialIndex> zone_index,
                     std::shared_ptr<const StreetSpatialIndex> street_index,
                     const ResolverConfig& config);

    // Disable copy constructor and assignment
    LocationResolver(const LocationResolver&) = delete;
    LocationResolver& operator=(const LocationResolver&) = delete;

    /**
     * Resolve a WGS84 location
     * @param latitude Latitude in degrees [-90, 90]
     * @param longitude Longitude in degrees [-180, 180]
     * @return Zone and street information; empty fields when nothing matched
     * @throws std::invalid_argument if the coordinates are out of range
     * @throws std::logic_error if no zone dataset is attached
     * @throws std::runtime_error if a dataset file cannot be indexed
     */
    LocationResult resolve(double latitude, double longitude) const;

    const ResolverConfig& getConfig() const { return config_; }

private:
    ZoneIndexConfig zone_config_;
    StreetIndexConfig street_config_;
    ResolverConfig config_;
    std::shared_ptr<IndexCache> cache_;

    mutable std::once_flag indexes_once_;
    mutable std::shared_ptr<const ZoneSpatialIndex> zone_index_;
    mutable std::shared_ptr<const StreetSpatialIndex> street_index_;

    /**
     * Obtain the indexes from the cache once
     */
    void ensureIndexes() const;
};

} // namespace index
} // namespace zonefind

#endif // ZONEFIND_LOCATION_RESOLVER_HPP
