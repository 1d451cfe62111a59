#include "index/location_resolver.hpp"
#include "index/property_aliases.hpp"
#include <cmath>
#include <stdexcept>

namespace zonefind {
namespace index {

LocationResolver::LocationResolver(const ZoneIndexConfig& zone_config,
                                   const StreetIndexConfig& street_config,
                                   const ResolverConfig& config,
                                   std::shared_ptr<IndexCache> cache)
    : zone_config_(zone_config), street_config_(street_config), config_(config), cache_(std::move(cache)) {
    if (!cache_) {
        cache_ = IndexCache::global();
    }
}

LocationResolver::LocationResolver(std::shared_ptr<const ZoneSpatialIndex> zone_index,
                                   std::shared_ptr<const StreetSpatialIndex> street_index,
                                   const ResolverConfig& config)
    : config_(config), zone_index_(std::move(zone_index)), street_index_(std::move(street_index)) {
}

void LocationResolver::ensureIndexes() const {
    std::call_once(indexes_once_, [this] {
        if (!zone_config_.file_path.empty()) {
            zone_index_ = cache_->getZoneIndex(zone_config_);
        }
        if (!street_config_.file_path.empty()) {
            street_index_ = cache_->getStreetIndex(street_config_);
        }
    });
}

LocationResult LocationResolver::resolve(double latitude, double longitude) const {
    if (!std::isfinite(latitude) || !std::isfinite(longitude) ||
        latitude < -90.0 || latitude > 90.0 || longitude < -180.0 || longitude > 180.0) {
        throw std::invalid_argument("Coordinates out of range: lat=" + std::to_string(latitude) +
                                    ", lon=" + std::to_string(longitude));
    }

    ensureIndexes();
    if (!zone_index_) {
        throw std::logic_error("Location resolver has no zone dataset attached");
    }

    geo::Point lonlat(longitude, latitude);
    LocationResult result;

    auto zone = zone_index_->findZone(lonlat);
    if (zone) {
        result.zone_found = true;
        result.zone_code = PropertyAliases::firstNonEmpty(zone->properties, PropertyField::ZONE_CODE);
        result.zone_name = PropertyAliases::firstNonEmpty(zone->properties, PropertyField::ZONE_NAME);
        result.raw_zone_props = zone->properties;
    }

    if (street_index_) {
        auto street = street_index_->findNearest(lonlat, config_.max_street_distance_m);
        if (street) {
            result.street_found = true;
            result.street_name = PropertyAliases::firstNonEmpty(street->properties, PropertyField::STREET_NAME);
            result.street_class = PropertyAliases::firstNonEmpty(street->properties, PropertyField::STREET_CLASS);
            result.street_distance_m = street->distance_m;
            result.raw_street_props = street->properties;
        }
    }

    return result;
}

} // namespace index
} // namespace zonefind
