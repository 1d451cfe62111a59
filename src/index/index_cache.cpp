#include "index/index_cache.hpp"
#include "io/geojson_reader.hpp"
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <iostream>
#include <stdexcept>

namespace zonefind {
namespace index {

namespace fs = boost::filesystem;

std::shared_ptr<IndexCache> IndexCache::global() {
    static std::shared_ptr<IndexCache> cache = std::make_shared<IndexCache>();
    return cache;
}

std::string IndexCache::datasetKey(const std::string& file_path) {
    boost::system::error_code ec;
    fs::path path = fs::absolute(fs::path(file_path));

    if (!fs::is_regular_file(path, ec) || ec) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to read size of " + file_path + ": " + ec.message());
    }
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to read modification time of " + file_path + ": " + ec.message());
    }

    return path.string() + "|" + std::to_string(size) + "|" + std::to_string(static_cast<long long>(mtime));
}

std::shared_ptr<const ZoneSpatialIndex> IndexCache::getZoneIndex(const ZoneIndexConfig& config) {
    std::string key = datasetKey(config.file_path);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = zone_indexes_.find(key);
    if (it != zone_indexes_.end()) {
        return it->second;
    }

    std::cerr << "Reading zone file: " << config.file_path << std::endl;
    geo::GeospatialDataset dataset = io::GeoJSONReader::readFromFile(config.file_path);
    std::cerr << "Zone feature count: " << dataset.features.size() << std::endl;

    auto built = std::make_shared<const ZoneSpatialIndex>(ZoneSpatialIndex::build(dataset));
    zone_indexes_[key] = built;
    build_count_++;
    return built;
}

std::shared_ptr<const StreetSpatialIndex> IndexCache::getStreetIndex(const StreetIndexConfig& config) {
    // The projection is part of the identity: the same file projected twice is two indexes
    std::string key = datasetKey(config.file_path) + "|" + std::to_string(config.projected_epsg);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = street_indexes_.find(key);
    if (it != street_indexes_.end()) {
        return it->second;
    }

    std::cerr << "Reading street file: " << config.file_path << std::endl;
    geo::GeospatialDataset dataset = io::GeoJSONReader::readFromFile(config.file_path);
    std::cerr << "Street feature count: " << dataset.features.size() << std::endl;

    auto built = std::make_shared<const StreetSpatialIndex>(
        StreetSpatialIndex::build(dataset, config.projected_epsg));
    street_indexes_[key] = built;
    build_count_++;
    return built;
}

size_t IndexCache::getBuildCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_count_;
}

void IndexCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    zone_indexes_.clear();
    street_indexes_.clear();
}

} // namespace index
} // namespace zonefind
