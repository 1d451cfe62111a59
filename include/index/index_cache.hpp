#ifndef ZONEFIND_INDEX_CACHE_HPP
#define ZONEFIND_INDEX_CACHE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "index/zone_index.hpp"
#include "index/street_index.hpp"

namespace zonefind {
namespace index {

/**
 * Memoises built spatial indexes per dataset identity (path, size and
 * modification time), so an unchanged file is indexed once per process.
 * A modified file gets a new key and is rebuilt on next request.
 */
class IndexCache {
public:
    IndexCache() : build_count_(0) {}

    // Disable copy constructor and assignment
    IndexCache(const IndexCache&) = delete;
    IndexCache& operator=(const IndexCache&) = delete;

    /**
     * Process-wide cache shared by the tool interface
     */
    static std::shared_ptr<IndexCache> global();

    /**
     * Get the zone index for a dataset, building it on first request
     * @param config Zone index configuration
     * @return Shared immutable index
     * @throws std::runtime_error if the file cannot be read
     */
    std::shared_ptr<const ZoneSpatialIndex> getZoneIndex(const ZoneIndexConfig& config);

    /**
     * Get the street index for a dataset, building it on first request
     * @param config Street index configuration
     * @return Shared immutable index
     * @throws std::runtime_error if the file cannot be read or projected
     */
    std::shared_ptr<const StreetSpatialIndex> getStreetIndex(const StreetIndexConfig& config);

    /**
     * Compute the identity key of a dataset file
     * @param file_path Path to the dataset
     * @return "absolute_path|size|mtime"
     * @throws std::runtime_error if the file does not exist
     */
    static std::string datasetKey(const std::string& file_path);

    /**
     * Get the number of indexes built by this cache
     * @return Build count
     */
    size_t getBuildCount() const;

    /**
     * Drop every cached index
     */
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const ZoneSpatialIndex>> zone_indexes_;
    std::map<std::string, std::shared_ptr<const StreetSpatialIndex>> street_indexes_;
    size_t build_count_;
};

} // namespace index
} // namespace zonefind

#endif // ZONEFIND_INDEX_CACHE_HPP
