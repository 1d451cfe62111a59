#ifndef ZONEFIND_RESULT_WRITER_HPP
#define ZONEFIND_RESULT_WRITER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "index/location_resolver.hpp"
#include "rules/envelope.hpp"
#include "rules/parking.hpp"
#include "rules/sanitary.hpp"
#include "rules/urbanism.hpp"

namespace zonefind {
namespace io {

/**
 * Converts query and rule results to JSON documents
 */
class ResultWriter {
public:
    static nlohmann::json toJson(const index::LocationResult& result);
    static nlohmann::json toJson(const rules::EnvelopeResult& envelope);
    static nlohmann::json toJson(const rules::FootprintLimit& footprint);
    static nlohmann::json toJson(const rules::UrbanismResult& result);
    static nlohmann::json toJson(const rules::ViabilitySimulation& simulation);
    static nlohmann::json toJson(const rules::ParkingResult& result);
    static nlohmann::json toJson(const rules::LegacyParkingResult& result);
    static nlohmann::json toJson(const rules::SanitaryResult& result);

    /**
     * Write a JSON document to a file
     * @param document Document to write
     * @param filepath Path to the output file
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const nlohmann::json& document, const std::string& filepath);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    /**
     * Set error message
     * @param error Error message to set
     */
    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    ResultWriter() = delete;
};

} // namespace io
} // namespace zonefind

#endif // ZONEFIND_RESULT_WRITER_HPP
