#ifndef ZONEFIND_PROPERTY_ALIASES_HPP
#define ZONEFIND_PROPERTY_ALIASES_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zonefind {
namespace index {

// Logical fields read from upstream feature properties
enum class PropertyField {
    ZONE_CODE,
    ZONE_NAME,
    STREET_NAME,
    STREET_CLASS
};

/**
 * Ordered key spellings for each logical field. Upstream layers are not
 * consistent about casing and naming, so each field is read by trying its
 * aliases in order.
 */
class PropertyAliases {
public:
    /**
     * Get the ordered alias list for a field
     * @param field Logical field
     * @return Property keys, most preferred first
     */
    static const std::vector<std::string>& getAliases(PropertyField field);

    /**
     * Return the first non-empty value of a field
     * @param properties Feature property mapping
     * @param field Logical field
     * @return Value formatted as text, or empty string if no alias is set
     */
    static std::string firstNonEmpty(const nlohmann::json& properties, PropertyField field);

    /**
     * Return the first non-empty value among explicit keys
     * @param properties Feature property mapping
     * @param keys Keys tried in order
     * @return Value formatted as text, or empty string if no key is set
     */
    static std::string firstNonEmpty(const nlohmann::json& properties, const std::vector<std::string>& keys);

    /**
     * Ensure every recognised zone key is present (missing or null becomes "")
     * @param properties Raw zone feature properties
     * @return Normalised copy
     */
    static nlohmann::json normalizeZoneProperties(const nlohmann::json& properties);

private:
    // Disable instantiation
    PropertyAliases() = delete;
};

} // namespace index
} // namespace zonefind

#endif // ZONEFIND_PROPERTY_ALIASES_HPP
