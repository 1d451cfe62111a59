#ifndef ZONEFIND_USE_CLASSIFICATION_HPP
#define ZONEFIND_USE_CLASSIFICATION_HPP

#include <string>

namespace zonefind {
namespace rules {

// Land-use type as catalogued by the rules database
struct UseType {
    std::string code;       // e.g. "RES_UNI"
    std::string label;      // e.g. "Residencial Unifamiliar (Casa)"
    std::string category;   // e.g. "Residencial"

    UseType() = default;
    UseType(const std::string& use_code, const std::string& use_label = "", const std::string& use_category = "")
        : code(use_code), label(use_label), category(use_category) {}
};

/**
 * Single-family housing, recognised by code pattern (RES_UNI...) or label words
 */
bool isSingleFamilyUse(const UseType& use);

/**
 * Multi-family housing, recognised by code pattern (RES_MULTI..., RES_MF) or label words
 */
bool isMultiFamilyUse(const UseType& use);

bool isResidentialUse(const UseType& use);

/**
 * Street hierarchy class counts as a local street
 * @param street_class Hierarchy value from the street layer (e.g. "Local", "VIA LOCAL")
 */
bool isLocalStreetClass(const std::string& street_class);

} // namespace rules
} // namespace zonefind

#endif // ZONEFIND_USE_CLASSIFICATION_HPP
