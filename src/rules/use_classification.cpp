#include "rules/use_classification.hpp"
#include <algorithm>
#include <cctype>

namespace zonefind {
namespace rules {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// ASCII case mapping; accented letters in labels are matched as written
std::string upper(const std::string& s) {
    std::string out = trim(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string lower(const std::string& s) {
    std::string out = trim(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool has(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

} // namespace

bool isSingleFamilyUse(const UseType& use) {
    std::string code = upper(use.code);
    std::string label = lower(use.label);
    std::string category = lower(use.category);

    if (startsWith(code, "RES_UNI") || code == "RESUNI" || code == "RES_UNIF" || code == "RES_UNIFAMILIAR") {
        return true;
    }
    if (startsWith(code, "RES") && has(code, "UNI")) {
        return true;
    }
    if (has(label, "unifamiliar") || (has(label, "casa") && has(label, "res"))) {
        return true;
    }
    if (category == "residencial" && (has(label, "unifamiliar") || has(label, "casa"))) {
        return true;
    }
    return false;
}

bool isMultiFamilyUse(const UseType& use) {
    std::string code = upper(use.code);
    std::string label = lower(use.label);
    std::string category = lower(use.category);

    if (startsWith(code, "RES_MULTI") || code == "RESMULTI" || code == "RES_MF" || code == "RES_MULTIFAMILIAR") {
        return true;
    }
    if (startsWith(code, "RES") && (has(code, "MULTI") || has(code, "MF"))) {
        return true;
    }
    bool building_words = has(label, "multifamiliar") || has(label, "prédio") || has(label, "predio");
    if (building_words || (has(label, "apartamento") && has(label, "res"))) {
        return true;
    }
    if (category == "residencial" && (building_words || has(label, "apartamento"))) {
        return true;
    }
    return false;
}

bool isResidentialUse(const UseType& use) {
    return isSingleFamilyUse(use) || isMultiFamilyUse(use) || has(upper(use.code), "RESIDEN");
}

bool isLocalStreetClass(const std::string& street_class) {
    return has(lower(street_class), "local");
}

} // namespace rules
} // namespace zonefind
