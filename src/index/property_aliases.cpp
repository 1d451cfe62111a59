#include "index/property_aliases.hpp"
#include "geo/common.hpp"

namespace zonefind {
namespace index {

namespace {

const std::vector<std::string> ZONE_CODE_KEYS = {"sigla", "SIGLA", "zona_sigla", "ZONA_SIGLA", "name"};
const std::vector<std::string> ZONE_NAME_KEYS = {"zona", "ZONA", "nome", "NOME"};
const std::vector<std::string> STREET_NAME_KEYS = {"log_ofic", "LOG_OFIC", "name", "nome", "NOME"};
const std::vector<std::string> STREET_CLASS_KEYS = {"hierarquia", "HIERARQUIA"};

// Keys every zone feature carries after loading
const std::vector<std::string> RECOGNISED_ZONE_KEYS = {"sigla", "zona", "zona_sigla", "nome", "NOME", "SIGLA", "name"};

} // namespace

const std::vector<std::string>& PropertyAliases::getAliases(PropertyField field) {
    switch (field) {
        case PropertyField::ZONE_CODE:
            return ZONE_CODE_KEYS;
        case PropertyField::ZONE_NAME:
            return ZONE_NAME_KEYS;
        case PropertyField::STREET_NAME:
            return STREET_NAME_KEYS;
        case PropertyField::STREET_CLASS:
            return STREET_CLASS_KEYS;
    }
    return ZONE_CODE_KEYS;
}

std::string PropertyAliases::firstNonEmpty(const nlohmann::json& properties, PropertyField field) {
    return firstNonEmpty(properties, getAliases(field));
}

std::string PropertyAliases::firstNonEmpty(const nlohmann::json& properties, const std::vector<std::string>& keys) {
    if (!properties.is_object()) {
        return "";
    }

    for (const auto& key : keys) {
        auto it = properties.find(key);
        if (it == properties.end() || it->is_null()) {
            continue;
        }
        std::string value = geo::scalarToString(*it);
        if (!value.empty()) {
            return value;
        }
    }
    return "";
}

nlohmann::json PropertyAliases::normalizeZoneProperties(const nlohmann::json& properties) {
    nlohmann::json normalized = properties.is_object() ? properties : nlohmann::json::object();
    for (const auto& key : RECOGNISED_ZONE_KEYS) {
        if (!normalized.contains(key) || normalized[key].is_null()) {
            normalized[key] = "";
        }
    }
    return normalized;
}

} // namespace index
} // namespace zonefind
