#include "geo/common.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace zonefind {
namespace geo {

// GeoJSON Field Value Utilities
std::optional<double> getFieldValueAsDouble(const nlohmann::json& properties,
                                            const std::string& field_name) {
    if (field_name.empty() || !properties.is_object() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];

    if (value.is_number()) {
        double number = value.get<double>();
        if (std::isfinite(number)) {
            return number;
        }
        return std::nullopt;
    } else if (value.is_string()) {
        // Accept Brazilian decimal comma ("1,5") as well as "1.5"
        std::string text = value.get<std::string>();
        for (auto& c : text) {
            if (c == ',') c = '.';
        }
        try {
            size_t consumed = 0;
            double number = std::stod(text, &consumed);
            if (consumed == 0 || !std::isfinite(number)) {
                return std::nullopt;
            }
            return number;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

std::string getFieldValueAsString(const nlohmann::json& properties,
                                  const std::string& field_name,
                                  const std::string& default_value) {
    if (field_name.empty() || !properties.is_object() || !properties.contains(field_name)) {
        return default_value;
    }

    const auto& value = properties[field_name];
    if (value.is_null()) {
        return default_value;
    }
    return scalarToString(value);
}

bool getFieldValueAsBool(const nlohmann::json& properties,
                         const std::string& field_name,
                         bool default_value) {
    if (field_name.empty() || !properties.is_object() || !properties.contains(field_name)) {
        return default_value;
    }

    const auto& value = properties[field_name];

    if (value.is_boolean()) {
        return value.get<bool>();
    } else if (value.is_number_integer()) {
        return value.get<int64_t>() != 0;
    } else if (value.is_string()) {
        const std::string str_val = value.get<std::string>();
        return str_val == "true" || str_val == "1" || str_val == "yes";
    }

    return default_value;
}

std::string scalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    } else if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    } else if (value.is_number_float()) {
        double number = value.get<double>();
        if (std::isfinite(number) && number == std::floor(number) && std::fabs(number) < 1e15) {
            return std::to_string(static_cast<int64_t>(number));
        }
        std::ostringstream oss;
        oss << std::setprecision(15) << number;
        return oss.str();
    } else if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    } else if (value.is_null()) {
        return "";
    }
    return value.dump();
}

} // namespace geo
} // namespace zonefind
