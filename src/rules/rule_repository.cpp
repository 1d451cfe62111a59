#include "rules/rule_repository.hpp"
#include "geo/common.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace zonefind {
namespace rules {

namespace {

// rule_json may be stored as an object or as JSON text
nlohmann::json ruleJsonOf(const nlohmann::json& row) {
    if (!row.contains("rule_json")) {
        return nlohmann::json();
    }
    const auto& value = row["rule_json"];
    if (value.is_string()) {
        nlohmann::json parsed = nlohmann::json::parse(value.get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            std::cerr << "Warning: Unparseable rule_json text" << std::endl;
            return nlohmann::json();
        }
        return parsed;
    }
    return value;
}

} // namespace

JsonRuleRepository::JsonRuleRepository(const nlohmann::json& document)
    : document_(document.is_object() ? document : nlohmann::json::object()) {
}

std::unique_ptr<JsonRuleRepository> JsonRuleRepository::fromFile(const RulesConfig& config) {
    std::ifstream file(config.file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open rules file: " + config.file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON parse error in rules file " + config.file_path + ": " + e.what());
    }
    if (!document.is_object()) {
        throw std::runtime_error("Rules file must contain a JSON object: " + config.file_path);
    }

    std::cerr << "Loaded rule tables from " << config.file_path << std::endl;
    return std::make_unique<JsonRuleRepository>(document);
}

const nlohmann::json* JsonRuleRepository::findRow(
    const std::string& table, const std::vector<std::pair<std::string, std::string>>& match) const {
    auto it = document_.find(table);
    if (it == document_.end() || !it->is_array()) {
        return nullptr;
    }

    for (const auto& row : *it) {
        if (!row.is_object()) {
            continue;
        }
        bool matches = true;
        for (const auto& column : match) {
            if (geo::getFieldValueAsString(row, column.first) != column.second) {
                matches = false;
                break;
            }
        }
        if (matches) {
            return &row;
        }
    }
    return nullptr;
}

std::optional<RegulatoryRecord> JsonRuleRepository::getZoneRule(const std::string& zone_code,
                                                                const std::string& use_code) const {
    if (zone_code.empty() || use_code.empty()) {
        return std::nullopt;
    }
    const nlohmann::json* row = findRow("zone_rules", {{"zone_sigla", zone_code}, {"use_type_code", use_code}});
    if (!row) {
        return std::nullopt;
    }
    return RegulatoryRecord::fromJson(*row);
}

std::optional<ParkingRuleSet> JsonRuleRepository::getParkingRule(const std::string& use_code) const {
    if (use_code.empty()) {
        return std::nullopt;
    }
    const nlohmann::json* row = findRow("parking_rules_v2", {{"use_code", use_code}});
    if (!row) {
        return std::nullopt;
    }

    nlohmann::json rule_json = ruleJsonOf(*row);
    if (!rule_json.is_object()) {
        return std::nullopt;
    }

    // Row columns fill whatever the rule document leaves out
    if (geo::getFieldValueAsString(rule_json, "use_code").empty()) {
        rule_json["use_code"] = use_code;
    }
    if (geo::getFieldValueAsString(rule_json, "base_metric").empty() && row->contains("base_metric")) {
        rule_json["base_metric"] = (*row)["base_metric"];
    }
    if (!rule_json.contains("general_notes") && row->contains("general_notes")) {
        rule_json["general_notes"] = (*row)["general_notes"];
    }

    auto rule_set = ParkingRuleSet::fromJson(rule_json);
    if (rule_set && rule_set->source_ref.empty()) {
        rule_set->source_ref = geo::getFieldValueAsString(*row, "source_ref");
    }
    return rule_set;
}

std::optional<LegacyParkingRule> JsonRuleRepository::getLegacyParkingRule(const std::string& use_code) const {
    if (use_code.empty()) {
        return std::nullopt;
    }
    const nlohmann::json* row = findRow("parking_rules", {{"use_type_code", use_code}});
    if (!row) {
        return std::nullopt;
    }

    auto rule = LegacyParkingRule::fromJson(*row);
    if (rule) {
        nlohmann::json rule_json = ruleJsonOf(*row);
        if (rule_json.is_object()) {
            rule->rule_json = rule_json;
        }
    }
    return rule;
}

std::optional<SanitaryProfile> JsonRuleRepository::getSanitaryProfile(const std::string& use_code) const {
    if (use_code.empty()) {
        return std::nullopt;
    }
    const nlohmann::json* link = findRow("use_sanitary_profile", {{"use_type_code", use_code}});
    if (!link) {
        return std::nullopt;
    }

    std::string profile_code = geo::getFieldValueAsString(*link, "sanitary_profile");
    if (profile_code.empty()) {
        return std::nullopt;
    }
    const nlohmann::json* row = findRow("sanitary_profiles", {{"sanitary_profile", profile_code}});
    if (!row) {
        return std::nullopt;
    }

    auto profile = SanitaryProfile::fromJson(ruleJsonOf(*row));
    if (profile) {
        profile->code = profile_code;
        profile->title = geo::getFieldValueAsString(*row, "title");
        profile->source_ref = geo::getFieldValueAsString(*row, "source_ref");
    }
    return profile;
}

} // namespace rules
} // namespace zonefind
