#include "rules/sanitary.hpp"
#include "geo/common.hpp"
#include <cmath>
#include <regex>
#include <stdexcept>

namespace zonefind {
namespace rules {

const std::vector<std::string> SANITARY_FIXTURE_KEYS = {
    "lavatórios", "aparelhos_sanitários", "chuveiros", "mictórios"};

namespace {

const char* const DEFAULT_GROUP_NAME = "GERAL";

SanitaryBand parseBand(const nlohmann::json& band_json) {
    SanitaryBand band;
    band.min_m2 = geo::getFieldValueAsDouble(band_json, "min_m2").value_or(0.0);
    band.max_m2 = geo::getFieldValueAsDouble(band_json, "max_m2");
    band.note = geo::getFieldValueAsString(band_json, "note");

    for (const auto& key : SANITARY_FIXTURE_KEYS) {
        FixtureSpec spec;
        auto it = band_json.find(key);
        if (it != band_json.end() && it->is_number()) {
            spec.count = static_cast<int>(it->get<double>());
        } else {
            spec.formula = geo::getFieldValueAsString(band_json, key + "_formula");
            if (!spec.formula.empty()) {
                spec.divisor = parseFormulaDivisor(spec.formula);
            }
        }
        band.fixtures[key] = spec;
    }
    return band;
}

} // namespace

std::optional<double> parseFormulaDivisor(const std::string& formula) {
    static const std::regex pattern(R"(1\s*/\s*([\d\.,]+)\s*m)");
    std::smatch match;
    if (!std::regex_search(formula, match, pattern)) {
        return std::nullopt;
    }

    std::string number;
    for (char c : match[1].str()) {
        if (c == '.') {
            continue;
        }
        number.push_back(c == ',' ? '.' : c);
    }

    try {
        double divisor = std::stod(number);
        if (!std::isfinite(divisor) || divisor <= 0.0) {
            return std::nullopt;
        }
        return divisor;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<SanitaryProfile> SanitaryProfile::fromJson(const nlohmann::json& rule_json) {
    if (!rule_json.is_object()) {
        return std::nullopt;
    }

    SanitaryProfile profile;
    profile.code = geo::getFieldValueAsString(rule_json, "sanitary_profile");
    profile.title = geo::getFieldValueAsString(rule_json, "title");
    profile.source_ref = geo::getFieldValueAsString(rule_json, "source_ref");

    if (rule_json.contains("groups") && rule_json["groups"].is_array()) {
        for (const auto& group_json : rule_json["groups"]) {
            if (!group_json.is_object()) {
                continue;
            }
            SanitaryGroup group;
            group.name = geo::getFieldValueAsString(group_json, "group");
            if (group.name.empty()) {
                group.name = DEFAULT_GROUP_NAME;
            }
            if (group_json.contains("bands") && group_json["bands"].is_array()) {
                for (const auto& band_json : group_json["bands"]) {
                    if (band_json.is_object()) {
                        group.bands.push_back(parseBand(band_json));
                    }
                }
            }
            profile.groups.push_back(group);
        }
    }

    return profile;
}

SanitaryResult computeSanitary(const std::optional<SanitaryProfile>& profile, double usable_area_m2) {
    SanitaryResult result;
    result.usable_area_m2 = usable_area_m2;

    if (!profile) {
        result.status = RuleStatus::NO_RULE;
        result.notes.push_back("No sanitary profile registered for this use");
        return result;
    }

    if (!(usable_area_m2 > 0.0)) {
        result.status = RuleStatus::INSUFFICIENT_DATA;
        result.notes.push_back("Usable area is required to size the sanitary facilities");
        return result;
    }

    for (const auto& group : profile->groups) {
        const SanitaryBand* chosen = nullptr;
        for (const auto& band : group.bands) {
            if (band.contains(usable_area_m2)) {
                chosen = &band;
                break;
            }
        }
        if (!chosen) {
            continue;
        }

        SanitaryGroupResult group_result;
        group_result.group = group.name;
        group_result.note = chosen->note;

        for (const auto& key : SANITARY_FIXTURE_KEYS) {
            std::optional<int> count;
            auto it = chosen->fixtures.find(key);
            if (it != chosen->fixtures.end()) {
                if (it->second.count) {
                    count = it->second.count;
                } else if (it->second.divisor) {
                    count = static_cast<int>(std::ceil(usable_area_m2 / it->second.divisor.value()));
                }
            }
            group_result.fixtures[key] = count;
            if (count) {
                result.totals[key] += count.value();
            }
        }

        result.groups.push_back(group_result);
    }

    if (result.groups.empty()) {
        result.status = RuleStatus::INSUFFICIENT_DATA;
        result.notes.push_back("No band of the sanitary profile covers this usable area");
        return result;
    }

    result.status = RuleStatus::COMPUTED;
    return result;
}

} // namespace rules
} // namespace zonefind
