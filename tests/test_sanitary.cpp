#include <doctest/doctest.h>
#include <optional>
#include <nlohmann/json.hpp>
#include "rules/rule_repository.hpp"
#include "rules/sanitary.hpp"
#include "test_support.hpp"

using nlohmann::json;

using zonefind::rules::JsonRuleRepository;
using zonefind::rules::RuleStatus;
using zonefind::rules::SanitaryProfile;
using zonefind::rules::SanitaryResult;

using zonefind::rules::computeSanitary;
using zonefind::rules::parseFormulaDivisor;

namespace {

SanitaryProfile commerceProfile() {
    JsonRuleRepository repository(test_support::ruleTables());
    auto profile = repository.getSanitaryProfile("COM_VAREJO");
    REQUIRE(profile.has_value());
    return profile.value();
}

} // namespace

// -----------------------------------------------------------------------------
// Tests for parseFormulaDivisor
// -----------------------------------------------------------------------------

TEST_CASE("formula divisors use Brazilian number formatting") {
    CHECK(parseFormulaDivisor("1/300,00m² ou fração").value() == doctest::Approx(300.0));
    CHECK(parseFormulaDivisor("1/1.500,00m²").value() == doctest::Approx(1500.0));
    CHECK(parseFormulaDivisor("1 / 75 m² de área útil").value() == doctest::Approx(75.0));
}

TEST_CASE("formulas without a divisor are not computable") {
    CHECK_FALSE(parseFormulaDivisor("A critério do órgão competente").has_value());
    CHECK_FALSE(parseFormulaDivisor("").has_value());
    CHECK_FALSE(parseFormulaDivisor("1/0,00m²").has_value());
}

// -----------------------------------------------------------------------------
// Tests for computeSanitary
// -----------------------------------------------------------------------------

TEST_CASE("each group uses the first band containing the area") {
    SanitaryResult result = computeSanitary(commerceProfile(), 400.0);

    CHECK(result.status == RuleStatus::COMPUTED);
    REQUIRE(result.groups.size() == 2);

    CHECK(result.groups[0].group == "PUBLICO");
    CHECK(result.groups[0].fixtures["lavatórios"].value() == 2);
    CHECK(result.groups[0].fixtures["aparelhos_sanitários"].value() == 2);
    CHECK_FALSE(result.groups[0].fixtures["chuveiros"].has_value());
    CHECK_FALSE(result.groups[0].fixtures["mictórios"].has_value());

    CHECK(result.groups[1].group == "FUNCIONARIOS");
    CHECK(result.groups[1].fixtures["chuveiros"].value() == 1);

    CHECK(result.totals["lavatórios"] == 3);
    CHECK(result.totals["aparelhos_sanitários"] == 3);
    CHECK(result.totals["chuveiros"] == 1);
    CHECK(result.totals.count("mictórios") == 0);
}

TEST_CASE("small premises fall in the first band with its note") {
    SanitaryResult result = computeSanitary(commerceProfile(), 80.0);

    REQUIRE(result.groups.size() == 2);
    CHECK(result.groups[0].fixtures["lavatórios"].value() == 1);
    CHECK(result.groups[0].note == "Single unisex facility");

    // Band bounds are inclusive, so 150 m2 still uses the first band
    SanitaryResult edge = computeSanitary(commerceProfile(), 150.0);
    CHECK(edge.groups[0].note == "Single unisex facility");
}

TEST_CASE("missing profile and missing area are reported") {
    SanitaryResult no_rule = computeSanitary(std::nullopt, 400.0);
    CHECK(no_rule.status == RuleStatus::NO_RULE);
    CHECK(no_rule.groups.empty());

    SanitaryResult no_area = computeSanitary(commerceProfile(), 0.0);
    CHECK(no_area.status == RuleStatus::INSUFFICIENT_DATA);
    CHECK_FALSE(no_area.notes.empty());
}

TEST_CASE("areas outside every band are insufficient data") {
    auto profile = SanitaryProfile::fromJson(json::parse(R"({"groups": [
        {"bands": [{"min_m2": 0, "max_m2": 100, "lavatórios": 1}]}
    ]})"));
    REQUIRE(profile.has_value());
    CHECK(profile->groups[0].name == "GERAL");

    CHECK(computeSanitary(profile, 50.0).status == RuleStatus::COMPUTED);
    CHECK(computeSanitary(profile, 500.0).status == RuleStatus::INSUFFICIENT_DATA);
}
