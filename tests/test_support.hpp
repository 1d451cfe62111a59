#ifndef ZONEFIND_TEST_SUPPORT_HPP
#define ZONEFIND_TEST_SUPPORT_HPP

#include <fstream>
#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

namespace test_support {

// Two adjacent zones sharing the meridian -35.20, plus two features the loaders must skip
inline nlohmann::json zoneCollection() {
    return nlohmann::json::parse(R"({
        "type": "FeatureCollection",
        "features": [
            {
                "type": "Feature",
                "properties": {"sigla": "ZA", "zona": "Zona Adensavel"},
                "geometry": {"type": "Polygon", "coordinates": [[
                    [-35.21, -5.81], [-35.20, -5.81], [-35.20, -5.80], [-35.21, -5.80], [-35.21, -5.81]
                ]]}
            },
            {
                "type": "Feature",
                "properties": {"SIGLA": "ZB", "NOME": "Zona de Protecao"},
                "geometry": {"type": "Polygon", "coordinates": [[
                    [-35.20, -5.81], [-35.19, -5.81], [-35.19, -5.80], [-35.20, -5.80], [-35.20, -5.81]
                ]]}
            },
            {
                "type": "Feature",
                "properties": {"sigla": "BROKEN"},
                "geometry": {"type": "Polygon", "coordinates": [[[-35.30, -5.90], [-35.29, -5.90]]]}
            },
            {
                "type": "Feature",
                "properties": {"sigla": "NOGEOM"},
                "geometry": null
            }
        ]
    })");
}

// Two north-south streets: a local one at -35.205 and an arterial at -35.195
inline nlohmann::json streetCollection() {
    return nlohmann::json::parse(R"({
        "type": "FeatureCollection",
        "features": [
            {
                "type": "Feature",
                "properties": {"log_ofic": "Rua das Flores", "hierarquia": "Local"},
                "geometry": {"type": "LineString", "coordinates": [[-35.205, -5.82], [-35.205, -5.79]]}
            },
            {
                "type": "Feature",
                "properties": {"name": "Avenida Norte", "HIERARQUIA": "Arterial"},
                "geometry": {"type": "LineString", "coordinates": [[-35.195, -5.82], [-35.195, -5.79]]}
            }
        ]
    })");
}

// Rule tables in the layout of the rules database export
inline nlohmann::json ruleTables() {
    return nlohmann::json::parse(R"({
        "zone_rules": [
            {
                "zone_sigla": "ZA", "use_type_code": "RES_UNI",
                "to_max": 0.5, "tp_min": 0.2, "ia_max": 1.2,
                "recuo_frontal_m": 5, "recuo_lateral_m": 1.5, "recuo_fundos_m": 3,
                "gabarito_m": 9, "testada_min_meio_m": 8, "allow_attach_one_side": true,
                "source_ref": "LC 208/2022"
            },
            {
                "zone_sigla": "ZA", "use_type_code": "COM_VAREJO",
                "to_max": "0,6", "ia_max": 2,
                "recuo_frontal_m": 3, "recuo_lateral_m": 1.5, "recuo_fundos_m": 1.5,
                "gabarito_pav": 2
            }
        ],
        "parking_rules_v2": [
            {
                "use_code": "COM_VAREJO",
                "base_metric": "area_util_m2",
                "source_ref": "LC 208/2022, Annex 5",
                "rule_json": {
                    "rules": [
                        {"type": "threshold_fixed", "max_m2": 100, "count": 1, "text": "1 stall up to 100 m2"},
                        {"type": "ratio", "per_m2": 50, "text": "1 stall per 50 m2"}
                    ],
                    "cargo_loading": {"text": "Loading bay above 1000 m2"},
                    "general_notes": ["Stalls of 2.5 x 5.0 m"]
                }
            },
            {
                "use_code": "SERV_HOTEL",
                "rule_json": "{\"base_metric\": \"unidades_hospedagem\", \"rules\": [{\"type\": \"ratio\", \"per_units\": 3, \"text\": \"1 stall per 3 rooms\"}]}"
            }
        ],
        "parking_rules": [
            {
                "use_type_code": "RES_MULTI", "metric": "json_rule", "min_vagas": null,
                "rule_json": {
                    "type": "per_unit_by_unit_area", "threshold_unit_area_m2": 90,
                    "rate_below": 1, "rate_at_or_above": 1.5, "rounding": "ceil",
                    "display_text": "1 stall per unit below 90 m2, 1.5 at or above", "moto_percent_max": 0.1
                }
            },
            {"use_type_code": "IND_LEVE", "metric": "per_area", "value": 0.01, "min_vagas": 4}
        ],
        "use_sanitary_profile": [
            {"use_type_code": "COM_VAREJO", "sanitary_profile": "COMERCIO"}
        ],
        "sanitary_profiles": [
            {
                "sanitary_profile": "COMERCIO", "title": "Commerce", "source_ref": "Code of Works, Annex 3",
                "rule_json": {"groups": [
                    {"group": "PUBLICO", "bands": [
                        {"min_m2": 0, "max_m2": 150, "lavatórios": 1, "aparelhos_sanitários": 1,
                         "note": "Single unisex facility"},
                        {"min_m2": 150, "max_m2": null,
                         "lavatórios_formula": "1/300,00m² ou fração",
                         "aparelhos_sanitários_formula": "1/300,00m² ou fração"}
                    ]},
                    {"group": "FUNCIONARIOS", "bands": [
                        {"min_m2": 0, "lavatórios": 1, "aparelhos_sanitários": 1, "chuveiros": 1}
                    ]}
                ]}
            }
        ]
    })");
}

/**
 * File in the system temp directory, removed on destruction
 */
class TempFile {
public:
    TempFile(const std::string& contents, const std::string& extension) {
        path_ = boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("zonefind-%%%%-%%%%-%%%%" + extension);
        std::ofstream file(path_.string());
        if (!file.is_open()) {
            throw std::runtime_error("Failed to create temp file: " + path_.string());
        }
        file << contents;
    }

    ~TempFile() {
        boost::system::error_code ec;
        boost::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    boost::filesystem::path path_;
};

} // namespace test_support

#endif // ZONEFIND_TEST_SUPPORT_HPP
