#include <iostream>
#include <string>
#include <unordered_map>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "interface/tool_interface.hpp"
#include "io/result_writer.hpp"

using namespace tool_interface;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --mode <mode> --zone-file-path <path> --lat <value> --lon <value> [options]\n"
              << "\nRequired arguments:\n"
              << "  --mode <mode>                Operation mode: 'locate' or 'viability'\n"
              << "  --zone-file-path <path>      Path to the zoning polygon GeoJSON file (WGS84)\n"
              << "  --lat <value>                Latitude of the location in degrees\n"
              << "  --lon <value>                Longitude of the location in degrees\n"
              << "\nOptional arguments:\n"
              << "  --street-file-path <path>    Path to the street centerline GeoJSON file (WGS84)\n"
              << "  --max-street-distance <m>    Search radius for the nearest street in meters (default: 120.0)\n"
              << "  --projected-epsg <code>      Metric CRS used for street distances (default: UTM zone of the streets)\n"
              << "  --output-file <path>         Write the JSON result to this file instead of standard output\n"
              << "\nFor viability mode, additional required arguments:\n"
              << "  --rules-file-path <path>     Path to the JSON export of the rule tables\n"
              << "  --use-code <code>            Use type code (e.g. RES_UNI)\n"
              << "  --frontage <m>               Lot frontage in meters\n"
              << "  --depth <m>                  Lot depth in meters\n"
              << "\nFor viability mode, additional optional arguments:\n"
              << "  --use-label <text>           Use type label\n"
              << "  --use-category <text>        Use type category\n"
              << "  --corner                     Lot is on a corner\n"
              << "  --corner-two-frontages       Corner lot is regulated with two frontages\n"
              << "  --attach-one-side            Build on one side boundary where the zone allows it\n"
              << "  --usable-area <m2>           Usable floor area for parking and sanitary rules\n"
              << "  --desired-total-area <m2>    Proposed total floor area (residential simulation)\n"
              << "  --desired-floors <n>         Proposed number of floors (residential simulation)\n"
              << "  --near-transit               Lot is near a mass transit line (20% parking discount)\n"
              << "  --local-street               Lot faces a local street (overrides the street hierarchy)\n"
              << "  --apartments <n>             Number of apartments\n"
              << "  --apartment-area <m2>        Area of each apartment\n"
              << "\nExamples:\n"
              << "  " << programName << " --mode locate --zone-file-path zones.geojson --street-file-path streets.geojson --lat -5.79 --lon -35.21\n"
              << "  " << programName << " --mode viability --zone-file-path zones.geojson --street-file-path streets.geojson --rules-file-path rules.json --lat -5.79 --lon -35.21 --use-code RES_UNI --frontage 10 --depth 30\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "ZoneFind - Municipal Zoning Viability Tool\n"
              << "==========================================\n\n"
              << "ZoneFind locates a point in the municipal zoning map and evaluates the building rules for a lot.\n\n"
              << "MODES:\n\n"
              << "1. LOCATE MODE (--mode locate)\n"
              << "   Finds the zone polygon containing the point and the nearest street within the search radius.\n\n"
              << "   Required Arguments:\n"
              << "     --zone-file-path <path>     Path to the zoning polygon file\n"
              << "     --lat <value>               Latitude in degrees [-90, 90]\n"
              << "     --lon <value>               Longitude in degrees [-180, 180]\n\n"
              << "   Optional Arguments:\n"
              << "     --street-file-path <path>   Path to the street centerline file\n"
              << "     --max-street-distance <m>   Search radius for the nearest street (default: 120.0)\n"
              << "     --projected-epsg <code>     Metric CRS for street distances (default: UTM zone of the streets)\n"
              << "     --output-file <path>        Output file path for the JSON result\n\n"
              << "   Example:\n"
              << "     " << programName << " --mode locate --zone-file-path zones.geojson --street-file-path streets.geojson --lat -5.79 --lon -35.21\n\n"
              << "2. VIABILITY MODE (--mode viability)\n"
              << "   Locates the lot, then computes occupancy, floor area, setback envelope, implantation options,\n"
              << "   lot conformity, the residential viability simulation, parking stalls and sanitary fixtures.\n\n"
              << "   Required Arguments:\n"
              << "     --zone-file-path <path>     Path to the zoning polygon file\n"
              << "     --rules-file-path <path>    Path to the rule tables (zone_rules, parking_rules_v2, parking_rules,\n"
              << "                                 use_sanitary_profile, sanitary_profiles)\n"
              << "     --lat <value>               Latitude in degrees\n"
              << "     --lon <value>               Longitude in degrees\n"
              << "     --use-code <code>           Use type code\n"
              << "     --frontage <m>              Lot frontage in meters\n"
              << "     --depth <m>                 Lot depth in meters\n\n"
              << "   Optional Arguments:\n"
              << "     --street-file-path <path>   Path to the street centerline file\n"
              << "     --max-street-distance <m>   Search radius for the nearest street (default: 120.0)\n"
              << "     --projected-epsg <code>     Metric CRS for street distances\n"
              << "     --use-label <text>          Use type label\n"
              << "     --use-category <text>       Use type category\n"
              << "     --corner                    Lot is on a corner\n"
              << "     --corner-two-frontages      Corner lot with two frontages\n"
              << "     --attach-one-side           Build on one side boundary\n"
              << "     --usable-area <m2>          Usable floor area\n"
              << "     --desired-total-area <m2>   Proposed total floor area\n"
              << "     --desired-floors <n>        Proposed number of floors\n"
              << "     --near-transit              Lot is near a mass transit line\n"
              << "     --local-street              Lot faces a local street\n"
              << "     --apartments <n>            Number of apartments\n"
              << "     --apartment-area <m2>       Area of each apartment\n"
              << "     --output-file <path>        Output file path for the JSON result\n\n"
              << "   Example:\n"
              << "     " << programName << " --mode viability --zone-file-path zones.geojson --rules-file-path rules.json --lat -5.79 --lon -35.21 --use-code RES_UNI --frontage 10 --depth 30\n\n"
              << "INPUT DATASET RECOMMENDATIONS:\n\n"
              << "Coordinate System:\n"
              << "  - Zone and street files must be GeoJSON in WGS84 (EPSG:4326)\n"
              << "  - Street distances are measured in a projected CRS in meters\n\n"
              << "Zone Polygons:\n"
              << "  - Zone code read from sigla, SIGLA, zona_sigla, ZONA_SIGLA or name\n"
              << "  - Zone name read from zona, ZONA, nome or NOME\n\n"
              << "Street Centerlines:\n"
              << "  - Street name read from log_ofic, LOG_OFIC, name, nome or NOME\n"
              << "  - Street class read from hierarquia or HIERARQUIA\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

// Negative numbers are values, not flags
bool isNegativeNumber(const char* text) {
    return text[0] == '-' && (std::isdigit(static_cast<unsigned char>(text[1])) || text[1] == '.');
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Check if this is a flag argument (no value) or a key-value argument
            if (i + 1 < argc && (argv[i + 1][0] != '-' || isNegativeNumber(argv[i + 1]))) {
                // This is a key-value argument
                std::string value = argv[i + 1];
                args[key] = value;
                i++; // Skip the value in next iteration
            } else {
                // This is a flag argument - set it to "true"
                args[key] = "true";
            }
        } else if (arg == "-h") {
            args["help"] = "true";
        } else if (arg == "-v") {
            args["version"] = "true";
        }
    }

    return args;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0) {
            std::cout << "ZoneFind v1.0.0\n";
            std::cout << "Municipal Zoning Viability Tool\n";
            return 0;
        }

        // Check for required arguments
        if (args.count("mode") == 0) {
            std::cerr << "Error: --mode is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("zone-file-path") == 0) {
            std::cerr << "Error: --zone-file-path is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("lat") == 0 || args.count("lon") == 0) {
            std::cerr << "Error: --lat and --lon are required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::string mode = args.at("mode");

        if (mode == "viability") {
            for (const char* required : {"rules-file-path", "use-code", "frontage", "depth"}) {
                if (args.count(required) == 0) {
                    std::cerr << "Error: --" << required << " is required for viability mode" << std::endl;
                    printUsage(argv[0]);
                    return 1;
                }
            }
        }

        // Convert arguments to JSON configurations
        nlohmann::json zone_config = nlohmann::json::object();
        zone_config["file_path"] = args.at("zone-file-path");

        nlohmann::json street_config = nlohmann::json::object();
        if (args.count("street-file-path")) street_config["file_path"] = args.at("street-file-path");
        if (args.count("projected-epsg")) street_config["projected_epsg"] = std::stoi(args.at("projected-epsg"));

        nlohmann::json query = nlohmann::json::object();
        query["lat"] = std::stod(args.at("lat"));
        query["lon"] = std::stod(args.at("lon"));
        if (args.count("max-street-distance")) query["max_street_distance_m"] = std::stod(args.at("max-street-distance"));

        std::string result;

        if (mode == "locate") {
            result = processLocationTool(
                zone_config.dump(),
                street_config.dump(),
                query.dump()
            );
        } else if (mode == "viability") {
            nlohmann::json rules_config = nlohmann::json::object();
            rules_config["file_path"] = args.at("rules-file-path");

            query["use_code"] = args.at("use-code");
            if (args.count("use-label")) query["use_label"] = args.at("use-label");
            if (args.count("use-category")) query["use_category"] = args.at("use-category");
            query["frontage_m"] = std::stod(args.at("frontage"));
            query["depth_m"] = std::stod(args.at("depth"));
            query["is_corner"] = args.count("corner") > 0;
            query["corner_has_two_frontages"] = args.count("corner-two-frontages") > 0;
            query["attach_one_side"] = args.count("attach-one-side") > 0;
            query["near_transit"] = args.count("near-transit") > 0;
            if (args.count("local-street")) query["local_street"] = true;
            if (args.count("usable-area")) query["usable_area_m2"] = std::stod(args.at("usable-area"));
            if (args.count("desired-total-area")) query["desired_total_area_m2"] = std::stod(args.at("desired-total-area"));
            if (args.count("desired-floors")) query["desired_floors"] = std::stoi(args.at("desired-floors"));
            if (args.count("apartments")) query["apartments"] = std::stoi(args.at("apartments"));
            if (args.count("apartment-area")) query["apartment_area_m2"] = std::stod(args.at("apartment-area"));

            result = processViabilityTool(
                zone_config.dump(),
                street_config.dump(),
                rules_config.dump(),
                query.dump()
            );
        } else {
            std::cerr << "Error: Unknown mode '" << mode << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            std::cerr << result << std::endl;
            return 1;
        }

        if (args.count("output-file")) {
            if (!zonefind::io::ResultWriter::writeToFile(nlohmann::json::parse(result), args.at("output-file"))) {
                std::cerr << "Error: " << zonefind::io::ResultWriter::getLastError() << std::endl;
                return 1;
            }
            std::cout << "Result written to " << args.at("output-file") << std::endl;
        } else {
            std::cout << result << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
