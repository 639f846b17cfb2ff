#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "CFSM.hpp"
#include "Catalog.hpp"
#include <string>
#include <map>
#include <vector>
#include <istream>

namespace CFSM {

/**
 * @brief Parameters of one stress-transfer run
 */
struct RunConfig {
    // [run]
    std::string rupture_source;             // Path to the SRCMOD .fsp file
    double coefficient_of_friction = 0.4;   // 0-1, typically 0-0.85
    double lame_lambda = 3.0e10;            // Pa
    double shear_modulus_mu = 3.0e10;       // Pa
    double near_field_distance = 300.0e3;   // Buffer radius (m)
    double spacing_grid = 5.0e3;            // Grid spacing (m)
    double obs_depth = -2.5e3;              // Observation depth (m, negative down)
    int days = 365;                         // Catalog window after the event
    CatalogType catalog_type = CatalogType::REV;

    // [catalog]
    std::string catalog_directory = "isc";
    double catalog_radius_km = 1000.0;      // Coarse pre-filter around the epicenter

    // [output]
    std::string output_prefix = "cfsm_output";
    bool plot = true;
    std::string plot_directory = "plots";

    // [geometry]
    std::string projection = "utm";         // utm or local
    int circle_points = 360;

    /**
     * @brief Fail fast on out-of-range parameters
     * @throws ConfigurationError naming the first offending parameter
     */
    void validate() const;
};

/**
 * @brief INI-style configuration reader
 *
 * Format:
 *   [section]
 *   key = value     # inline comment
 * Lines starting with # or ; are comments.
 */
class ConfigReader {
public:
    ConfigReader();

    bool loadFile(const std::string& filename);
    bool loadString(const std::string& text);

    /**
     * @brief Fill a RunConfig from the [run], [catalog], [output] and
     *        [geometry] sections, keeping defaults for absent keys
     * @throws ConfigurationError for malformed values
     */
    RunConfig parseRunConfig() const;

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& in);
    std::string trim(const std::string& str) const;

    // Typed getters that reject malformed values instead of defaulting
    double requireDouble(const std::string& section, const std::string& key,
                         double default_val) const;
    int requireInt(const std::string& section, const std::string& key,
                   int default_val) const;
};

} // namespace CFSM

#endif // CONFIG_READER_HPP
