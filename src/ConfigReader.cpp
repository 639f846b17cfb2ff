#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace CFSM {

// =============================================================================
// RunConfig
// =============================================================================

void RunConfig::validate() const {
    if (rupture_source.empty()) {
        throw ConfigurationError("run.rupture_source is required");
    }
    if (!(coefficient_of_friction >= 0.0 && coefficient_of_friction <= 1.0)) {
        throw ConfigurationError("run.coefficient_of_friction must be within [0, 1]");
    }
    if (!(shear_modulus_mu > 0.0)) {
        throw ConfigurationError("run.shear_modulus_mu must be positive");
    }
    if (!(lame_lambda > 0.0)) {
        throw ConfigurationError("run.lame_lambda must be positive");
    }
    if (!(near_field_distance > 0.0)) {
        throw ConfigurationError("run.near_field_distance must be positive");
    }
    if (!(spacing_grid > 0.0)) {
        throw ConfigurationError("run.spacing_grid must be positive");
    }
    if (!(obs_depth <= 0.0)) {
        throw ConfigurationError("run.obs_depth must be zero or negative (meters, negative down)");
    }
    if (days < 0) {
        throw ConfigurationError("run.days must not be negative");
    }
    if (!(catalog_radius_km > 0.0)) {
        throw ConfigurationError("catalog.radius_km must be positive");
    }
    if (projection != "utm" && projection != "local") {
        throw ConfigurationError("geometry.projection must be utm or local");
    }
    if (circle_points < 8) {
        throw ConfigurationError("geometry.circle_points must be at least 8");
    }
    if (output_prefix.empty()) {
        throw ConfigurationError("output.prefix must not be empty");
    }
}

// =============================================================================
// ConfigReader
// =============================================================================

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

double ConfigReader::requireDouble(const std::string& section, const std::string& key,
                                   double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t used = 0;
    double result = 0.0;
    try {
        result = std::stod(val, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != val.size()) {
        throw ConfigurationError(section + "." + key + ": '" + val + "' is not a number");
    }
    return result;
}

int ConfigReader::requireInt(const std::string& section, const std::string& key,
                             int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(val, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != val.size()) {
        throw ConfigurationError(section + "." + key + ": '" + val + "' is not an integer");
    }
    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

RunConfig ConfigReader::parseRunConfig() const {
    RunConfig config;

    config.rupture_source = getString("run", "rupture_source", config.rupture_source);
    config.coefficient_of_friction = requireDouble("run", "coefficient_of_friction",
                                                   config.coefficient_of_friction);

    // A single modulus sets both Lame parameters
    if (hasKey("run", "mu_lambda_lame")) {
        double m = requireDouble("run", "mu_lambda_lame", config.shear_modulus_mu);
        config.lame_lambda = m;
        config.shear_modulus_mu = m;
    }
    config.lame_lambda = requireDouble("run", "lame_lambda", config.lame_lambda);
    config.shear_modulus_mu = requireDouble("run", "shear_modulus_mu", config.shear_modulus_mu);

    config.near_field_distance = requireDouble("run", "near_field_distance",
                                               config.near_field_distance);
    config.spacing_grid = requireDouble("run", "spacing_grid", config.spacing_grid);
    config.obs_depth = requireDouble("run", "obs_depth", config.obs_depth);
    config.days = requireInt("run", "days", config.days);

    std::string catalog = getString("run", "catalog_type", toString(config.catalog_type));
    config.catalog_type = parseCatalogType(catalog);

    config.catalog_directory = getString("catalog", "directory", config.catalog_directory);
    config.catalog_radius_km = requireDouble("catalog", "radius_km", config.catalog_radius_km);

    config.output_prefix = getString("output", "prefix", config.output_prefix);
    config.plot = getBool("output", "plot", config.plot);
    config.plot_directory = getString("output", "plot_dir", config.plot_directory);

    config.projection = getString("geometry", "projection", config.projection);
    config.circle_points = requireInt("geometry", "circle_points", config.circle_points);

    return config;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot write template configuration: " + filename);
    }

    file << "# CFSM Configuration File\n";
    file << "# All units in SI unless otherwise specified\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[run]\n";
    file << "rupture_source = s1999HECTOR01SALI.fsp   # SRCMOD finite-fault file\n";
    file << "coefficient_of_friction = 0.4             # 0 - 1 (typically 0 - 0.85)\n";
    file << "# mu_lambda_lame = 3.0e10                 # Sets both Lame parameters (Pa)\n";
    file << "lame_lambda = 3.0e10                      # Pa\n";
    file << "shear_modulus_mu = 3.0e10                 # Pa\n";
    file << "near_field_distance = 300.0e3             # Buffer radius around the fault (m)\n";
    file << "spacing_grid = 5.0e3                      # Grid spacing (m)\n";
    file << "obs_depth = -2.5e3                        # Observation depth (m, negative down)\n";
    file << "days = 365                                # Catalog window after the event\n";
    file << "catalog_type = rev                        # comp, ehb or rev\n\n";

    file << "[catalog]\n";
    file << "directory = isc                           # Holds <type>csv/<year>.csv\n";
    file << "radius_km = 1000.0                        # Coarse filter around the epicenter\n\n";

    file << "[output]\n";
    file << "prefix = cfsm_output\n";
    file << "plot = true                               # Render with gnuplot\n";
    file << "plot_dir = plots\n\n";

    file << "[geometry]\n";
    file << "projection = utm                          # utm or local\n";
    file << "circle_points = 360                       # Vertices per buffer circle\n";
}

} // namespace CFSM
