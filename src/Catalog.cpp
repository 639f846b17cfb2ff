#include "Catalog.hpp"
#include "CoordinateSystem.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace CFSM {

namespace {

const char* const VALID_MAGNITUDE_TYPES[] = {
    "Mb", "mb", "ML", "Ml", "ml", "Mw", "MW", "Ms", "MS"
};

constexpr double MIN_LATITUDE = -80.0;   // UTM domain
constexpr double MAX_LATITUDE = 84.0;

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// Comma separated, with optional double-quoted fields
std::vector<std::string> splitCsv(const std::string& line) {
    std::vector<std::string> cols;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cur += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cur += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cols.push_back(trim(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    cols.push_back(trim(cur));
    return cols;
}

bool toDouble(const std::string& s, double& value) {
    if (s.empty()) return false;
    char* end = nullptr;
    value = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

} // namespace

// =============================================================================
// CatalogType
// =============================================================================

CatalogType parseCatalogType(const std::string& name) {
    if (name == "comp") return CatalogType::COMP;
    if (name == "ehb") return CatalogType::EHB;
    if (name == "rev") return CatalogType::REV;
    throw ConfigurationError("Invalid catalog type '" + name + "' (expected comp, ehb or rev)");
}

std::string toString(CatalogType type) {
    switch (type) {
        case CatalogType::COMP: return "comp";
        case CatalogType::EHB: return "ehb";
        case CatalogType::REV: return "rev";
    }
    return "unknown";
}

// =============================================================================
// IscCatalogReader
// =============================================================================

IscCatalogReader::IscCatalogReader(std::string root_directory, CatalogType type)
    : root_(std::move(root_directory)), type_(type) {}

std::string IscCatalogReader::yearFile(int year) const {
    std::string dir = root_;
    if (!dir.empty() && dir.back() != '/') dir += '/';
    return dir + toString(type_) + "csv/" + std::to_string(year) + ".csv";
}

bool IscCatalogReader::isValidMagnitudeType(const std::string& type) {
    for (const char* valid : VALID_MAGNITUDE_TYPES) {
        if (type == valid) return true;
    }
    return false;
}

bool IscCatalogReader::parseRow(const std::string& line, CatalogEvent& event) {
    std::vector<std::string> cols = splitCsv(line);
    if (cols.size() != NUM_COLUMNS) {
        throw std::invalid_argument("expected " + std::to_string(NUM_COLUMNS) +
                                    " columns, found " + std::to_string(cols.size()));
    }

    event = CatalogEvent();
    event.author = cols[0];
    event.time = TimeUtils::parseIsoUtc(cols[1]);
    event.magnitudeAuthor = cols[10];
    event.magnitudeType = cols[12];
    event.eventId = cols[15];

    if (event.magnitudeAuthor.empty()) return false;
    if (!isValidMagnitudeType(event.magnitudeType)) return false;
    if (!toDouble(cols[11], event.magnitude)) return false;
    if (!toDouble(cols[2], event.latitude)) return false;
    if (!toDouble(cols[3], event.longitude)) return false;
    if (event.latitude > MAX_LATITUDE || event.latitude < MIN_LATITUDE) return false;

    // Depth signs are inconsistent in the bulletin; store negative down
    double depth = 0.0;
    if (toDouble(cols[7], depth)) {
        event.depth = -std::abs(depth);
    }
    return true;
}

std::vector<CatalogEvent> IscCatalogReader::readYear(int year, TimePoint start, TimePoint end,
                                                     double latitude, double longitude,
                                                     double radius_km) const {
    std::vector<CatalogEvent> events;
    const std::string filename = yearFile(year);

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Warning: Cannot open ISC file: " << filename << std::endl;
        return events;
    }

    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        if (trim(line).empty()) continue;

        CatalogEvent event;
        try {
            if (!parseRow(line, event)) continue;
        } catch (const std::invalid_argument& e) {
            std::cerr << "Warning: " << filename << ":" << line_num
                      << ": skipping row, " << e.what() << std::endl;
            continue;
        }

        if (event.time < start || event.time > end) continue;

        double distance_km = Geodetic::geodesicDistance(event.latitude, event.longitude,
                                                        latitude, longitude) / KM2M;
        if (distance_km > radius_km) continue;

        events.push_back(event);
    }
    return events;
}

std::vector<CatalogEvent> IscCatalogReader::fetch(TimePoint start, TimePoint end,
                                                  double latitude, double longitude,
                                                  double radius_km) const {
    std::vector<CatalogEvent> events;
    if (end < start) return events;

    for (int year = TimeUtils::yearOf(start); year <= TimeUtils::yearOf(end); ++year) {
        auto chunk = readYear(year, start, end, latitude, longitude, radius_km);
        events.insert(events.end(), chunk.begin(), chunk.end());
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const CatalogEvent& a, const CatalogEvent& b) { return a.time < b.time; });
    return events;
}

} // namespace CFSM
