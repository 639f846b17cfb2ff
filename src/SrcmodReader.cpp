#include "SrcmodReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace CFSM {

namespace {

const char* const SEGMENT_MARKER = "SEGMENT";
const char* const SINGLE_SEGMENT_MARKER = "SOURCE MODEL PARAMETERS";

// Header tag and field names copied onto the description
const char* const TAG_EVENT_TAG = "EVENTTAG";
const char* const TAG_EVENT = "EVENT";
const char* const FIELD_NAMES[] = {"LAT", "LON", "DEP", "MW", "MO"};

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// Number at pos in the form -?\d+\.?\d*([eE][+-]?\d+)?, returns its length
size_t matchNumber(const std::string& text, size_t pos, double& value) {
    size_t i = pos;
    if (i < text.size() && text[i] == '-') ++i;
    if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) return 0;
    const char* begin = text.c_str() + pos;
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end > begin ? static_cast<size_t>(end - begin) : 0;
}

// Position of a "% <marker>" line-start marker (any whitespace after '%')
size_t findMarker(const std::string& text, const std::string& marker, size_t from) {
    size_t pos = text.find('%', from);
    while (pos != std::string::npos) {
        size_t i = pos + 1;
        while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
        if (i > pos + 1 && text.compare(i, marker.size(), marker) == 0) {
            return pos;
        }
        pos = text.find('%', pos + 1);
    }
    return std::string::npos;
}

// First d+/d+/d+ token
bool findDate(const std::string& text, std::string& token, int& month, int& day, int& year) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) continue;
        if (i > 0 && std::isdigit(static_cast<unsigned char>(text[i - 1]))) continue;
        size_t j = i;
        int parts[3];
        int n = 0;
        while (n < 3) {
            size_t start = j;
            while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) ++j;
            if (j == start) break;
            parts[n++] = std::atoi(text.substr(start, j - start).c_str());
            if (n < 3) {
                if (j >= text.size() || text[j] != '/') break;
                ++j;
            }
        }
        if (n == 3) {
            token = text.substr(i, j - i);
            month = parts[0];
            day = parts[1];
            year = parts[2];
            return true;
        }
    }
    return false;
}

} // namespace

// =============================================================================
// Header scanning
// =============================================================================

std::map<std::string, double> SrcmodReader::findFields(const std::string& text) {
    std::map<std::string, double> fields;

    size_t eq = text.find('=');
    while (eq != std::string::npos) {
        // Require "NAME<ws>=<ws>number"
        size_t name_end = eq;
        while (name_end > 0 && isSpace(text[name_end - 1])) --name_end;
        size_t value_start = eq + 1;
        while (value_start < text.size() && isSpace(text[value_start])) ++value_start;

        if (name_end < eq && value_start > eq + 1) {
            size_t name_start = name_end;
            while (name_start > 0 && isWordChar(text[name_start - 1])) --name_start;

            double value;
            if (name_start < name_end && matchNumber(text, value_start, value) > 0) {
                std::string name = toUpper(text.substr(name_start, name_end - name_start));
                fields.emplace(name, value);    // Keeps the first occurrence
            }
        }
        eq = text.find('=', eq + 1);
    }
    return fields;
}

std::map<std::string, std::string> SrcmodReader::findTags(const std::string& text) {
    std::map<std::string, std::string> tags;

    for (const auto& line : splitLines(text)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        size_t name_end = colon;
        while (name_end > 0 && isSpace(line[name_end - 1])) --name_end;
        size_t name_start = name_end;
        while (name_start > 0 && isWordChar(line[name_start - 1])) --name_start;
        if (name_start == name_end) continue;

        size_t value_start = line.find_first_not_of(" \t", colon + 1);
        if (value_start == std::string::npos) continue;

        // The value runs up to the first double space
        size_t value_end = line.find("  ", value_start);
        size_t tab = line.find('\t', value_start);
        if (tab != std::string::npos && (value_end == std::string::npos || tab < value_end)) {
            value_end = tab;
        }
        std::string value = trim(line.substr(value_start, value_end == std::string::npos
                                                          ? std::string::npos
                                                          : value_end - value_start));
        tags[toUpper(line.substr(name_start, name_end - name_start))] = value;
    }
    return tags;
}

// =============================================================================
// Sub-fault table
// =============================================================================

SubfaultGrid SrcmodReader::parseSegmentData(const std::string& segment_text) {
    SubfaultGrid grid;
    std::vector<SubfaultRow> row;
    std::vector<std::string> names;
    bool have_z = false;
    double last_z = 0.0;

    auto closeRow = [&grid, &row]() {
        grid.push_back(row);
        if (grid.front().size() != grid.back().size()) {
            std::ostringstream oss;
            oss << "Depth row " << grid.size() << " has " << grid.back().size()
                << " sub-faults, expected " << grid.front().size();
            throw RuptureParseError(oss.str());
        }
        row.clear();
    };

    for (const auto& line : splitLines(segment_text)) {
        std::string trimmed = trim(line);
        if (trimmed.empty()) continue;

        if (trimmed[0] == '%') {
            std::istringstream header(trimmed.substr(1));
            std::string first, second;
            header >> first >> second;
            if (toUpper(first) == "LAT" && toUpper(second) == "LON") {
                // "% LAT LON X==EW Y==NS Z SLIP ..." -> LAT LON X Y Z SLIP
                names.clear();
                std::istringstream cols(trimmed.substr(1));
                std::string col;
                while (cols >> col) {
                    col = toUpper(col);
                    size_t eq = col.find('=');
                    if (eq != std::string::npos) col = col.substr(0, eq);
                    names.push_back(col);
                }
            }
            continue;
        }

        if (names.empty()) {
            throw RuptureParseError("Sub-fault data before the '% LAT LON' column header: " + trimmed);
        }

        std::istringstream values(trimmed);
        SubfaultRow entry;
        for (const auto& name : names) {
            double v;
            if (!(values >> v)) {
                throw RuptureParseError("Sub-fault line has fewer values than columns: " + trimmed);
            }
            entry[name] = v;
        }

        for (const char* key : {"LAT", "LON", "Z"}) {
            if (entry.find(key) == entry.end()) {
                throw RuptureParseError(std::string("Sub-fault table has no ") + key + " column");
            }
        }
        if (entry["LON"] < -180.0 || entry["LON"] > 180.0) {
            throw RuptureParseError("Sub-fault longitude out of range: " + trimmed);
        }
        if (entry["LAT"] < -90.0 || entry["LAT"] > 90.0) {
            throw RuptureParseError("Sub-fault latitude out of range: " + trimmed);
        }

        double z = entry["Z"];
        if (have_z && z != last_z) {
            closeRow();
        }
        row.push_back(entry);
        last_z = z;
        have_z = true;
    }

    if (!row.empty()) {
        closeRow();
    }
    if (grid.empty()) {
        throw RuptureParseError("Segment has no sub-fault data");
    }
    return grid;
}

// =============================================================================
// Segments
// =============================================================================

std::vector<SegmentDescription> SrcmodReader::separateSegments(
    int num_segments, const std::map<std::string, double>& header_fields,
    const std::string& text) const {

    std::vector<SegmentDescription> segments;
    const std::string marker = num_segments > 1 ? SEGMENT_MARKER : SINGLE_SEGMENT_MARKER;

    size_t pos = findMarker(text, marker, 0);
    if (pos == std::string::npos) {
        throw RuptureParseError("Missing '% " + marker + "' section");
    }

    while (pos != std::string::npos) {
        size_t next = findMarker(text, marker, pos + 1);
        std::string segment_text = text.substr(pos, next == std::string::npos
                                                    ? std::string::npos : next - pos);
        SegmentDescription seg;
        seg.fields = num_segments > 1 ? findFields(segment_text) : header_fields;
        seg.rows = parseSegmentData(segment_text);
        segments.push_back(std::move(seg));
        pos = next;
    }

    if (static_cast<int>(segments.size()) != num_segments) {
        std::ostringstream oss;
        oss << "Found " << segments.size() << " segments, NSG = " << num_segments;
        throw RuptureParseError(oss.str());
    }
    return segments;
}

// =============================================================================
// Entry points
// =============================================================================

RuptureDescription SrcmodReader::readFile(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw RuptureParseError("Cannot open SRCMOD file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return parse(buffer.str());
    } catch (const RuptureParseError& e) {
        throw RuptureParseError(filename + ": " + e.what());
    }
}

RuptureDescription SrcmodReader::parse(const std::string& text) const {
    RuptureDescription desc;

    int month, day, year;
    if (!findDate(text, desc.dateText, month, day, year)) {
        throw RuptureParseError("No event date (m/d/Y) found");
    }
    try {
        desc.date = TimeUtils::makeUtc(year, month, day);
    } catch (const std::invalid_argument& e) {
        throw RuptureParseError(std::string("Bad event date: ") + e.what());
    }

    desc.tags = findTags(text);
    auto tag_it = desc.tags.find(TAG_EVENT_TAG);
    if (tag_it != desc.tags.end()) {
        desc.tag = tag_it->second;
    } else {
        std::cerr << "Warning: SRCMOD tag " << TAG_EVENT_TAG << " not found" << std::endl;
    }
    tag_it = desc.tags.find(TAG_EVENT);
    if (tag_it != desc.tags.end()) {
        desc.description = tag_it->second;
    } else {
        std::cerr << "Warning: SRCMOD tag " << TAG_EVENT << " not found" << std::endl;
    }

    desc.fields = findFields(text);
    std::optional<double>* targets[] = {&desc.epicenterLatitude, &desc.epicenterLongitude,
                                        &desc.depth, &desc.magnitude, &desc.moment};
    for (size_t i = 0; i < 5; ++i) {
        auto it = desc.fields.find(FIELD_NAMES[i]);
        if (it != desc.fields.end()) {
            *targets[i] = it->second;
        } else {
            std::cerr << "Warning: SRCMOD field " << FIELD_NAMES[i] << " not found" << std::endl;
        }
    }

    auto nsg = desc.fields.find("NSG");
    if (nsg == desc.fields.end()) {
        throw RuptureParseError("Missing mandatory field NSG");
    }
    int num_segments = static_cast<int>(nsg->second);
    if (num_segments < 1) {
        throw RuptureParseError("NSG must be at least 1");
    }

    desc.segments = separateSegments(num_segments, desc.fields, text);
    return desc;
}

} // namespace CFSM
