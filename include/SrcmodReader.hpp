#ifndef SRCMOD_READER_HPP
#define SRCMOD_READER_HPP

#include "CFSM.hpp"
#include "TimeUtils.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CFSM {

/**
 * @brief One sub-fault line of a finite-fault model, keyed by column name
 *        (LAT, LON, X, Y, Z, SLIP, RAKE, ...)
 */
using SubfaultRow = std::map<std::string, double>;

/**
 * @brief Sub-faults grouped into depth rows (outer index down-dip,
 *        inner index along strike)
 */
using SubfaultGrid = std::vector<std::vector<SubfaultRow>>;

struct SegmentDescription {
    std::map<std::string, double> fields;   // Segment header fields (or the file header for single-segment files)
    SubfaultGrid rows;
};

/**
 * @brief Parsed content of a SRCMOD finite-fault (.fsp) file
 */
struct RuptureDescription {
    std::string dateText;                   // As found in the file (m/d/Y)
    TimePoint date;

    std::map<std::string, std::string> tags;
    std::map<std::string, double> fields;   // Header fields, first occurrence wins

    std::optional<std::string> tag;
    std::optional<std::string> description;
    std::optional<double> epicenterLatitude;
    std::optional<double> epicenterLongitude;
    std::optional<double> depth;
    std::optional<double> magnitude;
    std::optional<double> moment;

    std::vector<SegmentDescription> segments;
};

/**
 * @brief Reader for SRCMOD .fsp text files
 *
 * Structural problems (missing NSG, segment count mismatch, uneven depth
 * rows, malformed data lines, coordinates out of range) raise
 * RuptureParseError. Missing optional header entries are reported on
 * std::cerr and left unset.
 */
class SrcmodReader {
public:
    SrcmodReader() = default;

    RuptureDescription readFile(const std::string& filename) const;
    RuptureDescription parse(const std::string& text) const;

    // "NAME = number" pairs, names upper-cased; the first occurrence wins
    static std::map<std::string, double> findFields(const std::string& text);

    // "% NAME : value" entries, names upper-cased
    static std::map<std::string, std::string> findTags(const std::string& text);

    // Sub-fault table of one segment, grouped into rows by a change in Z
    static SubfaultGrid parseSegmentData(const std::string& segment_text);

private:
    std::vector<SegmentDescription> separateSegments(
        int num_segments, const std::map<std::string, double>& header_fields,
        const std::string& text) const;
};

} // namespace CFSM

#endif // SRCMOD_READER_HPP
