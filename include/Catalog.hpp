#ifndef CATALOG_HPP
#define CATALOG_HPP

#include "CFSM.hpp"
#include "TimeUtils.hpp"
#include <string>
#include <vector>

namespace CFSM {

/**
 * @brief One catalog earthquake
 *
 * depth is in km and negative down. x, y and distanceToEpicenter are
 * filled in when the event is placed in a fault model's frame.
 */
struct CatalogEvent {
    double latitude = 0.0;
    double longitude = 0.0;
    double depth = 0.0;
    double magnitude = 0.0;
    TimePoint time;

    std::string author;
    std::string magnitudeAuthor;
    std::string magnitudeType;
    std::string eventId;

    double x = 0.0;
    double y = 0.0;
    double distanceToEpicenter = 0.0;
};

enum class CatalogType {
    COMP,
    EHB,
    REV
};

/**
 * @brief Parse "comp", "ehb" or "rev"
 * @throws ConfigurationError for anything else
 */
CatalogType parseCatalogType(const std::string& name);
std::string toString(CatalogType type);

/**
 * @brief Source of catalog events around a location
 */
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    /**
     * @brief Events in [start, end] within radius_km of (latitude, longitude),
     *        ordered by time
     */
    virtual std::vector<CatalogEvent> fetch(TimePoint start, TimePoint end,
                                            double latitude, double longitude,
                                            double radius_km) const = 0;
};

/**
 * @brief Reader for ISC bulletin CSV files, one file per year
 *
 * Files live at <root>/<type>csv/<year>.csv. Each row has 16 columns:
 * author, date_time, lat, lon, major_axis, minor_axis, strike, depth,
 * depfixflag, depth_uncertainty, magnitude_author, magnitude,
 * magnitude_type, stations, event_type, event_id.
 */
class IscCatalogReader : public CatalogSource {
public:
    static constexpr size_t NUM_COLUMNS = 16;

    IscCatalogReader(std::string root_directory, CatalogType type);

    std::vector<CatalogEvent> fetch(TimePoint start, TimePoint end,
                                    double latitude, double longitude,
                                    double radius_km) const override;

    std::string yearFile(int year) const;

    /**
     * @brief Parse one CSV line into an event
     * @return false if the row fails the validity rules (magnitude author,
     *         magnitude type, numeric magnitude, latitude within [-80, 84])
     * @throws std::invalid_argument for a wrong column count or a bad date
     */
    static bool parseRow(const std::string& line, CatalogEvent& event);

    static bool isValidMagnitudeType(const std::string& type);

private:
    std::vector<CatalogEvent> readYear(int year, TimePoint start, TimePoint end,
                                       double latitude, double longitude,
                                       double radius_km) const;

    std::string root_;
    CatalogType type_;
};

} // namespace CFSM

#endif // CATALOG_HPP
