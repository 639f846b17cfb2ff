#ifndef FAULT_MODEL_HPP
#define FAULT_MODEL_HPP

#include "CFSM.hpp"
#include "CoordinateSystem.hpp"
#include "TimeUtils.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CFSM {

struct RuptureDescription;

/**
 * @brief Rectangular dislocation element of a finite fault
 *
 * Corners are ordered top(+), top(-), bottom(+), bottom(-), where (+) and
 * (-) are the two ends of the along-strike half-length offset. Depths are
 * positive down in meters. The patch is immutable once constructed.
 */
class FaultPatch {
public:
    struct Definition {
        std::array<GeoPoint, 4> localCorners;       // Local Cartesian frame (m)
        std::array<GeoPoint, 4> projectedCorners;   // Projected frame (m)
        GeoPoint projectedTopCenter;
        double topLatitude = 0.0;
        double topLongitude = 0.0;
        double depthTop = 0.0;                      // m, positive down
        double depthBottom = 0.0;                   // m, positive down
        double dip = 0.0;                           // degrees
        double strike = 0.0;                        // degrees clockwise from north
        double angle = 0.0;                         // Cartesian angle, 90 - strike
        double rake = 0.0;                          // degrees
        double slip = 0.0;                          // m
        double length = 0.0;                        // Along strike (m)
        double width = 0.0;                         // Along dip (m)
    };

    /**
     * @brief Build a patch; strike and angle are wrapped into [0, 360),
     *        dip into [-180, 180], and slip is split by the rake
     * @throws std::invalid_argument for non-positive length or width
     */
    explicit FaultPatch(const Definition& def);

    const std::array<GeoPoint, 4>& getLocalCorners() const { return def_.localCorners; }
    const std::array<GeoPoint, 4>& getProjectedCorners() const { return def_.projectedCorners; }
    const GeoPoint& getProjectedTopCenter() const { return def_.projectedTopCenter; }
    double getTopLatitude() const { return def_.topLatitude; }
    double getTopLongitude() const { return def_.topLongitude; }

    double getDepthTop() const { return def_.depthTop; }
    double getDepthBottom() const { return def_.depthBottom; }
    double getDip() const { return def_.dip; }
    double getStrike() const { return def_.strike; }
    double getAngle() const { return def_.angle; }
    double getRake() const { return def_.rake; }
    double getSlip() const { return def_.slip; }
    double getLength() const { return def_.length; }
    double getWidth() const { return def_.width; }

    double getSlipStrike() const { return slip_strike_; }
    double getSlipDip() const { return slip_dip_; }

private:
    Definition def_;
    double slip_strike_;
    double slip_dip_;
};

/**
 * @brief Ordered set of fault patches for one rupture
 *
 * Holds the projector used to place the fault so that observation points
 * and catalog events can be mapped into the same frame.
 */
class FaultModel {
public:
    FaultModel(std::shared_ptr<const CoordinateProjector> projector,
               double epicenter_latitude, double epicenter_longitude);

    void addPatch(const FaultPatch& patch) { patches_.push_back(patch); }

    const std::vector<FaultPatch>& getPatches() const { return patches_; }
    size_t size() const { return patches_.size(); }
    bool empty() const { return patches_.empty(); }

    const CoordinateProjector& getProjector() const { return *projector_; }
    std::shared_ptr<const CoordinateProjector> getProjectorPtr() const { return projector_; }

    double getEpicenterLatitude() const { return epicenter_lat_; }
    double getEpicenterLongitude() const { return epicenter_lon_; }
    const GeoPoint& getEpicenterProjected() const { return epicenter_xy_; }

    // Unweighted means over all patches
    double getMeanDip() const;
    double getMeanStrike() const;

    TimePoint date;
    std::string dateText;
    std::optional<std::string> tag;
    std::optional<std::string> description;
    std::optional<double> magnitude;
    std::optional<double> moment;
    std::optional<double> depth;        // Hypocenter depth from the header (km)

private:
    std::shared_ptr<const CoordinateProjector> projector_;
    double epicenter_lat_;
    double epicenter_lon_;
    GeoPoint epicenter_xy_;
    std::vector<FaultPatch> patches_;
};

/**
 * @brief Turns a parsed rupture description into fault patches
 *
 * Each depth row of a segment contributes one patch per sub-fault. The top
 * edge of a patch is centred on the sub-fault position and spans the patch
 * length along strike; the bottom edge is offset by the spacing between
 * the first two depth rows. Segments with a single depth row are skipped.
 */
class FaultModelBuilder {
public:
    explicit FaultModelBuilder(ProjectorFactory factory);

    /**
     * @throws RuptureParseError when mandatory geometry is missing
     */
    FaultModel build(const RuptureDescription& desc) const;

private:
    ProjectorFactory factory_;
};

} // namespace CFSM

#endif // FAULT_MODEL_HPP
