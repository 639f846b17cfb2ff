#include "FaultModel.hpp"
#include "SrcmodReader.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace CFSM {

namespace {

double wrap360(double deg) {
    double w = std::fmod(deg, 360.0);
    if (w < 0) w += 360.0;
    return w;
}

double wrap180(double deg) {
    if (deg >= -180.0 && deg <= 180.0) return deg;
    double w = std::fmod(deg + 180.0, 360.0);
    if (w < 0) w += 360.0;
    return w - 180.0;
}

const std::map<std::string, double>* findIn(const std::map<std::string, double>& primary,
                                            const std::map<std::string, double>& fallback,
                                            const std::string& key) {
    if (primary.count(key)) return &primary;
    if (fallback.count(key)) return &fallback;
    return nullptr;
}

double requireColumn(const SubfaultRow& row, const char* name) {
    auto it = row.find(name);
    if (it == row.end()) {
        throw RuptureParseError(std::string("Sub-fault table has no ") + name + " column");
    }
    return it->second;
}

} // namespace

// =============================================================================
// FaultPatch
// =============================================================================

FaultPatch::FaultPatch(const Definition& def) : def_(def) {
    if (!(def_.length > 0.0) || !(def_.width > 0.0)) {
        std::ostringstream oss;
        oss << "Fault patch needs positive length and width (got "
            << def_.length << ", " << def_.width << ")";
        throw std::invalid_argument(oss.str());
    }
    def_.strike = wrap360(def_.strike);
    def_.angle = wrap360(def_.angle);
    def_.dip = wrap180(def_.dip);

    auto s = rotate2D(def_.slip, 0.0, def_.rake);
    slip_strike_ = s[0];
    slip_dip_ = s[1];
}

// =============================================================================
// FaultModel
// =============================================================================

FaultModel::FaultModel(std::shared_ptr<const CoordinateProjector> projector,
                       double epicenter_latitude, double epicenter_longitude)
    : projector_(std::move(projector)),
      epicenter_lat_(epicenter_latitude),
      epicenter_lon_(epicenter_longitude) {
    if (!projector_) {
        throw std::invalid_argument("FaultModel requires a coordinate projector");
    }
    epicenter_xy_ = projector_->project(epicenter_lat_, epicenter_lon_);
}

double FaultModel::getMeanDip() const {
    if (patches_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& p : patches_) sum += p.getDip();
    return sum / patches_.size();
}

double FaultModel::getMeanStrike() const {
    if (patches_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& p : patches_) sum += p.getStrike();
    return sum / patches_.size();
}

// =============================================================================
// FaultModelBuilder
// =============================================================================

FaultModelBuilder::FaultModelBuilder(ProjectorFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("FaultModelBuilder requires a projector factory");
    }
}

FaultModel FaultModelBuilder::build(const RuptureDescription& desc) const {
    if (!desc.epicenterLatitude || !desc.epicenterLongitude) {
        throw RuptureParseError("Epicenter LAT/LON missing from rupture header");
    }

    FaultModel model(factory_(*desc.epicenterLatitude, *desc.epicenterLongitude),
                     *desc.epicenterLatitude, *desc.epicenterLongitude);
    model.date = desc.date;
    model.dateText = desc.dateText;
    model.tag = desc.tag;
    model.description = desc.description;
    model.magnitude = desc.magnitude;
    model.moment = desc.moment;
    model.depth = desc.depth;

    const CoordinateProjector& projector = model.getProjector();

    for (size_t s = 0; s < desc.segments.size(); ++s) {
        const SegmentDescription& seg = desc.segments[s];
        const SubfaultGrid& rows = seg.rows;

        if (rows.size() < 2) {
            std::cout << "Skipping segment " << s + 1 << ": a single depth row" << std::endl;
            continue;
        }

        double strike;
        if (seg.fields.count("STRIKE")) {
            strike = seg.fields.at("STRIKE");
        } else if (desc.fields.count("STRK")) {
            strike = desc.fields.at("STRK");
        } else {
            throw RuptureParseError("Segment " + std::to_string(s + 1) + " has no strike");
        }
        double angle = 90.0 - strike;
        if (angle < 0) angle += 360.0;

        const auto* dx_src = findIn(seg.fields, desc.fields, "DX");
        if (!dx_src) {
            throw RuptureParseError("Segment " + std::to_string(s + 1) + " has no DX");
        }
        double length = dx_src->at("DX");

        double width;
        if (seg.fields.count("LEN")) {
            width = seg.fields.at("LEN") / rows.size();
        } else if (desc.fields.count("DZ")) {
            width = desc.fields.at("DZ");
        } else {
            throw RuptureParseError("Segment " + std::to_string(s + 1) + " has no width (LEN or DZ)");
        }

        auto dip_it = seg.fields.find("DIP");
        if (dip_it == seg.fields.end()) {
            throw RuptureParseError("Segment " + std::to_string(s + 1) + " has no DIP");
        }
        double dip = dip_it->second;

        // Half-length along strike, and the spacing between depth rows
        auto top = rotate2D(length / 2.0, 0.0, angle);
        double x_top = top[0] * KM2M;
        double y_top = top[1] * KM2M;
        double x_down = (requireColumn(rows[1][0], "X") - requireColumn(rows[0][0], "X")) * KM2M;
        double y_down = (requireColumn(rows[1][0], "Y") - requireColumn(rows[0][0], "Y")) * KM2M;
        double z_down = (requireColumn(rows[1][0], "Z") - requireColumn(rows[0][0], "Z")) * KM2M;

        for (const auto& row : rows) {
            for (const auto& sub : row) {
                double xc = requireColumn(sub, "X") * KM2M;
                double yc = requireColumn(sub, "Y") * KM2M;
                double zc = requireColumn(sub, "Z") * KM2M;
                double lat = requireColumn(sub, "LAT");
                double lon = requireColumn(sub, "LON");

                FaultPatch::Definition def;
                def.localCorners = {GeoPoint(xc + x_top, yc + y_top, zc),
                                    GeoPoint(xc - x_top, yc - y_top, zc),
                                    GeoPoint(xc + x_down + x_top, yc + y_down + y_top, zc + z_down),
                                    GeoPoint(xc + x_down - x_top, yc + y_down - y_top, zc + z_down)};

                GeoPoint c = projector.project(lat, lon);
                def.projectedTopCenter = GeoPoint(c.x, c.y, zc);
                def.projectedCorners = {GeoPoint(c.x + x_top, c.y + y_top, zc),
                                        GeoPoint(c.x - x_top, c.y - y_top, zc),
                                        GeoPoint(c.x + x_down + x_top, c.y + y_down + y_top, zc + z_down),
                                        GeoPoint(c.x + x_down - x_top, c.y + y_down - y_top, zc + z_down)};

                def.topLatitude = lat;
                def.topLongitude = lon;
                def.depthTop = zc;
                def.depthBottom = zc + z_down;
                def.dip = dip;
                def.strike = strike;
                def.angle = angle;
                auto rake = sub.find("RAKE");
                def.rake = rake != sub.end() ? rake->second : 0.0;
                def.slip = requireColumn(sub, "SLIP");
                def.length = length * KM2M;
                def.width = width * KM2M;

                model.addPatch(FaultPatch(def));
            }
        }
    }

    if (model.empty()) {
        std::cerr << "Warning: rupture description produced no fault patches" << std::endl;
    }
    return model;
}

} // namespace CFSM
