#include "CoordinateSystem.hpp"
#include <proj.h>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace CFSM {

// ============================================================================
// CoordinateTransformer Implementation
// ============================================================================

CoordinateTransformer::CoordinateTransformer()
    : ctx_(proj_context_create()), transform_(nullptr), is_valid_(false) {
}

CoordinateTransformer::~CoordinateTransformer() {
    cleanup();
}

void CoordinateTransformer::cleanup() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    if (ctx_) {
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
    }
    is_valid_ = false;
}

std::string CoordinateTransformer::normalizeEPSG(const std::string& epsg) const {
    if (epsg.compare(0, 5, "EPSG:") == 0) {
        return epsg;
    }
    bool numeric = !epsg.empty();
    for (char c : epsg) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            numeric = false;
            break;
        }
    }
    // Anything else is handed to PROJ unchanged
    return numeric ? "EPSG:" + epsg : epsg;
}

void CoordinateTransformer::setSourceCRS(const std::string& epsg) {
    source_crs_ = normalizeEPSG(epsg);
    is_valid_ = false;
}

void CoordinateTransformer::setTargetCRS(const std::string& epsg) {
    target_crs_ = normalizeEPSG(epsg);
    is_valid_ = false;
}

bool CoordinateTransformer::initialize() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    is_valid_ = false;

    if (!ctx_) {
        last_error_ = "PROJ context not available";
        return false;
    }
    if (source_crs_.empty()) {
        last_error_ = "Source CRS not specified";
        return false;
    }
    if (target_crs_.empty()) {
        last_error_ = "Target CRS not specified";
        return false;
    }

    transform_ = proj_create_crs_to_crs(ctx_, source_crs_.c_str(), target_crs_.c_str(), nullptr);
    if (!transform_) {
        int err = proj_context_errno(ctx_);
        last_error_ = std::string("Failed to create transformation: ") +
                      proj_context_errno_string(ctx_, err);
        return false;
    }

    // Normalize for longitude/latitude ordering
    PJ* norm = proj_normalize_for_visualization(ctx_, transform_);
    if (norm) {
        proj_destroy(transform_);
        transform_ = norm;
    }

    last_error_.clear();
    is_valid_ = true;
    return true;
}

GeoPoint CoordinateTransformer::transform(const GeoPoint& point) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        throw std::runtime_error(last_error_);
    }

    PJ_COORD in = proj_coord(point.x, point.y, point.z, 0);
    proj_errno_reset(transform_);
    PJ_COORD out = proj_trans(transform_, PJ_FWD, in);

    int err = proj_errno(transform_);
    if (err != 0 || !std::isfinite(out.xyz.x) || !std::isfinite(out.xyz.y)) {
        std::ostringstream oss;
        oss << "Cannot transform (" << point.x << ", " << point.y << ") from "
            << source_crs_ << " to " << target_crs_;
        if (err != 0) {
            oss << ": " << proj_context_errno_string(ctx_, err);
        }
        last_error_ = oss.str();
        throw std::runtime_error(last_error_);
    }

    return GeoPoint(out.xyz.x, out.xyz.y, out.xyz.z);
}

// ============================================================================
// UTM helpers
// ============================================================================

namespace CRS {

int calculateUTMZone(double latitude, double longitude) {
    // Wrap longitude into [-180, 180)
    double lon = std::fmod(longitude + 180.0, 360.0);
    if (lon < 0) lon += 360.0;
    lon -= 180.0;

    if (latitude >= 56.0 && latitude < 64.0 && lon >= 3.0 && lon < 12.0) {
        return 32;
    }
    if (latitude >= 72.0 && latitude <= 84.0 && lon >= 0.0) {
        if (lon < 9.0) return 31;
        if (lon < 21.0) return 33;
        if (lon < 33.0) return 35;
        if (lon < 42.0) return 37;
    }

    int zone = static_cast<int>(std::floor((lon + 180.0) / 6.0)) + 1;
    return zone > 60 ? 60 : zone;
}

char calculateUTMBand(double latitude) {
    static const char bands[] = "CDEFGHJKLMNPQRSTUVWXX";
    if (latitude < -80.0 || latitude > 84.0) {
        throw std::out_of_range("Latitude outside the UTM domain [-80, 84]: " +
                                std::to_string(latitude));
    }
    int index = static_cast<int>(std::floor((latitude + 80.0) / 8.0));
    if (index > 20) index = 20;
    return bands[index];
}

} // namespace CRS

// ============================================================================
// Projectors
// ============================================================================

UtmProjector::UtmProjector(double origin_latitude, double origin_longitude)
    : zone_(CRS::calculateUTMZone(origin_latitude, origin_longitude)),
      band_(CRS::calculateUTMBand(origin_latitude)) {
    transformer_.setSourceCRS(CRS::WGS84);
    transformer_.setTargetCRS(CRS::getUTMZone(zone_, origin_latitude >= 0.0));
    if (!transformer_.initialize()) {
        throw std::runtime_error("UTM projection unavailable: " + transformer_.getLastError());
    }
}

GeoPoint UtmProjector::project(double latitude, double longitude) const {
    GeoPoint p = transformer_.transform(GeoPoint(longitude, latitude));
    return GeoPoint(p.x, p.y);
}

std::string UtmProjector::describe() const {
    return "UTM zone " + std::to_string(zone_) + band_ + " (" + transformer_.getTargetCRS() + ")";
}

namespace {
constexpr double METERS_PER_DEGREE = 111000.0;
}

LocalTangentProjector::LocalTangentProjector(double origin_latitude, double origin_longitude)
    : lat0_(origin_latitude), lon0_(origin_longitude),
      cos_lat0_(std::cos(Geodetic::deg2rad(origin_latitude))) {
}

GeoPoint LocalTangentProjector::project(double latitude, double longitude) const {
    double dlon = longitude - lon0_;
    if (dlon > 180.0) dlon -= 360.0;
    if (dlon < -180.0) dlon += 360.0;
    return GeoPoint(dlon * METERS_PER_DEGREE * cos_lat0_,
                    (latitude - lat0_) * METERS_PER_DEGREE);
}

std::string LocalTangentProjector::describe() const {
    std::ostringstream oss;
    oss << "local tangent plane at (" << lat0_ << ", " << lon0_ << ")";
    return oss.str();
}

ProjectorFactory makeProjectorFactory(const std::string& name) {
    if (name == "utm") {
        return [](double lat, double lon) -> std::shared_ptr<const CoordinateProjector> {
            return std::make_shared<UtmProjector>(lat, lon);
        };
    }
    if (name == "local") {
        return [](double lat, double lon) -> std::shared_ptr<const CoordinateProjector> {
            return std::make_shared<LocalTangentProjector>(lat, lon);
        };
    }
    throw std::invalid_argument("Unknown projection '" + name + "' (expected utm or local)");
}

std::array<double, 2> rotate2D(double x, double y, double angle_deg) {
    double a = Geodetic::deg2rad(angle_deg);
    double c = std::cos(a);
    double s = std::sin(a);
    return {c * x - s * y, s * x + c * y};
}

// ============================================================================
// Geodetic Utilities Implementation
// ============================================================================

namespace Geodetic {

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378137.0;          // Semi-major axis
constexpr double WGS84_F = 1.0 / 298.257223563; // Flattening
constexpr double WGS84_B = WGS84_A * (1 - WGS84_F); // Semi-minor axis
constexpr double EARTH_RADIUS = 6371000.0;      // Mean radius for spherical calculations

bool vincentyDistance(double lat1, double lon1, double lat2, double lon2,
                      double& distance) {
    double phi1 = deg2rad(lat1);
    double phi2 = deg2rad(lat2);
    double L = deg2rad(lon2 - lon1);

    double U1 = std::atan((1 - WGS84_F) * std::tan(phi1));
    double U2 = std::atan((1 - WGS84_F) * std::tan(phi2));

    double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
    double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

    double lambda = L;
    double lambda_prev;
    int iterations = 0;
    const int max_iterations = 200;
    const double tolerance = 1e-12;

    double sinSigma, cosSigma, sigma, sinAlpha, cosSqAlpha, cos2SigmaM;

    do {
        double sinLambda = std::sin(lambda);
        double cosLambda = std::cos(lambda);

        sinSigma = std::sqrt(
            std::pow(cosU2 * sinLambda, 2) +
            std::pow(cosU1 * sinU2 - sinU1 * cosU2 * cosLambda, 2)
        );

        if (sinSigma == 0) {
            // Coincident points, or antipodal points on the equator
            if (cosU1 * cosU2 * cosLambda + sinU1 * sinU2 < 0) return false;
            distance = 0.0;
            return true;
        }

        cosSigma = sinU1 * sinU2 + cosU1 * cosU2 * cosLambda;
        sigma = std::atan2(sinSigma, cosSigma);

        sinAlpha = cosU1 * cosU2 * sinLambda / sinSigma;
        cosSqAlpha = 1 - sinAlpha * sinAlpha;

        cos2SigmaM = (cosSqAlpha == 0) ? 0 : cosSigma - 2 * sinU1 * sinU2 / cosSqAlpha;

        double C = WGS84_F / 16 * cosSqAlpha * (4 + WGS84_F * (4 - 3 * cosSqAlpha));

        lambda_prev = lambda;
        lambda = L + (1 - C) * WGS84_F * sinAlpha * (
            sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM))
        );

        if (!std::isfinite(lambda)) return false;

    } while (std::abs(lambda - lambda_prev) > tolerance && ++iterations < max_iterations);

    if (iterations >= max_iterations) {
        return false;
    }

    double uSq = cosSqAlpha * (WGS84_A * WGS84_A - WGS84_B * WGS84_B) / (WGS84_B * WGS84_B);
    double A = 1 + uSq / 16384 * (4096 + uSq * (-768 + uSq * (320 - 175 * uSq)));
    double B = uSq / 1024 * (256 + uSq * (-128 + uSq * (74 - 47 * uSq)));

    double deltaSigma = B * sinSigma * (
        cos2SigmaM + B / 4 * (
            cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM) -
            B / 6 * cos2SigmaM * (-3 + 4 * sinSigma * sinSigma) * (-3 + 4 * cos2SigmaM * cos2SigmaM)
        )
    );

    double s = WGS84_B * A * (sigma - deltaSigma);
    if (!std::isfinite(s)) return false;
    distance = s;
    return true;
}

double haversineDistance(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = deg2rad(lat1);
    double phi2 = deg2rad(lat2);
    double dPhi = deg2rad(lat2 - lat1);
    double dLambda = deg2rad(lon2 - lon1);

    double a = std::sin(dPhi / 2) * std::sin(dPhi / 2) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(dLambda / 2) * std::sin(dLambda / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return EARTH_RADIUS * c;
}

double geodesicDistance(double lat1, double lon1, double lat2, double lon2) {
    double d = 0.0;
    if (vincentyDistance(lat1, lon1, lat2, lon2, d)) {
        return d;
    }
    return haversineDistance(lat1, lon1, lat2, lon2);
}

} // namespace Geodetic

} // namespace CFSM
