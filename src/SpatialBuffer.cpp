#include "SpatialBuffer.hpp"
#include "FaultModel.hpp"
#include <boost/geometry/geometries/multi_point.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace CFSM {

// =============================================================================
// BufferedRegion
// =============================================================================

bool BufferedRegion::contains(double x, double y) const {
    return bg::within(PlanePoint(x, y), shape_);
}

std::vector<GeoPoint> BufferedRegion::boundaryVertices() const {
    std::vector<GeoPoint> vertices;
    auto addRing = [&vertices](const PlanePolygon::ring_type& ring) {
        // Rings are closed; skip the repeated first vertex
        for (size_t i = 0; i + 1 < ring.size(); ++i) {
            vertices.emplace_back(ring[i].x(), ring[i].y());
        }
    };
    for (const auto& poly : shape_) {
        addRing(poly.outer());
        for (const auto& inner : poly.inners()) {
            addRing(inner);
        }
    }
    return vertices;
}

PlaneBox BufferedRegion::bounds() const {
    PlaneBox box;
    bg::envelope(shape_, box);
    return box;
}

double BufferedRegion::area() const {
    return bg::area(shape_);
}

// =============================================================================
// SampleGrid
// =============================================================================

std::vector<GeoPoint> SampleGrid::points(double z) const {
    std::vector<GeoPoint> all;
    all.reserve(size());
    for (const auto& p : interior) all.emplace_back(p.x, p.y, z);
    for (const auto& p : boundary) all.emplace_back(p.x, p.y, z);
    return all;
}

// =============================================================================
// Region and grid construction
// =============================================================================

namespace SpatialBuffer {

BufferedRegion buildRegion(const std::vector<GeoPoint>& centers, double radius,
                           int points_per_circle) {
    if (centers.empty()) {
        throw std::invalid_argument("Cannot buffer an empty point set");
    }
    if (!(radius > 0.0)) {
        throw std::invalid_argument("Buffer radius must be positive");
    }
    if (points_per_circle < 8) {
        throw std::invalid_argument("Buffer circles need at least 8 points");
    }

    // Adjacent patches share corners
    std::vector<std::pair<double, double>> unique;
    unique.reserve(centers.size());
    for (const auto& c : centers) unique.emplace_back(c.x, c.y);
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

    bg::model::multi_point<PlanePoint> mp;
    for (const auto& c : unique) {
        bg::append(mp, PlanePoint(c.first, c.second));
    }

    bg::strategy::buffer::distance_symmetric<double> distance(radius);
    bg::strategy::buffer::side_straight side;
    bg::strategy::buffer::join_round join(points_per_circle);
    bg::strategy::buffer::end_round end(points_per_circle);
    bg::strategy::buffer::point_circle circle(points_per_circle);

    // Circle vertices lie on the radius, so the polygon is inscribed and
    // points just inside r near an edge midpoint fall outside it
    PlaneMultiPolygon shape;
    bg::buffer(mp, shape, distance, side, join, end, circle);
    return BufferedRegion(std::move(shape));
}

BufferedRegion buildRegion(const std::vector<FaultPatch>& patches, double radius,
                           int points_per_circle) {
    if (patches.empty()) {
        throw std::invalid_argument("Cannot buffer a fault without patches");
    }
    std::vector<GeoPoint> corners;
    corners.reserve(patches.size() * 4);
    for (const auto& patch : patches) {
        for (const auto& c : patch.getProjectedCorners()) {
            corners.push_back(c);
        }
    }
    return buildRegion(corners, radius, points_per_circle);
}

SampleGrid buildGrid(const BufferedRegion& region, double spacing) {
    if (!(spacing > 0.0)) {
        throw std::invalid_argument("Grid spacing must be positive");
    }

    SampleGrid grid;
    if (region.empty()) return grid;

    PlaneBox box = region.bounds();
    double xmin = box.min_corner().x(), xmax = box.max_corner().x();
    double ymin = box.min_corner().y(), ymax = box.max_corner().y();

    for (long j = 0; ymin + j * spacing < ymax; ++j) {
        double y = ymin + j * spacing;
        for (long i = 0; xmin + i * spacing < xmax; ++i) {
            double x = xmin + i * spacing;
            if (region.contains(x, y)) {
                grid.interior.emplace_back(x, y);
            }
        }
    }

    grid.boundary = region.boundaryVertices();
    return grid;
}

} // namespace SpatialBuffer

} // namespace CFSM
