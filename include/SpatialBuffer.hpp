#ifndef SPATIAL_BUFFER_HPP
#define SPATIAL_BUFFER_HPP

#include "CoordinateSystem.hpp"
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <vector>

namespace CFSM {

class FaultPatch;

namespace bg = boost::geometry;

using PlanePoint = bg::model::d2::point_xy<double>;
using PlanePolygon = bg::model::polygon<PlanePoint>;
using PlaneMultiPolygon = bg::model::multi_polygon<PlanePolygon>;
using PlaneBox = bg::model::box<PlanePoint>;

/**
 * @brief Union of disks around the fault corners, in the projected frame
 */
class BufferedRegion {
public:
    BufferedRegion() = default;
    explicit BufferedRegion(PlaneMultiPolygon shape) : shape_(std::move(shape)) {}

    // Strictly inside; points on the boundary are outside
    bool contains(double x, double y) const;

    // Vertices of every ring, without the closing duplicates
    std::vector<GeoPoint> boundaryVertices() const;

    PlaneBox bounds() const;
    double area() const;
    bool empty() const { return shape_.empty(); }

    const PlaneMultiPolygon& shape() const { return shape_; }

private:
    PlaneMultiPolygon shape_;
};

/**
 * @brief Sampling points over a buffered region
 *
 * Interior points lie strictly inside the region. Boundary points are the
 * region's own vertices, kept apart so that the interior property holds.
 */
struct SampleGrid {
    std::vector<GeoPoint> interior;
    std::vector<GeoPoint> boundary;

    // Interior followed by boundary, all at depth z (m, negative down)
    std::vector<GeoPoint> points(double z = 0.0) const;

    size_t size() const { return interior.size() + boundary.size(); }
};

namespace SpatialBuffer {

    constexpr int DEFAULT_POINTS_PER_CIRCLE = 360;

    /**
     * @brief Union of disks of the given radius around every projected
     *        corner of every patch
     * @throws std::invalid_argument for an empty patch list, radius <= 0 or
     *         fewer than 8 points per circle
     */
    BufferedRegion buildRegion(const std::vector<FaultPatch>& patches, double radius,
                               int points_per_circle = DEFAULT_POINTS_PER_CIRCLE);

    // Same, from bare planar points
    BufferedRegion buildRegion(const std::vector<GeoPoint>& centers, double radius,
                               int points_per_circle = DEFAULT_POINTS_PER_CIRCLE);

    /**
     * @brief Regular grid over the region's bounding box, starting at the
     *        box minimum, clipped to the region interior
     * @throws std::invalid_argument for spacing <= 0
     */
    SampleGrid buildGrid(const BufferedRegion& region, double spacing);
}

} // namespace CFSM

#endif // SPATIAL_BUFFER_HPP
