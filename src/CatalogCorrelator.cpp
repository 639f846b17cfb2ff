#include "CatalogCorrelator.hpp"
#include "FaultModel.hpp"
#include "SpatialBuffer.hpp"
#include <cmath>

namespace CFSM {
namespace CatalogCorrelator {

std::vector<CatalogEvent> correlate(const std::vector<CatalogEvent>& catalog,
                                    const FaultModel& model,
                                    const BufferedRegion& region) {
    std::vector<CatalogEvent> kept;
    const CoordinateProjector& projector = model.getProjector();
    const GeoPoint& epicenter = model.getEpicenterProjected();

    for (const auto& event : catalog) {
        GeoPoint p = projector.project(event.latitude, event.longitude);
        if (!region.contains(p.x, p.y)) continue;

        CatalogEvent e = event;
        e.x = p.x;
        e.y = p.y;
        e.distanceToEpicenter = std::hypot(p.x - epicenter.x, p.y - epicenter.y);
        kept.push_back(e);
    }
    return kept;
}

} // namespace CatalogCorrelator
} // namespace CFSM
