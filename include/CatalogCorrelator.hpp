#ifndef CATALOG_CORRELATOR_HPP
#define CATALOG_CORRELATOR_HPP

#include "Catalog.hpp"
#include <vector>

namespace CFSM {

class FaultModel;
class BufferedRegion;

namespace CatalogCorrelator {

    /**
     * @brief Events that fall strictly inside the buffered region
     *
     * Each event is projected with the fault model's projector and gets
     * its planar distance to the projected epicenter. The input is left
     * untouched; whole records are copied into the result in input order.
     */
    std::vector<CatalogEvent> correlate(const std::vector<CatalogEvent>& catalog,
                                        const FaultModel& model,
                                        const BufferedRegion& region);
}

} // namespace CFSM

#endif // CATALOG_CORRELATOR_HPP
