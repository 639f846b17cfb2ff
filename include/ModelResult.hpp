#ifndef MODEL_RESULT_HPP
#define MODEL_RESULT_HPP

#include "Catalog.hpp"
#include "ConfigReader.hpp"
#include "FaultModel.hpp"
#include "SpatialBuffer.hpp"
#include "StressFieldEngine.hpp"
#include "TensorAnalysis.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CFSM {

/**
 * @brief Everything a run produces
 *
 * Grid-aligned vectors (field, deviatoric tensors, scalar fields, cfs)
 * follow the order of points: interior grid points, then the region's
 * boundary vertices. catalogCfs follows catalog.
 */
struct ModelResult {
    RunConfig config;
    std::shared_ptr<const FaultModel> faultModel;

    SampleGrid grid;
    std::vector<GeoPoint> points;

    StressField field;
    std::vector<SymmetricTensor> strainsDeviatoric;
    std::vector<SymmetricTensor> stressesDeviatoric;

    ReceiverOrientation receiver;
    std::vector<double> cfs;                                // Coulomb stress on the grid
    std::map<std::string, std::vector<double>> scalarFields;

    std::vector<CatalogEvent> catalog;
    std::vector<double> catalogCfs;

    std::optional<std::string> imagePath;
};

/**
 * @brief Names of the scalar fields, in output column order
 *
 * Nine reductions (cfs, cfs_shear_only, cfs_total, cfs_total_shear_only,
 * cfs_normal, i0, i1, i2, max_shear) of each of strains, stresses,
 * strains_deviatoric and stresses_deviatoric.
 */
const std::vector<std::string>& scalarFieldNames();

} // namespace CFSM

#endif // MODEL_RESULT_HPP
