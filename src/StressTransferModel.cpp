#include "StressTransferModel.hpp"
#include "CatalogCorrelator.hpp"
#include "GnuplotViz.hpp"
#include "SrcmodReader.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace CFSM {

const std::vector<std::string>& scalarFieldNames() {
    static const std::vector<std::string> names = [] {
        const char* fields[] = {"strains", "stresses", "strains_deviatoric", "stresses_deviatoric"};
        const char* reductions[] = {"cfs", "cfs_shear_only", "cfs_total", "cfs_total_shear_only",
                                    "cfs_normal", "i0", "i1", "i2", "max_shear"};
        std::vector<std::string> v;
        for (const char* f : fields) {
            for (const char* r : reductions) {
                v.push_back(std::string(f) + "_" + r);
            }
        }
        return v;
    }();
    return names;
}

StressTransferModel::StressTransferModel(MPI_Comm comm, const RunConfig& config,
                                         const DislocationSolver& solver,
                                         std::shared_ptr<const CatalogSource> catalog,
                                         ProjectorFactory projector_factory)
    : comm_(comm), rank_(0), config_(config), solver_(solver),
      catalog_(std::move(catalog)), projector_factory_(std::move(projector_factory)) {
    MPI_Comm_rank(comm_, &rank_);
    if (!catalog_) {
        throw std::invalid_argument("StressTransferModel requires a catalog source");
    }
    if (!projector_factory_) {
        throw std::invalid_argument("StressTransferModel requires a projector factory");
    }
}

void StressTransferModel::addScalarFields(const std::string& prefix,
                                          const std::vector<SymmetricTensor>& tensors,
                                          const ReceiverOrientation& receiver,
                                          double coefficient_of_friction,
                                          std::map<std::string, std::vector<double>>& out) {
    const Vec3& n = receiver.normal;
    const Vec3& s = receiver.inPlane;
    const double mu_f = coefficient_of_friction;

    out[prefix + "_cfs"] = TensorAnalysis::cfs(tensors, n, s, mu_f);
    out[prefix + "_cfs_shear_only"] = TensorAnalysis::cfs(tensors, n, s, 0.0);
    out[prefix + "_cfs_total"] = TensorAnalysis::cfsTotal(tensors, n, s, mu_f);
    out[prefix + "_cfs_total_shear_only"] = TensorAnalysis::cfsTotal(tensors, n, s, 0.0);
    out[prefix + "_cfs_normal"] = TensorAnalysis::cfsNormal(tensors, n, mu_f);

    TensorAnalysis::Invariants inv = TensorAnalysis::invariants(tensors);
    out[prefix + "_i0"] = std::move(inv.i1);
    out[prefix + "_i1"] = std::move(inv.i2);
    out[prefix + "_i2"] = std::move(inv.i3);

    out[prefix + "_max_shear"] = TensorAnalysis::maxShear(tensors);
}

ModelResult StressTransferModel::run() {
    config_.validate();

    PetscPrintf(comm_, "Reading rupture model: %s\n", config_.rupture_source.c_str());
    SrcmodReader reader;
    RuptureDescription rupture = reader.readFile(config_.rupture_source);
    return run(rupture);
}

ModelResult StressTransferModel::run(const RuptureDescription& rupture) {
    config_.validate();

    ModelResult result;
    result.config = config_;

    // Fault model
    FaultModelBuilder builder(projector_factory_);
    auto model = std::make_shared<const FaultModel>(builder.build(rupture));
    result.faultModel = model;
    if (model->empty()) {
        throw RuptureParseError("Rupture model " + config_.rupture_source + " has no usable fault patches");
    }
    PetscPrintf(comm_, "Fault model: %d patches, mean strike %.1f, mean dip %.1f\n",
                static_cast<int>(model->size()), model->getMeanStrike(), model->getMeanDip());
    PetscPrintf(comm_, "  Projection: %s\n", model->getProjector().describe().c_str());

    // Near field and sampling grid
    BufferedRegion region = SpatialBuffer::buildRegion(model->getPatches(),
                                                       config_.near_field_distance,
                                                       config_.circle_points);
    result.grid = SpatialBuffer::buildGrid(region, config_.spacing_grid);
    result.points = result.grid.points(config_.obs_depth);
    PetscPrintf(comm_, "Sampling grid: %d interior + %d boundary points at %.1f m\n",
                static_cast<int>(result.grid.interior.size()),
                static_cast<int>(result.grid.boundary.size()), config_.obs_depth);

    // Stress field
    StressFieldEngine engine(solver_, config_.lame_lambda, config_.shear_modulus_mu);
    PetscErrorCode ierr = engine.computeFieldDistributed(comm_, result.points, *model, result.field);
    if (ierr) {
        std::ostringstream oss;
        oss << "Distributed stress evaluation failed with PETSc error " << ierr;
        throw std::runtime_error(oss.str());
    }
    result.strainsDeviatoric = TensorAnalysis::deviatoric(result.field.strains);
    result.stressesDeviatoric = TensorAnalysis::deviatoric(result.field.stresses);

    // Scalar fields on the receiver plane
    result.receiver = TensorAnalysis::receiverOrientation(model->getMeanStrike(), model->getMeanDip());
    const double mu_f = config_.coefficient_of_friction;
    addScalarFields("strains", result.field.strains, result.receiver, mu_f, result.scalarFields);
    addScalarFields("stresses", result.field.stresses, result.receiver, mu_f, result.scalarFields);
    addScalarFields("strains_deviatoric", result.strainsDeviatoric, result.receiver, mu_f,
                    result.scalarFields);
    addScalarFields("stresses_deviatoric", result.stressesDeviatoric, result.receiver, mu_f,
                    result.scalarFields);
    result.cfs = TensorAnalysis::cfs(result.field.stresses, result.receiver.normal,
                                     result.receiver.inPlane, mu_f);

    if (!result.cfs.empty()) {
        auto mm = std::minmax_element(result.cfs.begin(), result.cfs.end());
        PetscPrintf(comm_, "Coulomb stress on grid: min %g Pa, max %g Pa\n", *mm.first, *mm.second);
    }

    // Aftershock catalog
    TimePoint start = TimeUtils::addDays(model->date, 1);
    TimePoint end = TimeUtils::addDays(model->date, 1 + config_.days);
    PetscPrintf(comm_, "Catalog window: %s to %s (%s)\n",
                TimeUtils::formatUtc(start).c_str(), TimeUtils::formatUtc(end).c_str(),
                toString(config_.catalog_type).c_str());
    std::vector<CatalogEvent> events = catalog_->fetch(start, end,
                                                       model->getEpicenterLatitude(),
                                                       model->getEpicenterLongitude(),
                                                       config_.catalog_radius_km);
    result.catalog = CatalogCorrelator::correlate(events, *model, region);
    PetscPrintf(comm_, "Catalog: %d events fetched, %d inside the near field\n",
                static_cast<int>(events.size()), static_cast<int>(result.catalog.size()));

    evaluateCatalog(engine, result);
    render(result);

    return result;
}

void StressTransferModel::evaluateCatalog(const StressFieldEngine& engine, ModelResult& result) const {
    result.catalogCfs.clear();
    result.catalogCfs.reserve(result.catalog.size());
    for (const auto& event : result.catalog) {
        SymmetricTensor strain, stress;
        engine.computePoint(GeoPoint(event.x, event.y, event.depth * KM2M),
                            *result.faultModel, strain, stress);
        result.catalogCfs.push_back(TensorAnalysis::cfs(stress, result.receiver.normal,
                                                        result.receiver.inPlane,
                                                        config_.coefficient_of_friction));
    }
}

void StressTransferModel::render(ModelResult& result) const {
    if (!visualizer_) return;

    // The image is produced once, on the first rank
    if (rank_ != 0) return;

    try {
        result.imagePath = visualizer_->render(result);
        PetscPrintf(PETSC_COMM_SELF, "Plot written: %s\n", result.imagePath->c_str());
    } catch (const std::exception& e) {
        result.imagePath.reset();
        PetscPrintf(PETSC_COMM_SELF, "Warning: visualization failed: %s\n", e.what());
    } catch (...) {
        result.imagePath.reset();
        PetscPrintf(PETSC_COMM_SELF, "Warning: visualization failed with an unknown error\n");
    }
}

} // namespace CFSM
