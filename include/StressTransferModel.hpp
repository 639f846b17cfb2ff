#ifndef STRESS_TRANSFER_MODEL_HPP
#define STRESS_TRANSFER_MODEL_HPP

#include "CFSM.hpp"
#include "ConfigReader.hpp"
#include "CoordinateSystem.hpp"
#include "ModelResult.hpp"
#include <petscsys.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace CFSM {

struct RuptureDescription;

/**
 * @brief Runs one Coulomb stress transfer model
 *
 * Sequence: validate the configuration, build the fault model from the
 * rupture description, buffer the fault and sample a grid, evaluate the
 * stress field over the ranks of the communicator, reduce the tensors to
 * scalar fields, correlate the catalog with the buffered region, evaluate
 * each retained event, and render the result if a visualizer is set.
 *
 * Every rank of the communicator must call run(); every rank returns the
 * complete result. Rendering happens on rank 0 only, so imagePath is set
 * there alone.
 */
class StressTransferModel {
public:
    StressTransferModel(MPI_Comm comm, const RunConfig& config,
                        const DislocationSolver& solver,
                        std::shared_ptr<const CatalogSource> catalog,
                        ProjectorFactory projector_factory);

    // Optional; a failing visualizer never aborts the run
    void setVisualizer(std::shared_ptr<Visualizer> visualizer) { visualizer_ = std::move(visualizer); }

    /**
     * @brief Read config.rupture_source and run the model
     * @throws ConfigurationError, RuptureParseError or std::runtime_error
     */
    ModelResult run();

    // Run the model for an already parsed rupture description
    ModelResult run(const RuptureDescription& rupture);

    const RunConfig& getConfig() const { return config_; }

    /**
     * @brief The nine scalar reductions of one tensor field, keyed
     *        "<prefix>_<reduction>"
     */
    static void addScalarFields(const std::string& prefix,
                                const std::vector<SymmetricTensor>& tensors,
                                const ReceiverOrientation& receiver,
                                double coefficient_of_friction,
                                std::map<std::string, std::vector<double>>& out);

private:
    MPI_Comm comm_;
    PetscMPIInt rank_;
    RunConfig config_;
    const DislocationSolver& solver_;
    std::shared_ptr<const CatalogSource> catalog_;
    ProjectorFactory projector_factory_;
    std::shared_ptr<Visualizer> visualizer_;

    void evaluateCatalog(const StressFieldEngine& engine, ModelResult& result) const;
    void render(ModelResult& result) const;
};

} // namespace CFSM

#endif // STRESS_TRANSFER_MODEL_HPP
