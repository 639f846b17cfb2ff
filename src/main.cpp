#include "CFSM.hpp"
#include "Catalog.hpp"
#include "ConfigReader.hpp"
#include "Dc3dSolver.hpp"
#include "GnuplotViz.hpp"
#include "ResultWriter.hpp"
#include "StressTransferModel.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "cfsm - Coulomb Failure Stress Modeler\n"
                    "Usage: cfsm [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -o <prefix>              Output file prefix (overrides [output] prefix)\n"
                    "  -generate_config <file>  Write a template configuration and exit\n\n"
                    "Examples:\n"
                    "  # Run from a configuration file\n"
                    "  mpirun -np 4 cfsm -c examples/cfsm.config\n\n"
                    "  # Generate template configuration\n"
                    "  cfsm -generate_config my_run.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int status = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                try {
                    CFSM::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(comm, "Error: %s\n", e.what());
                    status = 1;
                }
            }
            ierr = PetscFinalize();
            return status;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool prefix_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &prefix_provided); CHKERRQ(ierr);

        if (!config_provided) {
            PetscPrintf(comm, "Error: Configuration file (-c) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: cfsm -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  CFSM - Coulomb Failure Stress Modeler\n");
        PetscPrintf(comm, "  Version 1.0.0\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "Config file:   %s\n", config_file);

        try {
            CFSM::ConfigReader reader;
            if (!reader.loadFile(config_file)) {
                throw CFSM::ConfigurationError(std::string("Cannot read configuration file: ") +
                                               config_file);
            }
            CFSM::RunConfig config = reader.parseRunConfig();
            if (prefix_provided) {
                config.output_prefix = output_prefix;
            }
            config.validate();

            PetscPrintf(comm, "Output prefix: %s\n", config.output_prefix.c_str());
            PetscPrintf(comm, "Catalog:       %s (%s)\n", config.catalog_directory.c_str(),
                        CFSM::toString(config.catalog_type).c_str());
            PetscPrintf(comm, "\n");

            CFSM::Dc3dSolver solver;
            auto catalog = std::make_shared<CFSM::IscCatalogReader>(config.catalog_directory,
                                                                    config.catalog_type);
            CFSM::StressTransferModel model(comm, config, solver, catalog,
                                            CFSM::makeProjectorFactory(config.projection));
            if (config.plot) {
                model.setVisualizer(std::make_shared<CFSM::GnuplotViz>(config.plot_directory));
            }

            CFSM::ModelResult result = model.run();

            if (rank == 0) {
                PetscPrintf(PETSC_COMM_SELF, "\nWriting results...\n");
                CFSM::ResultWriter writer(config.output_prefix);
                writer.write(result);
            }

            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  Run completed successfully\n");
            PetscPrintf(comm, "============================================================\n");
        } catch (const std::exception& e) {
            PetscPrintf(PETSC_COMM_SELF, "Error: %s\n", e.what());
            status = 1;
        }
    }

    ierr = PetscFinalize();
    return status ? status : static_cast<int>(ierr);
}
