#include "ForecastSession.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "MMWF - Multi-Mesh Graph Weather Forecaster\n"
                    "Usage: mmwf [options]\n\n"
                    "Options:\n"
                    "  -c <file>              Configuration file (.config)\n"
                    "  -i <file>              Initial state (PETSc binary tensor)\n"
                    "  -f <file>              Forcings (PETSc binary tensor)\n"
                    "  -o <prefix>            Output prefix (default: EVAL.output_prefix)\n"
                    "  -steps <n>             Forecast steps (default: EVAL.forecast_steps)\n"
                    "  -generate_config <f>   Write a template configuration\n\n"
                    "Examples:\n"
                    "  # Six-step forecast\n"
                    "  mmwf -c config/forecast.config -i init.bin -f forcings.bin -steps 6\n\n"
                    "  # Generate template configuration\n"
                    "  mmwf -generate_config my_forecast.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int exit_code = 0;
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
                    MMWF::ConfigReader::generateTemplate(generate_config);
                } catch (const std::exception& e) {
                    std::cerr << "Error: " << e.what() << std::endl;
                    exit_code = 1;
                }
            }
            ierr = PetscFinalize();
            return exit_code;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char state_file[PETSC_MAX_PATH_LEN] = "";
        char forcing_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        PetscInt steps = 0;
        PetscBool config_provided = PETSC_FALSE;
        PetscBool state_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-i", state_file,
                                     sizeof(state_file), &state_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-f", forcing_file,
                                     sizeof(forcing_file), nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-steps", &steps, nullptr); CHKERRQ(ierr);

        if (!config_provided || !state_provided) {
            PetscPrintf(comm, "Error: configuration file (-c) and initial state (-i) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: mmwf -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  MMWF - Multi-Mesh Graph Weather Forecaster\n");
        PetscPrintf(comm, "  Version 1.0.0\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "Config file:   %s\n", config_file);
        PetscPrintf(comm, "Initial state: %s\n", state_file);
        if (forcing_file[0] != '\0') {
            PetscPrintf(comm, "Forcings:      %s\n", forcing_file);
        }
        PetscPrintf(comm, "\n");

        try {
            MMWF::ForecastSession session(comm);

            ierr = session.initializeFromConfigFile(config_file); CHKERRQ(ierr);
            ierr = session.loadInitialState(state_file, forcing_file); CHKERRQ(ierr);

            PetscPrintf(comm, "------------------------------------------------------------\n");
            double start_time = MPI_Wtime();
            ierr = session.run(static_cast<int>(steps)); CHKERRQ(ierr);
            double end_time = MPI_Wtime();
            PetscPrintf(comm, "------------------------------------------------------------\n");
            PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);

            std::string prefix = output_provided ? std::string(output_prefix)
                                                 : session.config().eval.output_prefix;
            ierr = session.writeOutput(prefix); CHKERRQ(ierr);

            if (session.numFailed() > 0) {
                PetscPrintf(comm, "\n%d of %d forecast(s) failed\n",
                            session.numFailed(), session.batchSize());
                exit_code = 1;
            } else {
                PetscPrintf(comm, "\nForecast completed successfully!\n");
            }
            PetscPrintf(comm, "============================================================\n");

        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return exit_code;
}
