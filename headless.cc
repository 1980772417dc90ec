////////////////////////////////////////////////////////////////////////////////
// Command-line ground structure optimizer: runs one optimization to
// completion and prints the per-iteration progress.
////////////////////////////////////////////////////////////////////////////////
#include <iostream>
#include "OptimizerParams.hh"
#include "StructuralErrors.hh"
#include "TopologyOptimizer.hh"

int main(int argc, const char *argv[]) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.txt]" << std::endl;
        return -1;
    }

    try {
        OptimizerParams params;
        if (argc == 2) params = readConfig(argv[1]);

        TopologyOptimizer topOpt;
        topOpt.initialize(params);
        OptimizerState s = topOpt.run();

        std::cout << topOpt.status() << std::endl;
        std::cout << "Final topology: " << topOpt.numActive() << " of " << topOpt.members().size()
                  << " members active after " << topOpt.iteration() << " iterations" << std::endl;
        return (s == OptimizerState::Converged) ? 0 : 1;
    }
    catch (const InvalidGeometryError &e) {
        std::cerr << "Invalid geometry: " << e.what() << std::endl;
    }
    catch (const SolverInstabilityError &e) {
        std::cerr << "Solver Error: " << e.what() << std::endl;
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
