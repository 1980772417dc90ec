////////////////////////////////////////////////////////////////////////////////
// TopologyOptimizer.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Evolutionary (soft-kill BESO) topology optimization of a frame ground
//  structure. Each iteration solves the current topology, ranks the active
//  members by a symmetrized strain-energy proxy and soft-kills the weakest
//  ones until the active member count drops below the convergence floor.
//
//  State machine:
//      Uninitialized --initialize--> Ready --step--> Running
//      Running --> Converged | Stopped | Failed
//  Terminal states are left only through a new `initialize` call.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef TOPOLOGYOPTIMIZER_HH
#define TOPOLOGYOPTIMIZER_HH

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "EnergyEvaluator.hh"
#include "EvolutionaryPruner.hh"
#include "GroundStructure.hh"
#include "OptimizerParams.hh"
#include "SectionProperties.hh"
#include "StructuralSolver.hh"

enum class OptimizerState : int { Uninitialized = 0, Ready, Running, Converged, Stopped, Failed };

const char *stateName(OptimizerState s);

// Snapshot handed to the rendering layer after every iteration.
struct IterationReport {
    struct MemberState {
        Eigen::Vector2d p1, p2;
        bool active;
        double force;
    };

    int iteration = 0;
    std::vector<MemberState> members;
    double maxActiveForce = 0.0; // largest force among the members still active (for proportional rendering)
    int numActive = 0;

    int numSelected = 0;
    int numRemoved  = 0;
    bool held = false;

    EnergyStats stats;
    OptimizerState state = OptimizerState::Uninitialized;
    std::string status;
};

struct TopologyOptimizer {
    using SolverFactory = std::function<std::unique_ptr<StructuralSolver>()>;

    // Called after every completed iteration; return false to cancel the run.
    using IterationCallback = std::function<bool(const IterationReport &)>;

    // Uses a `FrameSolver` unless another static-analysis engine is supplied.
    TopologyOptimizer(SolverFactory makeSolver = SolverFactory());

    // Build the ground structure, stiffness, symmetry map and boundary
    // conditions for a fresh run, discarding any previous one.
    // Throws InvalidGeometryError (leaving the optimizer Uninitialized).
    void initialize(const OptimizerParams &params);

    // One solve/evaluate/prune cycle. Any failure inside the cycle
    // transitions to Failed and is rethrown.
    IterationReport step();

    // Iterate until a terminal state is reached.
    OptimizerState run(const IterationCallback &callback = IterationCallback());

    // Cooperative cancellation; takes effect between iterations.
    void requestStop();

    OptimizerState state() const { return m_state; }
    std::string status() const;

    // Current state without running an iteration.
    IterationReport report() const;

    int iteration() const;
    int numActive() const;
    const std::vector<Member> &members() const;
    const std::vector<int> &twins() const;
    const GroundStructure &groundStructure() const;

    SectionProperties section;
    int leftSupportNode = -1, rightSupportNode = -1, loadNode = -1;

    bool verbose = true;

private:
    // Everything owned by a single optimization run.
    struct OptimizationState {
        GroundStructure structure;
        std::vector<int> twin;
        std::unique_ptr<StructuralSolver> solver;
        int iteration = 0;
        EnergyStats stats;
    };

    const OptimizationState &m_current() const;
    IterationReport m_makeReport(const PruneResult &prune) const;
    void m_fail(const std::string &message);

    SolverFactory m_makeSolver;
    OptimizerParams m_params;
    std::unique_ptr<OptimizationState> m_run;
    OptimizerState m_state = OptimizerState::Uninitialized;
    std::string m_error;
};

#endif /* end of include guard: TOPOLOGYOPTIMIZER_HH */
