#include "TopologyOptimizer.hh"
#include "FrameSolver.hh"
#include "SymmetryMapper.hh"
#include "StructuralErrors.hh"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

const char *stateName(OptimizerState s) {
    switch (s) {
        case OptimizerState::Uninitialized: return "Uninitialized";
        case OptimizerState::Ready:         return "Ready";
        case OptimizerState::Running:       return "Running";
        case OptimizerState::Converged:     return "Converged";
        case OptimizerState::Stopped:       return "Stopped";
        case OptimizerState::Failed:        return "Failed";
    }
    return "Unknown";
}

TopologyOptimizer::TopologyOptimizer(SolverFactory makeSolver)
    : m_makeSolver(makeSolver)
{
    if (!m_makeSolver)
        m_makeSolver = []() { return std::unique_ptr<StructuralSolver>(new FrameSolver()); };
}

void TopologyOptimizer::initialize(const OptimizerParams &params) {
    // A new run supersedes the old one even if building it fails.
    m_run.reset();
    m_state = OptimizerState::Uninitialized;
    m_error.clear();
    leftSupportNode = rightSupportNode = loadNode = -1;

    params.validate();
    // Reject degenerate sections before any mesh is built.
    SectionProperties sp = sectionProperties(params.section);

    auto run = std::make_unique<OptimizationState>();
    run->structure = generateGroundStructure(params.span, params.height, params.grid);
    auto &gs = run->structure;
    const int numPairs = assignMirrors(gs.members, params.span, params.symmetryTolerance);
    run->twin = twinTable(gs.members);

    StructuralModel model;
    model.V = gs.V;
    model.E.resize(gs.numMembers(), 2);
    for (const auto &m : gs.members)
        model.E.row(m.id) << m.n1, m.n2;
    model.EA.setConstant(gs.numMembers(), params.youngsModulus * sp.area);
    model.EI.setConstant(gs.numMembers(), params.youngsModulus * sp.inertia);

    const int left  = gs.closestNode(Eigen::Vector2d(0, 0));
    const int right = gs.closestNode(Eigen::Vector2d(params.span, 0));
    const int top   = gs.closestNode(Eigen::Vector2d(0.5 * params.span, params.height));
    model.supports.emplace_back(left,  leftSupportType(params.support));
    model.supports.emplace_back(right, rightSupportType(params.support));
    model.loads.emplace_back(top, Eigen::Vector2d(0, -params.load));

    run->solver = m_makeSolver();
    if (!run->solver) throw std::runtime_error("Solver factory returned no solver");
    run->solver->setModel(model);

    m_params = params;
    section = sp;
    leftSupportNode  = left;
    rightSupportNode = right;
    loadNode = top;
    m_run = std::move(run);
    m_state = OptimizerState::Ready;

    if (verbose) {
        std::cout << "Ground structure: " << gs.numNodes() << " nodes, " << gs.numMembers() << " members, "
                  << numPairs << " symmetric pairs (" << params.support << ")" << std::endl;
        std::cout << "Section: A = " << sp.area << " m^2, I = " << sp.inertia << " m^4" << std::endl;
    }
}

IterationReport TopologyOptimizer::step() {
    if ((m_state != OptimizerState::Ready) && (m_state != OptimizerState::Running))
        throw std::runtime_error(std::string("Cannot iterate in state ") + stateName(m_state));
    m_state = OptimizerState::Running;

    auto &run = *m_run;
    auto &members = run.structure.members;

    const int activeBefore = numActive();
    PruneResult prune;
    try {
        StructuralResults results = run.solver->solve();
        run.stats = evaluateStrainEnergy(members, results);
        prune = pruneWeakest(members, run.twin, *run.solver, m_params.prune);
    }
    catch (const std::exception &e) {
        m_fail(e.what());
        throw;
    }
    ++run.iteration;

    if (numActive() < m_params.convergenceFloor)
        m_state = OptimizerState::Converged;

    if (verbose) {
        std::stringstream ss;
        ss << "[Iter " << std::setw(3) << std::setfill('0') << run.iteration << "]"
           << " Active: "  << std::setw(3) << activeBefore
           << " | Removed: " << std::setw(2) << prune.numRemoved
           << std::setfill(' ') << std::fixed << std::setprecision(2)
           << " | Max Force: " << run.stats.maxForce / 1000 << " kN"
           << std::scientific << " | Total Energy: " << run.stats.totalEnergy;
        if (prune.held) ss << " (hold)";
        std::cout << ss.str() << std::endl;
    }

    return m_makeReport(prune);
}

OptimizerState TopologyOptimizer::run(const IterationCallback &callback) {
    while ((m_state == OptimizerState::Ready) || (m_state == OptimizerState::Running)) {
        if (iteration() >= m_params.maxIterations) {
            std::cerr << "WARNING: iteration limit (" << m_params.maxIterations << ") reached before convergence" << std::endl;
            m_state = OptimizerState::Stopped;
            break;
        }
        IterationReport r = step();
        if (callback && !callback(r)) requestStop();
    }
    return m_state;
}

void TopologyOptimizer::requestStop() {
    if ((m_state == OptimizerState::Ready) || (m_state == OptimizerState::Running))
        m_state = OptimizerState::Stopped;
}

std::string TopologyOptimizer::status() const {
    switch (m_state) {
        case OptimizerState::Uninitialized: return "Ready";
        case OptimizerState::Converged:     return "Optimization Converged.";
        case OptimizerState::Stopped:       return "Stopped by User.";
        case OptimizerState::Failed:        return "Solver Error: " + m_error;
        default: break;
    }
    std::stringstream ss;
    ss << "Iteration: " << iteration() << " | Active Elements: " << numActive();
    return ss.str();
}

IterationReport TopologyOptimizer::report() const { return m_makeReport(PruneResult()); }

int TopologyOptimizer::iteration() const { return m_run ? m_run->iteration : 0; }

int TopologyOptimizer::numActive() const {
    if (!m_run) return 0;
    int count = 0;
    for (const auto &m : m_run->structure.members)
        count += m.active;
    return count;
}

const std::vector<Member> &TopologyOptimizer::members() const { return m_current().structure.members; }
const std::vector<int>    &TopologyOptimizer::twins()   const { return m_current().twin; }
const GroundStructure &TopologyOptimizer::groundStructure() const { return m_current().structure; }

const TopologyOptimizer::OptimizationState &TopologyOptimizer::m_current() const {
    if (!m_run) throw std::runtime_error("Optimizer has not been initialized");
    return *m_run;
}

IterationReport TopologyOptimizer::m_makeReport(const PruneResult &prune) const {
    IterationReport r;
    r.iteration   = iteration();
    r.numActive   = numActive();
    r.numSelected = prune.numSelected;
    r.numRemoved  = prune.numRemoved;
    r.held        = prune.held;
    r.state       = m_state;
    r.status      = status();
    if (!m_run) return r;

    r.stats = m_run->stats;
    r.members.reserve(m_run->structure.members.size());
    for (const auto &m : m_run->structure.members) {
        r.members.push_back({m.p1, m.p2, m.active, m.forceVal});
        if (m.active) r.maxActiveForce = std::max(r.maxActiveForce, m.forceVal);
    }
    return r;
}

void TopologyOptimizer::m_fail(const std::string &message) {
    m_state = OptimizerState::Failed;
    m_error = message;
    std::cerr << "Solver failed: " << message << std::endl;
}
