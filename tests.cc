#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <memory>
#include <set>
#include <utility>

#include "EnergyEvaluator.hh"
#include "EvolutionaryPruner.hh"
#include "FrameSolver.hh"
#include "GroundStructure.hh"
#include "OptimizerParams.hh"
#include "SectionProperties.hh"
#include "StructuralErrors.hh"
#include "SymmetryMapper.hh"
#include "TopologyOptimizer.hh"

int numFailures = 0;

void REQUIRE(const std::string &name, bool cond) {
    if (!cond) {
        ++numFailures;
        std::cout << name << " TEST FAILURE" << std::endl;
    }
}

void REQUIRE_EQ(const std::string &name, double a, double b, const double tol = 1e-10) {
    if (!(std::abs(a - b) <= tol * std::abs(b))) {
        ++numFailures;
        double relError = std::abs((a - b) / b);
        std::cout << name << " TEST FAILURE: " << a << " vs " << b << " (relative error " << relError << ")" << std::endl;
    }
}

void REQUIRE_EQ(const std::string &name, int a, int b) {
    if (a != b) {
        ++numFailures;
        std::cout << name << " TEST FAILURE: " << a << " vs " << b << std::endl;
    }
}

template<class Exception, class F>
void REQUIRE_THROWS(const std::string &name, F &&f) {
    try {
        f();
    }
    catch (const Exception &) {
        return;
    }
    catch (const std::exception &e) {
        ++numFailures;
        std::cout << name << " TEST FAILURE: unexpected exception " << e.what() << std::endl;
        return;
    }
    ++numFailures;
    std::cout << name << " TEST FAILURE: no exception thrown" << std::endl;
}

OptimizerParams quietParams() {
    OptimizerParams p; // span 16, height 5, 800 kN, Pinned-Roller, 150x300x8x12 mm, 200 GPa
    return p;
}

Member makeMember(int id, const Eigen::Vector2d &p1, const Eigen::Vector2d &p2) {
    Member m;
    m.id = id;
    m.n1 = 2 * id;
    m.n2 = 2 * id + 1;
    m.p1 = p1;
    m.p2 = p2;
    m.mid = 0.5 * (p1 + p2);
    m.length = (p2 - p1).norm();
    return m;
}

// Unit-stiffness model matching a row built by `makeMember`.
StructuralModel rowModel(const std::vector<Member> &members) {
    const int n = members.size();
    StructuralModel model;
    model.V.resize(2 * n, 2);
    model.E.resize(n, 2);
    for (const auto &m : members) {
        model.V.row(m.n1) = m.p1.transpose();
        model.V.row(m.n2) = m.p2.transpose();
        model.E.row(m.id) << m.n1, m.n2;
    }
    model.EA.setOnes(n);
    model.EI.setOnes(n);
    return model;
}

// Static-analysis stand-in reporting a fixed force pattern scaled by each
// member's remaining stiffness; optionally fails on a chosen solve.
struct ScriptedSolver : public StructuralSolver {
    virtual void setModel(const StructuralModel &model) override {
        m_model = model;
        EA0 = model.EA;
    }

    virtual void scaleMemberStiffness(int m, double factor) override {
        if ((m < 0) || (m >= m_model.numMembers())) throw std::runtime_error("Member index out of range");
        m_model.EA[m] *= factor;
        m_model.EI[m] *= factor;
        scaled.push_back(std::make_pair(m, factor));
    }

    virtual StructuralResults solve() override {
        if (numSolves++ == failOnSolve) throw SolverInstabilityError("singular stiffness matrix");
        StructuralResults r;
        r.U.setZero(m_model.numNodes(), 3);
        r.reactions.setZero(m_model.numNodes(), 3);
        r.memberForces.resize(m_model.numMembers());
        for (int m = 0; m < m_model.numMembers(); ++m)
            r.memberForces[m].axial.setConstant(1, -(1.0 + m % 7) * m_model.EA[m] / EA0[m]);
        if (dropLastResult) r.memberForces.pop_back();
        return r;
    }

    const StructuralModel &model() const { return m_model; }

    int numSolves = 0;
    int failOnSolve = -1;
    bool dropLastResult = false;
    Eigen::VectorXd EA0;
    std::vector<std::pair<int, double>> scaled;
private:
    StructuralModel m_model;
};

////////////////////////////////////////////////////////////////////////////////
// Ground structure
////////////////////////////////////////////////////////////////////////////////
void testGroundStructure() {
    GroundStructureSettings settings;
    GroundStructure gs = generateGroundStructure(16.0, 5.0, settings);

    REQUIRE_EQ("ground structure node count", gs.numNodes(), 36);
    REQUIRE_EQ("ground structure member count", gs.numMembers(), 107);

    const double maxDist = settings.maxConnectionDistance(16.0);
    std::set<std::pair<int, int>> endpoints;
    for (int i = 0; i < gs.numMembers(); ++i) {
        const Member &m = gs.members[i];
        REQUIRE("member id matches index", m.id == i);
        REQUIRE("member length in range", (m.length > settings.eps) && (m.length <= maxDist));
        REQUIRE("member starts active", m.active);
        endpoints.insert(std::make_pair(std::min(m.n1, m.n2), std::max(m.n1, m.n2)));
    }
    REQUIRE_EQ("no duplicate members", int(endpoints.size()), gs.numMembers());

    GroundStructure again = generateGroundStructure(16.0, 5.0, settings);
    bool same = (again.numMembers() == gs.numMembers());
    for (int i = 0; same && i < gs.numMembers(); ++i)
        same = (again.members[i].n1 == gs.members[i].n1) && (again.members[i].n2 == gs.members[i].n2);
    REQUIRE("ground structure deterministic", same);

    REQUIRE_EQ("closest node to origin", gs.closestNode(Eigen::Vector2d(0, 0)), 0);
    REQUIRE_EQ("closest node to top mid-span", gs.closestNode(Eigen::Vector2d(8, 5)), 4 * 4 + 3);

    REQUIRE_THROWS<InvalidGeometryError>("zero span", [&]() { generateGroundStructure(0.0, 5.0); });
    REQUIRE_THROWS<InvalidGeometryError>("negative height", [&]() { generateGroundStructure(16.0, -1.0); });
    settings.yDivs = 0;
    REQUIRE_THROWS<InvalidGeometryError>("no divisions", [&]() { generateGroundStructure(16.0, 5.0, settings); });
}

////////////////////////////////////////////////////////////////////////////////
// Section properties
////////////////////////////////////////////////////////////////////////////////
void testSectionProperties() {
    ISection s; // 150 x 300 x 8 x 12 mm
    SectionProperties sp = sectionProperties(s);
    REQUIRE_EQ("I-section area", sp.area, 2 * 0.150 * 0.012 + 0.276 * 0.008);
    REQUIRE_EQ("I-section inertia", sp.inertia, (0.150 * 0.027 - 0.142 * 0.276 * 0.276 * 0.276) / 12.0);

    // A web as wide as the flanges is a solid rectangle.
    ISection rect;
    rect.B = rect.tw = 0.2;
    rect.D = 0.4;
    rect.tf = 0.05;
    sp = sectionProperties(rect);
    REQUIRE_EQ("rectangle area", sp.area, 0.2 * 0.4);
    REQUIRE_EQ("rectangle inertia", sp.inertia, 0.2 * 0.4 * 0.4 * 0.4 / 12.0);

    ISection bad = s;
    bad.tf = 0.5 * bad.D;
    REQUIRE_THROWS<InvalidGeometryError>("flange thickness half the depth", [&]() { sectionProperties(bad); });
    bad = s;
    bad.tw = -0.001;
    REQUIRE_THROWS<InvalidGeometryError>("negative web", [&]() { sectionProperties(bad); });
    bad = s;
    bad.tw = 2 * bad.B;
    REQUIRE_THROWS<InvalidGeometryError>("web wider than flange", [&]() { sectionProperties(bad); });
}

////////////////////////////////////////////////////////////////////////////////
// Symmetry map
////////////////////////////////////////////////////////////////////////////////
// Whether `b`'s endpoints are `a`'s endpoints mirrored about x = span / 2.
bool reflects(const Member &a, const Member &b, double span) {
    const Eigen::Vector2d r1(span - a.p1[0], a.p1[1]), r2(span - a.p2[0], a.p2[1]);
    const double tol = 1e-9;
    return (((b.p1 - r1).norm() < tol) && ((b.p2 - r2).norm() < tol))
        || (((b.p1 - r2).norm() < tol) && ((b.p2 - r1).norm() < tol));
}

void testSymmetryMapper() {
    const double span = 16.0, tol = 0.1;
    GroundStructure gs = generateGroundStructure(span, 5.0);
    const int numPairs = assignMirrors(gs.members, span, tol);

    int numLeft = 0;
    std::set<int> mirrors;
    for (const auto &m : gs.members) {
        if (m.mid[0] < 0.5 * span) {
            ++numLeft;
            REQUIRE("left member has a mirror on the regular grid", m.mirrorId >= 0);
        }
        else {
            REQUIRE("right/center member has no mirror assigned", m.mirrorId == -1);
        }
        if (m.mirrorId < 0) continue;

        REQUIRE("no self mirror", m.mirrorId != m.id);
        const Member &twin = gs.members[m.mirrorId];
        Eigen::Vector2d reflected(span - m.mid[0], m.mid[1]);
        REQUIRE("mirror midpoint within tolerance", (twin.mid - reflected).norm() < tol);
        REQUIRE("mirror lies right of center", twin.mid[0] > 0.5 * span);
        REQUIRE_EQ("mirror length", twin.length, m.length, 1e-9);
        REQUIRE("mirror endpoints reflect member endpoints", reflects(m, twin, span));
        mirrors.insert(m.mirrorId);
    }
    REQUIRE_EQ("pair count", numPairs, numLeft);
    REQUIRE_EQ("mirrors are one-to-one", int(mirrors.size()), numPairs);

    std::vector<int> twin = twinTable(gs.members);
    for (const auto &m : gs.members) {
        if (twin[m.id] < 0) continue;
        REQUIRE("twin table is symmetric", twin[twin[m.id]] == m.id);
    }
    // Crossing diagonals share a midpoint; a rising diagonal mirrors onto a falling one.
    {
        std::vector<Member> cells;
        cells.push_back(makeMember(0, Eigen::Vector2d(0, 0), Eigen::Vector2d(2, 1))); // left, rising
        cells.push_back(makeMember(1, Eigen::Vector2d(0, 1), Eigen::Vector2d(2, 0))); // left, falling
        cells.push_back(makeMember(2, Eigen::Vector2d(4, 0), Eigen::Vector2d(6, 1))); // right, rising
        cells.push_back(makeMember(3, Eigen::Vector2d(4, 1), Eigen::Vector2d(6, 0))); // right, falling
        REQUIRE_EQ("crossing diagonal pairs", assignMirrors(cells, 6.0, tol), 2);
        REQUIRE_EQ("rising diagonal mirrors falling", cells[0].mirrorId, 3);
        REQUIRE_EQ("falling diagonal mirrors rising", cells[1].mirrorId, 2);
    }

    // Vertical members on the centerline are unpaired.
    for (const auto &m : gs.members) {
        if (std::abs(m.mid[0] - 0.5 * span) < 1e-12)
            REQUIRE("centerline member unpaired", twin[m.id] == -1);
    }
}

////////////////////////////////////////////////////////////////////////////////
// Frame solver
////////////////////////////////////////////////////////////////////////////////
void testFrameSolver() {
    const double EA = 1e6, EI = 1e3;

    // Cantilever bar under an axial tip load.
    {
        StructuralModel model;
        model.V.resize(2, 2);
        model.V << 0, 0,
                   2, 0;
        model.E.resize(1, 2);
        model.E << 0, 1;
        model.EA.setConstant(1, EA);
        model.EI.setConstant(1, EI);
        model.supports.emplace_back(0, Support::Type::Fixed);
        model.loads.emplace_back(1, Eigen::Vector2d(500, 0));

        FrameSolver solver(model);
        StructuralResults r = solver.solve();
        REQUIRE_EQ("axial force", r.memberForces[0].axial[0], 500.0, 1e-9);
        REQUIRE_EQ("axial elongation", r.U(1, 0), 500.0 * 2 / EA, 1e-9);
        REQUIRE_EQ("axial reaction", r.reactions(0, 0), -500.0, 1e-9);

        // Soft-killed members stay in the topology: a statically determinate
        // bar still carries the full load.
        solver.scaleMemberStiffness(0, 1e-6);
        REQUIRE_EQ("soft-kill scales EA", solver.model().EA[0], EA * 1e-6);
        REQUIRE_EQ("soft-kill scales EI", solver.model().EI[0], EI * 1e-6);
        r = solver.solve();
        REQUIRE_EQ("soft-killed axial force", r.memberForces[0].axial[0], 500.0, 1e-6);
    }

    // Simply supported beam of span 4 with a mid-span point load.
    {
        const double P = 1000, L = 4;
        StructuralModel model;
        model.V.resize(3, 2);
        model.V << 0, 0,
                   2, 0,
                   4, 0;
        model.E.resize(2, 2);
        model.E << 0, 1,
                   1, 2;
        model.EA.setConstant(2, EA);
        model.EI.setConstant(2, EI);
        model.supports.emplace_back(0, Support::Type::Pinned);
        model.supports.emplace_back(2, Support::Type::Roller);
        model.loads.emplace_back(1, Eigen::Vector2d(0, -P));

        FrameSolver solver(model);
        StructuralResults r = solver.solve();
        REQUIRE_EQ("mid-span deflection", r.U(1, 1), -P * L * L * L / (48 * EI), 1e-8);
        REQUIRE_EQ("left reaction", r.reactions(0, 1), P / 2, 1e-8);
        REQUIRE_EQ("right reaction", r.reactions(2, 1), P / 2, 1e-8);

        double maxMoment = 0;
        for (const auto &mf : r.memberForces) {
            REQUIRE("no axial force in the beam", std::abs(mf.axial[0]) < 1e-6);
            REQUIRE_EQ("shear magnitude", std::abs(mf.shear[0]), P / 2, 1e-8);
            REQUIRE_EQ("moment sample count", int(mf.moment.size()), solver.numMomentSamples);
            maxMoment = std::max(maxMoment, mf.moment.cwiseAbs().maxCoeff());
        }
        REQUIRE_EQ("mid-span moment", maxMoment, P * L / 4, 1e-8);
        REQUIRE("pinned end carries no moment", std::abs(r.memberForces[0].moment[0]) < 1e-6);
    }

    // A node attached to nothing makes the system singular.
    {
        StructuralModel model;
        model.V.resize(3, 2);
        model.V << 0, 0,
                   2, 0,
                   5, 5;
        model.E.resize(1, 2);
        model.E << 0, 1;
        model.EA.setConstant(1, EA);
        model.EI.setConstant(1, EI);
        model.supports.emplace_back(0, Support::Type::Fixed);
        model.loads.emplace_back(1, Eigen::Vector2d(0, -10));

        FrameSolver solver(model);
        REQUIRE_THROWS<SolverInstabilityError>("isolated node", [&]() { solver.solve(); });
    }

    {
        StructuralModel model;
        model.V.resize(2, 2);
        model.V << 0, 0,
                   1, 0;
        model.E.resize(1, 2);
        model.E << 0, 3;
        model.EA.setConstant(1, EA);
        model.EI.setConstant(1, EI);
        FrameSolver solver;
        REQUIRE_THROWS<std::runtime_error>("bad member endpoint", [&]() { solver.setModel(model); });
    }
}

////////////////////////////////////////////////////////////////////////////////
// Energy evaluation
////////////////////////////////////////////////////////////////////////////////
void testEnergyEvaluator() {
    Eigen::VectorXd samples;
    REQUIRE_EQ("no force samples", forceMagnitude(samples), 0.0);
    samples.setConstant(1, -3.0);
    REQUIRE_EQ("scalar force", forceMagnitude(samples), 3.0);
    samples.resize(4);
    samples << 1.0, -5.0, 2.0, std::numeric_limits<double>::quiet_NaN();
    REQUIRE_EQ("force distribution", forceMagnitude(samples), 5.0);

    std::vector<Member> members;
    members.push_back(makeMember(0, Eigen::Vector2d(0, 0), Eigen::Vector2d(1, 0)));
    members.push_back(makeMember(1, Eigen::Vector2d(3, 0), Eigen::Vector2d(4, 0)));
    members.push_back(makeMember(2, Eigen::Vector2d(0, 1), Eigen::Vector2d(2, 1)));
    members.push_back(makeMember(3, Eigen::Vector2d(2, 0), Eigen::Vector2d(2, 1)));
    members[0].mirrorId = 1;
    members[2].active = false;
    members[2].forceVal = 7.0;
    members[2].strainEnergy = 98.0;

    StructuralResults r;
    r.memberForces.resize(4);
    r.memberForces[0].axial.setConstant(1, 2.0);
    r.memberForces[1].axial.setConstant(1, -4.0);
    r.memberForces[2].axial.setConstant(1, 100.0);
    r.memberForces[3].axial.resize(3);
    r.memberForces[3].axial << 0.5, -1.0, 0.25;

    EnergyStats stats = evaluateStrainEnergy(members, r);
    REQUIRE_EQ("total energy", stats.totalEnergy, 4.0 + 16.0 + 1.0);
    REQUIRE_EQ("max force", stats.maxForce, 4.0);
    REQUIRE_EQ("stored force", members[1].forceVal, 4.0);
    REQUIRE("pair energies equal", members[0].strainEnergy == members[1].strainEnergy);
    REQUIRE_EQ("pair energy average", members[0].strainEnergy, 10.0);
    REQUIRE_EQ("unpaired energy", members[3].strainEnergy, 1.0);
    REQUIRE_EQ("inactive force untouched", members[2].forceVal, 7.0);
    REQUIRE_EQ("inactive energy untouched", members[2].strainEnergy, 98.0);

    // No averaging with an inactive mirror.
    members[1].active = false;
    stats = evaluateStrainEnergy(members, r);
    REQUIRE_EQ("energy with inactive mirror", members[0].strainEnergy, 4.0);

    r.memberForces.pop_back();
    REQUIRE_THROWS<std::runtime_error>("result size mismatch", [&]() { evaluateStrainEnergy(members, r); });
}

////////////////////////////////////////////////////////////////////////////////
// Pruning
////////////////////////////////////////////////////////////////////////////////
void testPruner() {
    PruneSettings settings;
    REQUIRE_EQ("at least one removal", removalCount(48, settings), 1);
    REQUIRE_EQ("ratio removal", removalCount(107, settings), 2);
    REQUIRE_EQ("removal at the floor", removalCount(15, settings), 1);
    REQUIRE_EQ("hold below the floor", removalCount(14, settings), 0);

    auto makeRow = [](int n) {
        std::vector<Member> members;
        for (int i = 0; i < n; ++i) {
            members.push_back(makeMember(i, Eigen::Vector2d(i, 0), Eigen::Vector2d(i + 1, 0)));
            members.back().strainEnergy = 1.0 + i;
        }
        return members;
    };

    // The weakest member drags its mirror along even though the mirror ranks high.
    {
        std::vector<Member> members = makeRow(20);
        members[7].strainEnergy = 0.0;
        members[7].mirrorId = 12;
        ScriptedSolver solver;
        solver.setModel(rowModel(members));
        PruneResult pr = pruneWeakest(members, twinTable(members), solver, settings);
        REQUIRE_EQ("selected count", pr.numSelected, 1);
        REQUIRE_EQ("removed count", pr.numRemoved, 2);
        REQUIRE("weakest removed", !members[7].active);
        REQUIRE("mirror removed", !members[12].active);
        REQUIRE_EQ("solver attenuations", int(solver.scaled.size()), 2);
        for (const auto &s : solver.scaled)
            REQUIRE_EQ("soft-kill factor", s.second, 1e-6);
        REQUIRE_EQ("axial stiffness attenuated", solver.model().EA[7], 1e-6);
        REQUIRE_EQ("bending stiffness attenuated", solver.model().EI[12], 1e-6);
        REQUIRE_EQ("survivor stiffness intact", solver.model().EA[0], 1.0);
    }

    // Selecting the right-hand member of a pair also removes its left partner.
    {
        std::vector<Member> members = makeRow(20);
        members[3].mirrorId = 16;
        members[16].strainEnergy = 0.0;
        ScriptedSolver solver;
        solver.setModel(rowModel(members));
        pruneWeakest(members, twinTable(members), solver, settings);
        REQUIRE("right member removed", !members[16].active);
        REQUIRE("left partner removed", !members[3].active);
    }

    // Both members of a tied pair selected: each attenuated exactly once.
    {
        std::vector<Member> members = makeRow(20);
        members[0].mirrorId = 1;
        members[0].strainEnergy = members[1].strainEnergy = 0.5;
        PruneSettings half = settings;
        half.removalRatio = 0.1;
        ScriptedSolver solver;
        solver.setModel(rowModel(members));
        PruneResult pr = pruneWeakest(members, twinTable(members), solver, half);
        REQUIRE_EQ("tied pair selection", pr.numSelected, 2);
        std::set<int> ids(pr.removedIds.begin(), pr.removedIds.end());
        REQUIRE_EQ("no double attenuation", int(ids.size()), int(pr.removedIds.size()));
        REQUIRE_EQ("tied pair attenuations", int(solver.scaled.size()), pr.numRemoved);
    }

    // Safety-floor hold.
    {
        std::vector<Member> members = makeRow(10);
        ScriptedSolver solver;
        solver.setModel(rowModel(members));
        PruneResult pr = pruneWeakest(members, twinTable(members), solver, settings);
        REQUIRE("hold flagged", pr.held);
        REQUIRE_EQ("hold removes nothing", pr.numRemoved, 0);
        REQUIRE("hold leaves solver untouched", solver.scaled.empty());
    }
}

////////////////////////////////////////////////////////////////////////////////
// Optimization loop
////////////////////////////////////////////////////////////////////////////////
void testOptimizationLoop() {
    ScriptedSolver *scripted = nullptr;
    auto factory = [&]() {
        auto s = std::make_unique<ScriptedSolver>();
        scripted = s.get();
        return std::unique_ptr<StructuralSolver>(std::move(s));
    };

    TopologyOptimizer topOpt(factory);
    topOpt.verbose = false;
    REQUIRE("starts uninitialized", topOpt.state() == OptimizerState::Uninitialized);
    REQUIRE_THROWS<std::runtime_error>("step before initialize", [&]() { topOpt.step(); });

    OptimizerParams params = quietParams();
    topOpt.initialize(params);
    REQUIRE("ready after initialize", topOpt.state() == OptimizerState::Ready);
    REQUIRE_EQ("initial active count", topOpt.numActive(), 107);
    REQUIRE_EQ("left support node", topOpt.leftSupportNode, 0);
    REQUIRE_EQ("right support node", topOpt.rightSupportNode, 32);
    REQUIRE_EQ("load node", topOpt.loadNode, 19);
    REQUIRE_EQ("uniform axial stiffness", scripted->model().EA[5], params.youngsModulus * topOpt.section.area);
    REQUIRE_EQ("uniform bending stiffness", scripted->model().EI[5], params.youngsModulus * topOpt.section.inertia);
    REQUIRE_EQ("load magnitude", scripted->model().loads.at(0).force[1], -params.load);
    REQUIRE("pinned-roller supports", scripted->model().supports.at(0).type == Support::Type::Pinned
                                   && scripted->model().supports.at(1).type == Support::Type::Roller);

    IterationReport first = topOpt.step();
    REQUIRE("running after first step", topOpt.state() == OptimizerState::Running);
    REQUIRE_EQ("first iteration index", first.iteration, 1);
    REQUIRE_EQ("report lists every member", int(first.members.size()), 107);
    REQUIRE_EQ("first removal", first.numRemoved, 2);
    REQUIRE_EQ("active count after removal", first.numActive, 105);
    REQUIRE(first.status, first.status == "Iteration: 1 | Active Elements: 105");

    double maxActive = 0;
    for (const auto &m : first.members)
        if (m.active) maxActive = std::max(maxActive, m.force);
    REQUIRE_EQ("report max active force", first.maxActiveForce, maxActive);

    std::vector<IterationReport> history;
    OptimizerState s = topOpt.run([&](const IterationReport &r) { history.push_back(r); return true; });
    REQUIRE("run converges", s == OptimizerState::Converged);
    REQUIRE(topOpt.status(), topOpt.status() == "Optimization Converged.");

    int prevIter = first.iteration, prevActive = first.numActive;
    for (size_t i = 0; i < history.size(); ++i) {
        const auto &r = history[i];
        REQUIRE_EQ("iteration increments by one", r.iteration, prevIter + 1);
        REQUIRE("active count non-increasing", r.numActive <= prevActive);
        if (i + 1 < history.size()) {
            REQUIRE("no early convergence", r.numActive >= params.convergenceFloor);
            REQUIRE("running until converged", r.state == OptimizerState::Running);
        }
        prevIter = r.iteration;
        prevActive = r.numActive;
    }
    REQUIRE("converged below floor", !history.empty() && history.back().numActive < params.convergenceFloor
                                    && history.back().state == OptimizerState::Converged);
    REQUIRE_THROWS<std::runtime_error>("converged is terminal", [&]() { topOpt.step(); });

    // Symmetric final topology.
    const auto &members = topOpt.members();
    const auto &twin = topOpt.twins();
    for (const auto &m : members)
        if (m.active && twin[m.id] >= 0) REQUIRE("mirror of active member active", members[twin[m.id]].active);

    // Every soft-killed member was attenuated exactly once.
    REQUIRE_EQ("attenuations match removals", int(scripted->scaled.size()), 107 - topOpt.numActive());

    // Support selector mapping onto the end supports.
    params.support = SupportCondition::FixedFixed;
    topOpt.initialize(params);
    REQUIRE("fixed-fixed supports", scripted->model().supports.at(0).type == Support::Type::Fixed
                                 && scripted->model().supports.at(1).type == Support::Type::Fixed);
    params.support = SupportCondition::PinnedPinned;
    topOpt.initialize(params);
    REQUIRE("pinned-pinned supports", scripted->model().supports.at(0).type == Support::Type::Pinned
                                   && scripted->model().supports.at(1).type == Support::Type::Pinned);
    REQUIRE_EQ("supports at span ends", scripted->model().supports.at(0).node, 0);
    REQUIRE_EQ("right support at span end", scripted->model().supports.at(1).node, 32);
}

void testSolverFailure() {
    ScriptedSolver *scripted = nullptr;
    TopologyOptimizer topOpt([&]() {
        auto s = std::make_unique<ScriptedSolver>();
        s->failOnSolve = 2;
        scripted = s.get();
        return std::unique_ptr<StructuralSolver>(std::move(s));
    });
    topOpt.verbose = false;
    topOpt.initialize(quietParams());

    std::vector<bool> activeAfterLast;
    REQUIRE_THROWS<SolverInstabilityError>("solver failure surfaces", [&]() {
        topOpt.run([&](const IterationReport &r) {
            activeAfterLast.clear();
            for (const auto &m : r.members) activeAfterLast.push_back(m.active);
            return true;
        });
    });
    REQUIRE("failed state", topOpt.state() == OptimizerState::Failed);
    REQUIRE_EQ("completed iterations before failure", topOpt.iteration(), 2);
    REQUIRE(topOpt.status(), topOpt.status() == "Solver Error: singular stiffness matrix");

    bool unchanged = (activeAfterLast.size() == topOpt.members().size());
    for (size_t i = 0; unchanged && i < activeAfterLast.size(); ++i)
        unchanged = (activeAfterLast[i] == topOpt.members()[i].active);
    REQUIRE("failed iteration leaves members untouched", unchanged);

    REQUIRE_THROWS<std::runtime_error>("failed is terminal", [&]() { topOpt.step(); });
    REQUIRE("run in failed state does nothing", topOpt.run() == OptimizerState::Failed);

    topOpt.initialize(quietParams());
    REQUIRE("re-initialize after failure", topOpt.state() == OptimizerState::Ready && topOpt.iteration() == 0);
    REQUIRE("fresh solver", scripted->numSolves == 0);

    // Results that do not cover every member fail the iteration too.
    topOpt.step();
    scripted->dropLastResult = true;
    REQUIRE_THROWS<std::runtime_error>("mismatched results surface", [&]() { topOpt.step(); });
    REQUIRE("mismatched results fail the run", topOpt.state() == OptimizerState::Failed);
    REQUIRE_EQ("mismatched results not counted", topOpt.iteration(), 1);
    REQUIRE(topOpt.status(), topOpt.status() == "Solver Error: Solver results do not match the member collection");
    REQUIRE_THROWS<std::runtime_error>("failed after mismatch is terminal", [&]() { topOpt.step(); });
}

void testInvalidSection() {
    bool solverCreated = false;
    TopologyOptimizer topOpt([&]() {
        solverCreated = true;
        return std::unique_ptr<StructuralSolver>(new ScriptedSolver());
    });
    topOpt.verbose = false;

    OptimizerParams params = quietParams();
    params.section.tf = 0.5 * params.section.D;
    REQUIRE_THROWS<InvalidGeometryError>("degenerate section", [&]() { topOpt.initialize(params); });
    REQUIRE("uninitialized after invalid section", topOpt.state() == OptimizerState::Uninitialized);
    REQUIRE("no solver built", !solverCreated);
    REQUIRE_THROWS<std::runtime_error>("no mesh built", [&]() { topOpt.members(); });

    // An invalid initialize also discards a previous run.
    topOpt.initialize(quietParams());
    REQUIRE("valid run ready", topOpt.state() == OptimizerState::Ready);
    REQUIRE_THROWS<InvalidGeometryError>("degenerate section replaces run", [&]() { topOpt.initialize(params); });
    REQUIRE("previous run discarded", topOpt.state() == OptimizerState::Uninitialized && topOpt.numActive() == 0);
}

void testCancellation() {
    ScriptedSolver *scripted = nullptr;
    TopologyOptimizer topOpt([&]() {
        auto s = std::make_unique<ScriptedSolver>();
        scripted = s.get();
        return std::unique_ptr<StructuralSolver>(std::move(s));
    });
    topOpt.verbose = false;
    topOpt.initialize(quietParams());

    std::vector<bool> snapshot;
    size_t numScaled = 0;
    OptimizerState s = topOpt.run([&](const IterationReport &r) {
        snapshot.clear();
        for (const auto &m : r.members) snapshot.push_back(m.active);
        numScaled = scripted->scaled.size();
        return r.iteration < 3;
    });

    REQUIRE("cancelled run stopped", s == OptimizerState::Stopped);
    REQUIRE(topOpt.status(), topOpt.status() == "Stopped by User.");
    REQUIRE_EQ("stopped after third iteration", topOpt.iteration(), 3);
    REQUIRE_EQ("no solve after cancel", scripted->numSolves, 3);
    REQUIRE_EQ("no attenuation after cancel", int(scripted->scaled.size()), int(numScaled));

    bool unchanged = (snapshot.size() == topOpt.members().size());
    for (size_t i = 0; unchanged && i < snapshot.size(); ++i)
        unchanged = (snapshot[i] == topOpt.members()[i].active);
    REQUIRE("cancel leaves last completed iteration", unchanged);
    REQUIRE_THROWS<std::runtime_error>("stopped is terminal", [&]() { topOpt.step(); });

    // Stop requested from the yield point itself.
    topOpt.initialize(quietParams());
    topOpt.run([&](const IterationReport &r) {
        if (r.iteration == 2) topOpt.requestStop();
        return true;
    });
    REQUIRE("requestStop honored", topOpt.state() == OptimizerState::Stopped && topOpt.iteration() == 2);

    // Iteration cap.
    OptimizerParams capped = quietParams();
    capped.maxIterations = 5;
    topOpt.initialize(capped);
    REQUIRE("iteration cap stops run", topOpt.run() == OptimizerState::Stopped && topOpt.iteration() == 5);
}

////////////////////////////////////////////////////////////////////////////////
// End-to-end with the frame solver
////////////////////////////////////////////////////////////////////////////////
void testScenario(SupportCondition support) {
    const std::string name = supportConditionName(support);
    OptimizerParams params = quietParams();
    params.support = support;

    TopologyOptimizer topOpt;
    topOpt.verbose = false;
    topOpt.initialize(params);

    int prevActive = topOpt.numActive();
    bool monotone = true;
    OptimizerState s = OptimizerState::Failed;
    try {
        s = topOpt.run([&](const IterationReport &r) {
            monotone = monotone && (r.numActive <= prevActive);
            prevActive = r.numActive;
            return true;
        });
    }
    catch (const std::exception &e) {
        std::cout << name << " scenario solver error: " << e.what() << std::endl;
    }

    REQUIRE(name + " converges", s == OptimizerState::Converged);
    REQUIRE(name + " active count monotone", monotone);
    REQUIRE(name + " reaches target density", topOpt.numActive() <= 25);

    const auto &members = topOpt.members();
    const auto &twin = topOpt.twins();
    for (const auto &m : members) {
        if (twin[m.id] < 0) continue;
        REQUIRE(name + " topology symmetric", m.active == members[twin[m.id]].active);
    }
    // Symmetric in the geometry, not only in the pairing.
    for (const auto &m : members) {
        if (!m.active) continue;
        bool imaged = false;
        for (const auto &o : members)
            imaged = imaged || (o.active && reflects(m, o, params.span));
        REQUIRE(name + " active member has an active mirror image", imaged);
    }
}

////////////////////////////////////////////////////////////////////////////////
// Config files
////////////////////////////////////////////////////////////////////////////////
void testConfig() {
    OptimizerParams p;
    p.span = 12;
    p.height = 4;
    p.load = 250e3;
    p.support = SupportCondition::FixedFixed;
    p.youngsModulus = 210e9;
    p.section.B = 0.2;
    p.prune.removalRatio = 0.05;
    p.prune.safetyFloor = 10;
    p.convergenceFloor = 30;

    const std::string path = "test_config.txt";
    writeConfig(path, p);
    OptimizerParams q = readConfig(path);
    REQUIRE_EQ("config span", q.span, 12.0);
    REQUIRE_EQ("config load", q.load, 250e3);
    REQUIRE("config support", q.support == SupportCondition::FixedFixed);
    REQUIRE_EQ("config modulus", q.youngsModulus, 210e9);
    REQUIRE_EQ("config flange width", q.section.B, 0.2);
    REQUIRE_EQ("config web", q.section.tw, 0.008);
    REQUIRE_EQ("config removal ratio", q.prune.removalRatio, 0.05);
    REQUIRE_EQ("config safety floor", q.prune.safetyFloor, 10);
    REQUIRE_EQ("config convergence floor", q.convergenceFloor, 30);

    {
        std::ofstream out(path);
        out << "16 5 800 Hinged-Roller 200 150 300 8 12 0.02 15 25" << std::endl;
    }
    REQUIRE_THROWS<std::runtime_error>("unknown support", [&]() { readConfig(path); });
    {
        std::ofstream out(path);
        out << "16 5 800" << std::endl;
    }
    REQUIRE_THROWS<std::runtime_error>("truncated config", [&]() { readConfig(path); });
    std::remove(path.c_str());

    REQUIRE_THROWS<std::runtime_error>("missing config", [&]() { readConfig("no/such/config.txt"); });
    REQUIRE("support names", supportConditionFromName("Pinned-Pinned") == SupportCondition::PinnedPinned);
}

int main(int argc, char *argv[]) {
    testGroundStructure();
    testSectionProperties();
    testSymmetryMapper();
    testFrameSolver();
    testEnergyEvaluator();
    testPruner();
    testOptimizationLoop();
    testSolverFailure();
    testInvalidSection();
    testCancellation();
    testScenario(SupportCondition::PinnedRoller);
    testScenario(SupportCondition::FixedFixed);
    testScenario(SupportCondition::PinnedPinned);
    testConfig();

    if (numFailures > 0) {
        std::cout << numFailures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "All tests passed" << std::endl;
    return 0;
}
