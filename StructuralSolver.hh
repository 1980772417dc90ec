////////////////////////////////////////////////////////////////////////////////
// StructuralSolver.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Narrow interface to a linear-elastic static analysis engine: submit a
//  topology with boundary conditions and loads, get per-member internal
//  forces back. The optimizer only talks to the solver through this
//  interface.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef STRUCTURALSOLVER_HH
#define STRUCTURALSOLVER_HH

#include <Eigen/Dense>
#include <vector>
#include "BoundaryConditions.hh"

struct StructuralModel {
    Eigen::MatrixX2d V; // node positions
    Eigen::MatrixX2i E; // member endpoints (node indices)
    Eigen::VectorXd EA; // per-member axial stiffness
    Eigen::VectorXd EI; // per-member bending stiffness

    std::vector<Support> supports;
    std::vector<PointLoad> loads;

    int numNodes()   const { return V.rows(); }
    int numMembers() const { return E.rows(); }
};

// Internal force diagrams of one member, sampled along its length.
// A single sample is a constant value; an empty vector means the solver
// has no value for that quantity.
struct MemberForces {
    Eigen::VectorXd axial;
    Eigen::VectorXd shear;
    Eigen::VectorXd moment;
};

struct StructuralResults {
    Eigen::MatrixX3d U;         // nodal (u, v, theta)
    Eigen::MatrixX3d reactions; // (Fx, Fy, Mz) at supported nodes, zero elsewhere
    std::vector<MemberForces> memberForces;
};

struct StructuralSolver {
    // Replace the analyzed topology (including boundary conditions and loads).
    virtual void setModel(const StructuralModel &model) = 0;

    // Multiply both the axial and the bending stiffness of member `m` by `factor`.
    // The member stays part of the topology.
    virtual void scaleMemberStiffness(int m, double factor) = 0;

    // Throws SolverInstabilityError if no valid equilibrium exists.
    virtual StructuralResults solve() = 0;

    virtual ~StructuralSolver() { }
};

#endif /* end of include guard: STRUCTURALSOLVER_HH */
