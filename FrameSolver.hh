////////////////////////////////////////////////////////////////////////////////
// FrameSolver.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Linear-elastic static analysis of 2D frames built from Euler-Bernoulli
//  beam elements (three degrees of freedom per node: u, v, theta).
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef FRAMESOLVER_HH
#define FRAMESOLVER_HH

#include <Eigen/Sparse>
#include <memory>
#include "StructuralSolver.hh"

struct FrameSolver : public StructuralSolver {
    using SpMat   = Eigen::SparseMatrix<double>;
    using Triplet = Eigen::Triplet<double>;
    using VXd  = Eigen::VectorXd;
    using MX3d = Eigen::MatrixX3d;
    using AXb  = Eigen::Array<bool, Eigen::Dynamic, 1>;

    using PerElementStiffnessMatrix = Eigen::Matrix<double, 6, 6>;

    FrameSolver() { }
    FrameSolver(const StructuralModel &model) { setModel(model); }

    virtual void setModel(const StructuralModel &model) override;
    virtual void scaleMemberStiffness(int m, double factor) override;
    virtual StructuralResults solve() override;

    const StructuralModel &model() const { return m_model; }
    int numVars() const { return 3 * m_model.numNodes(); }

    double memberLength(int m) const;

    // Maps the member's global end displacements to its local (axial,
    // transverse, rotation) frame.
    PerElementStiffnessMatrix rotation(int m) const;

    // Element stiffness in the member's local frame.
    PerElementStiffnessMatrix localStiffnessMatrix(int m) const;

    PerElementStiffnessMatrix perElementStiffnessMatrix(int m) const {
        PerElementStiffnessMatrix T = rotation(m);
        return T.transpose() * localStiffnessMatrix(m) * T;
    }

    // Unconstrained global stiffness matrix (every diagonal entry is
    // present in the sparsity pattern, even for unconnected nodes).
    SpMat buildStiffnessMatrix() const;

    static VXd flatten(Eigen::Ref<const Eigen::MatrixXd> F) {
        Eigen::VectorXd f(F.cols() * F.rows());
        Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(f.data(), F.rows(), F.cols()) = F;
        return f;
    }

    static void unflatten(Eigen::Ref<const VXd> f, int d, MX3d &result) {
        const int rows = f.size() / d;
        if (f.size() % d != 0) throw std::runtime_error("Flattened vector length must be divisible by d");
        if ((result.rows() != rows) || (result.cols() != d))
            result.resize(rows, d);
        result = Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(f.data(), rows, d);
    }

    // Number of stations at which the bending moment is sampled.
    int numMomentSamples = 11;

    // Pivots of the LDL^T factorization must exceed this fraction of the
    // largest pivot; smaller (or negative) pivots indicate a mechanism.
    double pivotTolerance = 1e-13;

    using Solver = Eigen::SimplicialLDLT<SpMat>;

private:
    StructuralModel m_model;
    AXb m_isSupportVar;
    VXd m_f; // external load vector, u0, v0, theta0, u1, ... ordering

    mutable bool m_KFactorizationCache = false;
    mutable std::unique_ptr<Solver> m_solver;
    mutable SpMat m_K; // unconstrained stiffness, kept for reaction recovery
};

#endif /* end of include guard: FRAMESOLVER_HH */
