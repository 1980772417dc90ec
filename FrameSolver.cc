#include "FrameSolver.hh"
#include "StructuralErrors.hh"
#include <algorithm>
#include <sstream>

void FrameSolver::setModel(const StructuralModel &model) {
    const int nn = model.numNodes(), nm = model.numMembers();
    if ((model.EA.size() != nm) || (model.EI.size() != nm)) throw std::runtime_error("Stiffness size mismatch");
    for (int m = 0; m < nm; ++m) {
        for (int k = 0; k < 2; ++k)
            if ((model.E(m, k) < 0) || (model.E(m, k) >= nn)) throw std::runtime_error("Member endpoint out of range");
        if ((model.V.row(model.E(m, 1)) - model.V.row(model.E(m, 0))).norm() <= 0) throw std::runtime_error("Zero-length member");
    }

    m_model = model;

    m_isSupportVar.setZero(3 * nn);
    for (const auto &s : m_model.supports) {
        if ((s.node < 0) || (s.node >= nn)) throw std::runtime_error("Support node out of range");
        for (int d = 0; d < 3; ++d)
            m_isSupportVar[3 * s.node + d] = m_isSupportVar[3 * s.node + d] || s.constrains(d);
    }

    Eigen::MatrixX3d F;
    F.setZero(nn, 3);
    for (const auto &l : m_model.loads) {
        if ((l.node < 0) || (l.node >= nn)) throw std::runtime_error("Load node out of range");
        F(l.node, 0) += l.force[0];
        F(l.node, 1) += l.force[1];
    }
    m_f = flatten(F);

    // The sparsity pattern depends on the connectivity.
    m_solver.reset();
    m_KFactorizationCache = false;
}

void FrameSolver::scaleMemberStiffness(int m, double factor) {
    if ((m < 0) || (m >= m_model.numMembers())) throw std::runtime_error("Member index out of range");
    m_model.EA[m] *= factor;
    m_model.EI[m] *= factor;
    m_KFactorizationCache = false;
}

double FrameSolver::memberLength(int m) const {
    return (m_model.V.row(m_model.E(m, 1)) - m_model.V.row(m_model.E(m, 0))).norm();
}

FrameSolver::PerElementStiffnessMatrix FrameSolver::rotation(int m) const {
    Eigen::RowVector2d t = (m_model.V.row(m_model.E(m, 1)) - m_model.V.row(m_model.E(m, 0))) / memberLength(m);
    const double c = t[0], s = t[1];
    PerElementStiffnessMatrix T;
    T.setZero();
    for (int n = 0; n < 2; ++n) {
        T.block<3, 3>(3 * n, 3 * n) <<  c, s, 0,
                                       -s, c, 0,
                                        0, 0, 1;
    }
    return T;
}

FrameSolver::PerElementStiffnessMatrix FrameSolver::localStiffnessMatrix(int m) const {
    const double L  = memberLength(m);
    const double a  = m_model.EA[m] / L,
                 b  = 12 * m_model.EI[m] / (L * L * L),
                 c  =  6 * m_model.EI[m] / (L * L),
                 d  =  4 * m_model.EI[m] / L,
                 e  =  2 * m_model.EI[m] / L;
    PerElementStiffnessMatrix Ke;
    Ke <<  a,  0,  0, -a,  0,  0,
           0,  b,  c,  0, -b,  c,
           0,  c,  d,  0, -c,  e,
          -a,  0,  0,  a,  0,  0,
           0, -b, -c,  0,  b, -c,
           0,  c,  e,  0, -c,  d;
    return Ke;
}

FrameSolver::SpMat FrameSolver::buildStiffnessMatrix() const {
    SpMat K(numVars(), numVars());
    std::vector<Triplet> triplets;
    triplets.reserve(36 * m_model.numMembers() + numVars());

    // Explicit zero diagonal so that every variable appears in the pattern.
    for (int i = 0; i < numVars(); ++i)
        triplets.emplace_back(i, i, 0.0);

    for (int m = 0; m < m_model.numMembers(); ++m) {
        PerElementStiffnessMatrix Ke = perElementStiffnessMatrix(m);
        for (int i = 0; i < 6; ++i) {
            for (int j = 0; j < 6; ++j) {
                int rowIndex = 3 * m_model.E(m, i / 3) + i % 3;
                int colIndex = 3 * m_model.E(m, j / 3) + j % 3;
                triplets.emplace_back(rowIndex, colIndex, Ke(i, j));
            }
        }
    }
    K.setFromTriplets(triplets.begin(), triplets.end());
    return K;
}

StructuralResults FrameSolver::solve() {
    VXd f = m_f;
    for (int i = 0; i < f.size(); ++i)
        if (m_isSupportVar[i]) f[i] = 0.0;

    if (!m_KFactorizationCache) {
        m_K = buildStiffnessMatrix();
        SpMat K = m_K;

        // Replace the rows and columns of supported variables with the identity.
        for (int i = 0; i < K.outerSize(); ++i) {
            for (SpMat::InnerIterator it(K, i); it; ++it) {
                if (m_isSupportVar[it.col()] || m_isSupportVar[it.row()])
                    it.valueRef() = (it.col() == it.row()) ? 1.0 : 0.0;
            }
        }

        if (!m_solver) { m_solver = std::make_unique<Solver>(); m_solver->analyzePattern(K); }
        m_solver->factorize(K);
        if (m_solver->info() != Eigen::Success)
            throw SolverInstabilityError("Stiffness matrix factorization failed (singular system)");

        const VXd &D = m_solver->vectorD();
        const double maxPivot = D.cwiseAbs().maxCoeff();
        if (D.minCoeff() <= pivotTolerance * maxPivot) {
            std::stringstream ss;
            ss << "Structure is unstable: smallest stiffness pivot " << D.minCoeff() << " vs largest " << maxPivot;
            throw SolverInstabilityError(ss.str());
        }
        m_KFactorizationCache = true;
    }

    VXd u = m_solver->solve(f);
    if (m_solver->info() != Eigen::Success || !u.allFinite())
        throw SolverInstabilityError("Equilibrium solve produced non-finite displacements");

    StructuralResults result;
    unflatten(u, 3, result.U);

    VXd r = m_K * u - m_f;
    for (int i = 0; i < r.size(); ++i)
        if (!m_isSupportVar[i]) r[i] = 0.0;
    unflatten(r, 3, result.reactions);

    const int ns = std::max(numMomentSamples, 2);
    result.memberForces.resize(m_model.numMembers());
    for (int m = 0; m < m_model.numMembers(); ++m) {
        Eigen::Matrix<double, 6, 1> ue;
        ue << result.U.row(m_model.E(m, 0)).transpose(),
              result.U.row(m_model.E(m, 1)).transpose();
        // End forces in the local frame: (N1, V1, M1, N2, V2, M2).
        Eigen::Matrix<double, 6, 1> fl = localStiffnessMatrix(m) * (rotation(m) * ue);

        auto &mf = result.memberForces[m];
        mf.axial.setConstant(1, fl[3]); // tension positive
        mf.shear.setConstant(1, fl[1]);
        mf.moment.resize(ns);
        const double L = memberLength(m);
        for (int k = 0; k < ns; ++k)
            mf.moment[k] = -fl[2] + fl[1] * (L * k) / (ns - 1);
    }

    return result;
}
