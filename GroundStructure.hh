#ifndef GROUNDSTRUCTURE_HH
#define GROUNDSTRUCTURE_HH

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>
#include "StructuralErrors.hh"

// Candidate structural connector between two grid nodes.
// Members are created once by `generateGroundStructure` and never deleted;
// "removal" only clears `active` (and attenuates the solver's stiffness).
struct Member {
    int id;
    int n1, n2;             // endpoint node indices
    Eigen::Vector2d p1, p2; // endpoint coordinates
    Eigen::Vector2d mid;
    double length;

    bool active = true;
    int mirrorId = -1;      // right-side twin of a left-side member (-1 if none)
    double strainEnergy = 0.0;
    double forceVal = 0.0;
};

struct GroundStructureSettings {
    int xDivs = 8;
    int yDivs = 3;
    double connectionFactor = 1.6; // max member length as a multiple of the horizontal spacing
    double eps = 1e-3;             // shortest admissible member length

    double maxConnectionDistance(double span) const { return connectionFactor * span / xDivs; }
};

struct GroundStructure {
    Eigen::MatrixX2d V;          // node positions
    std::vector<Member> members; // member `i` has id `i`

    int numNodes()   const { return V.rows(); }
    int numMembers() const { return members.size(); }

    // Grid node closest to `p`.
    int closestNode(const Eigen::Vector2d &p) const {
        int best = -1;
        double bestDist = std::numeric_limits<double>::max();
        for (int i = 0; i < V.rows(); ++i) {
            double d = (V.row(i).transpose() - p).norm();
            if (d < bestDist) { bestDist = d; best = i; }
        }
        return best;
    }
};

inline double roundCoordinate(double x) { return std::round(x * 1000.0) / 1000.0; }

// Build the node grid (x index outer, y index inner) and connect every
// unordered node pair whose distance lies in (eps, maxConnectionDistance].
inline GroundStructure generateGroundStructure(double span, double height, const GroundStructureSettings &settings = GroundStructureSettings()) {
    if ((span <= 0) || (height <= 0)) throw InvalidGeometryError("Span and height must be positive");
    if ((settings.xDivs < 1) || (settings.yDivs < 1)) throw InvalidGeometryError("There should be at least one division in each direction");
    if (settings.connectionFactor <= 0) throw InvalidGeometryError("Connection factor must be positive");

    const int nx = settings.xDivs + 1,
              ny = settings.yDivs + 1;
    const double dx = span   / settings.xDivs,
                 dy = height / settings.yDivs;

    GroundStructure gs;
    gs.V.resize(nx * ny, 2);
    for (int i = 0; i < nx; ++i) {
        for (int j = 0; j < ny; ++j)
            gs.V.row(i * ny + j) << roundCoordinate(i * dx), roundCoordinate(j * dy);
    }

    const double maxDist = settings.maxConnectionDistance(span);
    for (int a = 0; a < gs.numNodes(); ++a) {
        for (int b = a + 1; b < gs.numNodes(); ++b) {
            Member m;
            m.p1 = gs.V.row(a).transpose();
            m.p2 = gs.V.row(b).transpose();
            m.length = (m.p2 - m.p1).norm();
            if ((m.length <= settings.eps) || (m.length > maxDist)) continue;
            m.id  = gs.members.size();
            m.n1  = a;
            m.n2  = b;
            m.mid = 0.5 * (m.p1 + m.p2);
            gs.members.push_back(m);
        }
    }

    return gs;
}

#endif /* end of include guard: GROUNDSTRUCTURE_HH */
