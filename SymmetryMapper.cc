#include "SymmetryMapper.hh"

static Eigen::Vector2d reflect(const Eigen::Vector2d &p, double span) { return Eigen::Vector2d(span - p[0], p[1]); }

// Whether `b` is the mirror image of `a` (endpoints in either order).
static bool isReflection(const Member &a, const Member &b, double span, double tol) {
    const Eigen::Vector2d r1 = reflect(a.p1, span), r2 = reflect(a.p2, span);
    return (((b.p1 - r1).norm() < tol) && ((b.p2 - r2).norm() < tol))
        || (((b.p1 - r2).norm() < tol) && ((b.p2 - r1).norm() < tol));
}

int assignMirrors(std::vector<Member> &members, double span, double tol) {
    const double centerLine = 0.5 * span;
    std::vector<bool> claimed(members.size(), false);
    int numPairs = 0;
    for (auto &m : members) m.mirrorId = -1;

    for (auto &m : members) {
        if (m.mid[0] >= centerLine) continue;

        const Eigen::Vector2d target = reflect(m.mid, span);
        int firstMatch = -1, reflection = -1;
        for (const auto &candidate : members) {
            if ((candidate.id == m.id) || claimed[candidate.id]) continue;
            if ((candidate.mid - target).norm() >= tol) continue;
            // Crossing diagonals share a midpoint; only one of them is the image.
            if (isReflection(m, candidate, span, tol)) { reflection = candidate.id; break; }
            if (firstMatch < 0) firstMatch = candidate.id;
        }

        const int twin = (reflection >= 0) ? reflection : firstMatch;
        if (twin < 0) continue;
        m.mirrorId = twin;
        claimed[twin] = true;
        claimed[m.id] = true;
        ++numPairs;
    }
    return numPairs;
}

std::vector<int> twinTable(const std::vector<Member> &members) {
    std::vector<int> twin(members.size(), -1);
    for (const auto &m : members) {
        if (m.mirrorId < 0) continue;
        twin[m.id] = m.mirrorId;
        twin[m.mirrorId] = m.id;
    }
    return twin;
}
