#include "EnergyEvaluator.hh"
#include <algorithm>
#include <cmath>
#include <stdexcept>

double forceMagnitude(const Eigen::VectorXd &axialSamples) {
    double force = 0.0;
    for (int i = 0; i < axialSamples.size(); ++i) {
        if (!std::isfinite(axialSamples[i])) continue;
        force = std::max(force, std::abs(axialSamples[i]));
    }
    return force;
}

EnergyStats evaluateStrainEnergy(std::vector<Member> &members, const StructuralResults &results) {
    if (results.memberForces.size() != members.size())
        throw std::runtime_error("Solver results do not match the member collection");

    EnergyStats stats;
    for (auto &m : members) {
        if (!m.active) continue;
        const double force = forceMagnitude(results.memberForces[m.id].axial);
        m.forceVal = force;
        // Proportional to the true strain energy F^2 L / (2 E A) since all
        // active members share the same E A.
        m.strainEnergy = force * force * m.length;

        stats.totalEnergy += m.strainEnergy;
        stats.maxForce = std::max(stats.maxForce, force);
    }

    symmetrizeEnergies(members);
    return stats;
}

void symmetrizeEnergies(std::vector<Member> &members) {
    for (auto &m : members) {
        if (!m.active || (m.mirrorId < 0)) continue;
        Member &twin = members.at(m.mirrorId);
        if (!twin.active) continue;
        const double avg = 0.5 * (m.strainEnergy + twin.strainEnergy);
        m.strainEnergy    = avg;
        twin.strainEnergy = avg;
    }
}
