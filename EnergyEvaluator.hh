////////////////////////////////////////////////////////////////////////////////
// EnergyEvaluator.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Per-member strain-energy proxy (force^2 * length) evaluated from the
//  solver's internal forces and symmetrized across mirror pairs.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef ENERGYEVALUATOR_HH
#define ENERGYEVALUATOR_HH

#include <vector>
#include "GroundStructure.hh"
#include "StructuralSolver.hh"

struct EnergyStats {
    double totalEnergy = 0.0; // summed over active members
    double maxForce    = 0.0; // largest active member force this iteration
};

// Force magnitude represented by a sampled axial force diagram: the largest
// finite |sample|, or zero when the solver reports nothing.
double forceMagnitude(const Eigen::VectorXd &axialSamples);

// Update `forceVal` and `strainEnergy` of every active member from `results`,
// then average the energies of active mirror pairs.
EnergyStats evaluateStrainEnergy(std::vector<Member> &members, const StructuralResults &results);

// Assign the mean energy to both members of every pair whose members are both active.
void symmetrizeEnergies(std::vector<Member> &members);

#endif /* end of include guard: ENERGYEVALUATOR_HH */
