////////////////////////////////////////////////////////////////////////////////
// EvolutionaryPruner.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Removal step of the evolutionary optimization: rank the active members by
//  their (symmetrized) strain energy and soft-kill the weakest ones together
//  with their mirror twins.
//
//  Soft-killed members are never taken out of the solver's topology; their
//  axial and bending stiffness are multiplied by `softKillFactor` instead,
//  so the stiffness matrix keeps its structure and stays nonsingular.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef EVOLUTIONARYPRUNER_HH
#define EVOLUTIONARYPRUNER_HH

#include <vector>
#include "GroundStructure.hh"
#include "StructuralSolver.hh"

struct PruneSettings {
    double removalRatio   = 0.02; // fraction of the active members removed per iteration
    int    safetyFloor    = 15;   // no removal while fewer members are active
    double softKillFactor = 1e-6;
};

struct PruneResult {
    int  numSelected = 0;    // removal count chosen from the ranking
    int  numRemoved  = 0;    // members actually deactivated (including twins)
    bool held        = false;
    std::vector<int> removedIds;
};

// Number of members to remove from `numActive` active members.
int removalCount(int numActive, const PruneSettings &settings);

// `twin` is the bidirectional pairing from `twinTable`.
PruneResult pruneWeakest(std::vector<Member> &members, const std::vector<int> &twin,
                         StructuralSolver &solver, const PruneSettings &settings);

#endif /* end of include guard: EVOLUTIONARYPRUNER_HH */
