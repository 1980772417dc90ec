////////////////////////////////////////////////////////////////////////////////
// OptimizerParams.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Run parameters of the ground structure optimizer and their plain-text
//  config file representation.
//
//  The core works in SI units (m, N, Pa). Config files hold the values the
//  way the input form collects them:
//      span[m] height[m] load[kN] support E[GPa] B[mm] D[mm] tw[mm] tf[mm]
//      removalRatio safetyFloor convergenceFloor
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef OPTIMIZERPARAMS_HH
#define OPTIMIZERPARAMS_HH

#include <iostream>
#include <string>
#include "BoundaryConditions.hh"
#include "EvolutionaryPruner.hh"
#include "GroundStructure.hh"
#include "SectionProperties.hh"

struct OptimizerParams {
    double span   = 16.0;
    double height = 5.0;
    double load   = 800e3;  // magnitude of the downward point load at mid-span, top chord
    SupportCondition support = SupportCondition::PinnedRoller;

    double youngsModulus = 200e9;
    ISection section;

    PruneSettings prune;
    int convergenceFloor = 25; // converged once fewer members remain active

    GroundStructureSettings grid;
    double symmetryTolerance = 0.1;
    int maxIterations = 1000;

    // Throws InvalidGeometryError/std::runtime_error for out-of-range values.
    void validate() const;

    friend std::ostream &operator<<(std::ostream &os, const OptimizerParams &p);
    friend std::istream &operator>>(std::istream &is, OptimizerParams &p);
};

OptimizerParams readConfig(const std::string &path);
void writeConfig(const std::string &path, const OptimizerParams &p);

#endif /* end of include guard: OPTIMIZERPARAMS_HH */
