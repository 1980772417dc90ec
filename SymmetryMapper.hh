////////////////////////////////////////////////////////////////////////////////
// SymmetryMapper.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Left/right mirror pairing of ground structure members about the
//  vertical centerline of the design domain.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef SYMMETRYMAPPER_HH
#define SYMMETRYMAPPER_HH

#include <vector>
#include "GroundStructure.hh"

// Assign `mirrorId` for every member whose midpoint lies strictly left of
// `span / 2`. Candidates are members not yet part of another pair whose
// midpoint is within `tol` of the reflected midpoint (span - mid_x, mid_y).
// A candidate whose endpoints are the reflected endpoints wins; otherwise the
// first candidate in id order is taken. Members at or right of the
// centerline, and unmatched members, get `mirrorId = -1`.
// Returns the number of pairs found.
int assignMirrors(std::vector<Member> &members, double span, double tol = 0.1);

// Bidirectional lookup derived from `mirrorId`: twin[i] is the mirror of a
// left member or the left partner of a right member (-1 if unpaired).
std::vector<int> twinTable(const std::vector<Member> &members);

#endif /* end of include guard: SYMMETRYMAPPER_HH */
