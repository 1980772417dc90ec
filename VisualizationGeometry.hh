////////////////////////////////////////////////////////////////////////////////
// VisualizationGeometry.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Line geometry for drawing the ground structure: active members colored by
//  their force relative to the largest active force, removed ("ghost")
//  members in faint grey.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef VISUALIZATION_HH
#define VISUALIZATION_HH

#include <Eigen/Dense>
#include <algorithm>
#include <igl/jet.h>
#include "TopologyOptimizer.hh"

inline void memberVisualizationGeometry(const IterationReport &report, bool showGhosts,
                                        Eigen::MatrixXd &P, Eigen::MatrixXi &E, Eigen::MatrixXd &C) {
    const int nm = report.members.size();
    P.resize(2 * nm, 3);
    E.resize(nm, 2);
    C.resize(nm, 3);

    const double maxForce = (report.maxActiveForce > 0) ? report.maxActiveForce : 1.0;
    const Eigen::RowVector3d ghostColor(0.88, 0.88, 0.88);

    int back = 0;
    for (const auto &m : report.members) {
        if (!m.active && !showGhosts) continue;
        P.row(2 * back    ) << m.p1[0], m.p1[1], 0.0;
        P.row(2 * back + 1) << m.p2[0], m.p2[1], 0.0;
        E.row(back) << 2 * back, 2 * back + 1;
        if (m.active) {
            // Keep the low end of the colormap away from the ghost members' grey.
            double rgb[3];
            igl::jet(0.25 + 0.75 * std::min(m.force / maxForce, 1.0), rgb);
            C.row(back) << rgb[0], rgb[1], rgb[2];
        }
        else {
            C.row(back) = ghostColor;
        }
        ++back;
    }

    P.conservativeResize(2 * back, 3);
    E.conservativeResize(back, 2);
    C.conservativeResize(back, 3);
}

#endif /* end of include guard: VISUALIZATION_HH */
