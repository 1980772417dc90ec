////////////////////////////////////////////////////////////////////////////////
// Interactive ground structure optimizer: design parameter form, Run/Stop
// controls and a live view of the evolving topology.
////////////////////////////////////////////////////////////////////////////////
#include "Viewer.hh"
#include <memory>

#include <igl/file_dialog_save.h>
#include "OptimizerParams.hh"
#include "StructuralErrors.hh"
#include "TopologyOptimizer.hh"
#include "VisualizationGeometry.hh"

int main(int argc, const char *argv[]) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.txt]" << std::endl;
        return -1;
    }

    OptimizerParams params;
    if (argc == 2) {
        try {
            params = readConfig(argv[1]);
        }
        catch (const std::exception &e) {
            std::cerr << e.what() << std::endl;
            return -1;
        }
    }

    // Form values in the units the form displays (m, kN, GPa, mm).
    double span = params.span, height = params.height;
    double loadKN = params.load / 1e3, EGPa = params.youngsModulus / 1e9;
    double B_mm  = 1e3 * params.section.B,  D_mm  = 1e3 * params.section.D,
           tw_mm = 1e3 * params.section.tw, tf_mm = 1e3 * params.section.tf;
    int support = int(params.support);
    float removalRatio = params.prune.removalRatio;

    auto paramsFromForm = [&]() {
        OptimizerParams p = params;
        p.span   = span;
        p.height = height;
        p.load   = 1e3 * loadKN;
        p.youngsModulus = 1e9 * EGPa;
        p.section.B  = B_mm  / 1e3;
        p.section.D  = D_mm  / 1e3;
        p.section.tw = tw_mm / 1e3;
        p.section.tf = tf_mm / 1e3;
        p.support = SupportCondition(support);
        p.prune.removalRatio = removalRatio;
        return p;
    };

    TopologyOptimizer topOpt;
    std::string statusText = topOpt.status();
    bool showGhosts = true;

    Viewer viewer("Ground Structure Optimizer (Iterative BESO)");

    auto updateView = [&](const IterationReport &r, bool recenter) {
        Eigen::MatrixXd P, C;
        Eigen::MatrixXi E;
        memberVisualizationGeometry(r, showGhosts, P, E, C);
        viewer.set_members(P, E, C, recenter);
        statusText = r.status;

        if (topOpt.loadNode < 0) return;
        const auto &V = topOpt.groundStructure().V;

        // Supports (black) and the loaded node (red), plus the load arrow.
        Eigen::MatrixXd pts(3, 3), ptColors(3, 3);
        pts << V(topOpt.leftSupportNode, 0),  V(topOpt.leftSupportNode, 1),  0,
               V(topOpt.rightSupportNode, 0), V(topOpt.rightSupportNode, 1), 0,
               V(topOpt.loadNode, 0),         V(topOpt.loadNode, 1),         0;
        ptColors << 0, 0, 0,
                    0, 0, 0,
                    1, 0, 0;
        viewer.data().point_size = 10;
        viewer.data().set_points(pts, ptColors);

        Eigen::RowVector3d tip = pts.row(2) + Eigen::RowVector3d(0, 0.2, 0),
                           tail = pts.row(2) + Eigen::RowVector3d(0, 1.0, 0);
        viewer.data().add_edges(tail, tip, Eigen::RowVector3d(1, 0, 0));
    };

    auto startOptimization = [&]() {
        try {
            topOpt.initialize(paramsFromForm());
            updateView(topOpt.report(), /* recenter = */ true);
        }
        catch (const std::exception &e) {
            statusText = std::string("Input Error: ") + e.what();
            std::cerr << statusText << std::endl;
        }
    };

    // One optimization step per rendered frame; the frame boundary is where
    // Stop requests are honored.
    viewer.callback_pre_draw = [&](IGLViewer &) {
        if ((topOpt.state() != OptimizerState::Ready) && (topOpt.state() != OptimizerState::Running))
            return false;
        try {
            updateView(topOpt.step(), /* recenter = */ false);
        }
        catch (const std::exception &) {
            // Already logged; the Failed state's status carries the message.
            statusText = topOpt.status();
        }
        return false;
    };

    viewer.menu.callback_draw_viewer_menu = [&]() {
        ImGui::Text("Geometry");
        ImGui::InputDouble("Span (m)",   &span);
        ImGui::InputDouble("Height (m)", &height);
        ImGui::InputDouble("Load (kN)",  &loadKN);

        ImGui::Separator();
        ImGui::Text("Material (Steel)");
        ImGui::InputDouble("E (GPa)", &EGPa);

        ImGui::Separator();
        ImGui::Text("I-Section Properties");
        ImGui::InputDouble("Flange Width (mm)", &B_mm);
        ImGui::InputDouble("Total Depth (mm)",  &D_mm);
        ImGui::InputDouble("Web Thick (mm)",    &tw_mm);
        ImGui::InputDouble("Flange Thick (mm)", &tf_mm);

        ImGui::Separator();
        ImGui::Combo("Supports", &support, "Pinned-Roller\0Fixed-Fixed\0Pinned-Pinned\0\0");
        ImGui::SliderFloat("Removal Ratio", &removalRatio, /* vmin */ 0.005f, /* vmax */ 0.2f, /* format */ "%0.3f");

        if (ImGui::Checkbox("Show Removed Members", &showGhosts) && topOpt.state() != OptimizerState::Uninitialized)
            updateView(topOpt.report(), false);

        ImGui::Separator();
        if (ImGui::Button("RUN OPTIMIZATION")) startOptimization();
        ImGui::SameLine();
        if (ImGui::Button("STOP")) {
            topOpt.requestStop();
            statusText = topOpt.status();
        }

        if (ImGui::Button("Save Config")) {
            try {
                writeConfig(igl::file_dialog_save(), paramsFromForm());
            }
            catch (const std::exception &e) {
                std::cerr << "Couldn't save config: " << e.what() << std::endl;
            }
        }

        ImGui::Separator();
        ImGui::TextWrapped("%s", statusText.c_str());
        return false;
    };

    viewer.run();

    return 0;
}
