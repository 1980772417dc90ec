////////////////////////////////////////////////////////////////////////////////
// Viewer.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Wrapper around libigl's viewer configured for viewing planar frames:
//  orthographic camera, no rotation, ImGui settings panel.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef VIEWER_HH
#define VIEWER_HH

#include <igl/opengl/glfw/Viewer.h>
#include <GLFW/glfw3.h>
#include <igl/opengl/glfw/imgui/ImGuiPlugin.h>
#include <igl/opengl/glfw/imgui/ImGuiMenu.h>
#include <igl/opengl/glfw/imgui/ImGuiHelpers.h>

using IGLViewer = igl::opengl::glfw::Viewer;

struct Viewer : public IGLViewer {
    Viewer(const std::string &title = "Ground Structure Optimizer")
        : windowTitle(title)
    {
        core().orthographic = true;
        core().set_rotation_type(igl::opengl::ViewerCore::ROTATION_TYPE_NO_ROTATION);
        core().background_color << 1.0f, 1.0f, 1.0f, 1.0f;
        core().is_animating = true;
        data().line_width = 2.0f;

        plugins.push_back(&plugin);
        plugin.widgets.push_back(&menu);

        launch_init(/* resizeable = */ true,
                    /* fullscreen = */ false,
                    /*       name = */ windowTitle);

        // Redraw while resizing; this must be installed after `launch_init`
        // or we'd redraw before the menu plugin is initialized.
        bool reentered_from_draw = false;
        IGLViewer::callback_post_resize = [this, reentered_from_draw](IGLViewer &v, int w, int h) mutable {
            if (Viewer::callback_post_resize)
                return Viewer::callback_post_resize(v, w, h);
            if (!reentered_from_draw) {
                reentered_from_draw = true;
                v.draw();
                glfwSwapBuffers(v.window);
                reentered_from_draw = false;
            }
            return true;
        };

        menu.callback_draw_viewer_window = [&]() {
          float menu_width = 240.f * menu.menu_scaling();
          ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f), ImGuiCond_FirstUseEver);
          ImGui::SetNextWindowSize(ImVec2(0.0f, 0.0f), ImGuiCond_FirstUseEver);
          ImGui::SetNextWindowSizeConstraints(ImVec2(menu_width, -1.0f), ImVec2(menu_width, -1.0f));
          bool _viewer_menu_visible = true;
          ImGui::Begin(
              "Design Parameters", &_viewer_menu_visible,
              ImGuiWindowFlags_NoSavedSettings
              | ImGuiWindowFlags_AlwaysAutoResize
          );
          ImGui::PushItemWidth(ImGui::GetWindowWidth() * 0.45f);
          if (menu.callback_draw_viewer_menu) { menu.callback_draw_viewer_menu(); }
          else { menu.draw_viewer_menu(); }
          ImGui::PopItemWidth();
          ImGui::End();
        };
    }

    // Replace the drawn members (and optionally refit the camera to them).
    void set_members(const Eigen::MatrixXd &P, const Eigen::MatrixXi &E, const Eigen::MatrixXd &C, bool update_base_camera = false) {
        data().set_edges(P, E, C);
        if (update_base_camera && P.rows() > 0) core().align_camera_center(P);
    }

    bool run() { return launch_rendering(/* loop = */ true); }

    std::function<bool(IGLViewer &viewer, int w, int h)> callback_post_resize;

    std::string windowTitle;

    igl::opengl::glfw::imgui::ImGuiPlugin plugin;
    igl::opengl::glfw::imgui::ImGuiMenu menu;

    ~Viewer() {
        launch_shut();
    }
};

#endif /* end of include guard: VIEWER_HH */
