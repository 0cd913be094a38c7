#pragma once

#include <string>

#include <imgui.h>
#include <floatwm/floatwm.hpp>

namespace floatwm::gui {

    // Parses "#rgb", "#rrggbb", "#rrggbbaa", "rgb(r, g, b)", "rgba(r, g, b, a)" and a few
    // named colors. Returns `fallback` for anything else.
    ImU32 parseColor(const std::string& color, ImU32 fallback);

    // Draws the windows of a Surface onto an ImGui draw list, bottom to top by
    // stacking order. Surface coordinates are offset by `origin`.
    class SurfaceRenderer {
        const WindowManagerConfiguration& config_;

        void renderWindow(Surface& surface, Element& window, ImDrawList* drawList, ImVec2 origin);

    public:
        explicit SurfaceRenderer(const WindowManagerConfiguration& config) : config_(config) {}

        // Makes the surface measure content with the current ImGui font. Needs a live ImGui context.
        static void installTextMeasurer(Surface& surface);

        void render(Surface& surface, ImDrawList* drawList, ImVec2 origin);
    };

    // Feeds ImGui mouse state into the surface pointer stream once per frame,
    // and shows the cursor the surface asks for.
    class SurfaceInputBridge {
        bool pressed_{false};
        ImVec2 last_position_{-1, -1};

    public:
        void update(Surface& surface, ImVec2 origin);
        bool pressed() const { return pressed_; }
    };

}
