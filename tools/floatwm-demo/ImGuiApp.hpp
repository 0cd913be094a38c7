#pragma once

#include "PlatformBackend.hpp"
#include <cstdlib>
#include <functional>

namespace floatwm::demo {

struct ImGuiAppConfig {
    const char* windowTitle = "floatwm";
    int windowWidth = 1100;
    int windowHeight = 700;
    ImVec4 clearColor = ImVec4(0.82f, 0.84f, 0.86f, 1.00f);
    bool enableKeyboard = true;
};

class ImGuiApp {
public:
    /**
     * Runs the frame loop until the window is closed or onFrame returns false.
     * @param onInit Called once ImGui is ready. Return false to abort.
     * @param onFrame Called each frame with the window size in logical units.
     * @param onShutdown Called after the last frame, before ImGui goes away.
     */
    static int run(
        const ImGuiAppConfig& config,
        std::function<bool()> onInit,
        std::function<bool(int width, int height)> onFrame,
        std::function<void()> onShutdown = nullptr
    ) {
        PlatformWindow window;
        if (!window.open(config.windowTitle, config.windowWidth, config.windowHeight))
            return EXIT_FAILURE;
        if (config.enableKeyboard)
            ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
        if (!onInit())
            return EXIT_FAILURE;

        while (window.processEvents()) {
            window.newFrame();
            auto size = window.logicalSize();
            bool keepRunning = onFrame(static_cast<int>(size.x), static_cast<int>(size.y));
            window.present(config.clearColor);
            if (!keepRunning)
                break;
        }

        if (onShutdown)
            onShutdown();
        return EXIT_SUCCESS;
    }
};

}
