#pragma once

#include <imgui.h>

namespace floatwm::demo {

    // The demo's main window: a native window with a current OpenGL 3.2 context and an
    // ImGui context bound to it. SDL3 or GLFW is picked at build time.
    class PlatformWindow {
    public:
        struct Native;

        PlatformWindow() = default;
        ~PlatformWindow();

        PlatformWindow(const PlatformWindow&) = delete;
        PlatformWindow& operator=(const PlatformWindow&) = delete;

        // Failures are logged; a failed open leaves nothing to close.
        bool open(const char* title, int width, int height);
        void close();

        // Pumps native events into ImGui. Returns false once the user asked to quit.
        bool processEvents();
        void newFrame();
        // Logical units, the space ImGui mouse positions live in.
        ImVec2 logicalSize() const;
        void present(const ImVec4& clearColor);

        static const char* backendName();

    private:
        Native* native_{nullptr};
    };

}
