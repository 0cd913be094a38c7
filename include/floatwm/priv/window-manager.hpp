#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "configuration.hpp"
#include "window.hpp"

namespace floatwm {

    struct WindowOptions {
        // Element id of the new window; generated ("win" + 32 hex digits) if unset.
        std::optional<std::string> id{};
        // Template element to clone; the configured template if unset.
        std::optional<std::string> templateId{};
    };

    // Owns the per-surface window state: the stacking registry, the configuration
    // and the set of open windows. Independent managers (e.g. one per surface, or
    // one per test) share nothing.
    class WindowManager {
        Surface& surface_;
        WindowManagerConfiguration config_;
        StackingRegistry stacking_;
        std::vector<Window*> windows_{};

        friend class Window;
        void registerWindow(Window* window);
        void unregisterWindow(Window* window);

    public:
        explicit WindowManager(Surface& surface, WindowManagerConfiguration config = {});
        ~WindowManager();

        WindowManager(const WindowManager&) = delete;
        WindowManager& operator=(const WindowManager&) = delete;

        Surface& surface() const { return surface_; }
        Element* container() const { return surface_.container(); }
        const WindowManagerConfiguration& configuration() const { return config_; }
        StackingRegistry& stacking() { return stacking_; }

        std::unique_ptr<Window> createWindow(const WindowOptions& options = {});
        // Window whose header drags it around.
        std::unique_ptr<Window> createDraggableWindow(const WindowOptions& options = {});
        // Draggable window with eight resize handles. Minimum size defaults to the configuration.
        std::unique_ptr<Window> createResizableWindow(const WindowOptions& options = {},
                                                      std::optional<double> minWidth = std::nullopt,
                                                      std::optional<double> minHeight = std::nullopt);

        Window* findWindow(const std::string& id) const;
        // Open windows in creation order.
        const std::vector<Window*>& windows() const { return windows_; }
        // Visible window with the highest stacking order, or nullptr.
        Window* topmostVisibleWindow() const;

        static std::string generateWindowId();
    };

    // Builds the standard window template (header with title and close button,
    // body, footer) under the surface document, hidden. Returns the template root.
    Element* installDefaultWindowTemplate(Surface& surface, const std::string& templateId, const std::string& theme);

}
