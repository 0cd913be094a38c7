#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "geometry.hpp"

namespace floatwm {

    class Window;
    class WindowManager;

    // An optional interactive capability attached to a Window at construction time.
    // `attach()` wires the listeners it needs; `detach()` must remove every one of
    // them, including surface-level listeners of an interaction still in progress.
    class WindowBehavior {
    public:
        virtual ~WindowBehavior() = default;

        virtual const char* name() const = 0;
        virtual void attach(Window& window) = 0;
        virtual void detach() = 0;
        // Whether an interaction (drag, resize...) is in progress.
        virtual bool active() const = 0;
    };

    // A floating, chrome-managed overlay window cloned from a template element.
    //
    // The root element carries the anchored geometry and stacking order as styles;
    // header, body and footer are discovered in the clone by class name
    // (`window-header`, `window-body`, `window-footer`, ...).
    //
    // Windows are created through WindowManager and must not outlive it.
    // After close() only the read-only accessors id(), closed() and hidden() are meaningful.
    class Window {
        WindowManager& manager_;
        std::string id_;
        bool closed_{false};
        Element* root_{nullptr};
        Element* main_{nullptr};
        Element* contents_{nullptr};
        Element* header_{nullptr};
        Element* title_{nullptr};
        Element* close_button_{nullptr};
        Element* body_{nullptr};
        Element* footer_{nullptr};
        std::vector<std::unique_ptr<WindowBehavior>> behaviors_{};

        bool ensureOpen(const char* operation) const;

    public:
        static constexpr const char* INACTIVE_CLASS = "window-inactive";
        static constexpr const char* THEME_CLASS_PREFIX = "window-theme-";

        Window(WindowManager& manager, const std::string& id, const std::string& templateId);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        WindowManager& manager() const { return manager_; }
        const std::string& id() const { return id_; }
        bool closed() const { return closed_; }

        Element* root() const { return root_; }
        Element* main() const { return main_; }
        Element* header() const { return header_; }
        Element* body() const { return body_; }
        Element* footer() const { return footer_; }
        Element* closeButton() const { return close_button_; }

        bool hidden() const;
        // Shows the window and brings it to the front.
        Window& show();
        Window& hide();

        int32_t stackOrder() const;
        // Takes a new stacking order if `force` is set or another window has been
        // raised above this one since it last came to the front.
        Window& bringToFront(bool force = false);

        std::string title() const;
        Window& setTitle(const std::string& newTitle);
        std::string theme() const;
        // Theme named by the first non-empty `window-theme-*` class of a contents element.
        static std::string themeNameOf(const Element* contents);
        Window& setTheme(const std::string& newTheme);

        // `title` and `theme` go to their setters; anything else is applied as a
        // style property of the root element.
        Window& set(const std::string& name, const std::string& value);
        Window& setList(const std::map<std::string, std::string>& options);

        Window& ribbonColor(const std::string& color);
        Window& showFooter();
        bool footerVisible() const;
        Window& hideCloseButton();
        Window& showCloseButton();
        bool closeButtonVisible() const;

        // Sizes the window to the natural size of header, body and footer.
        // Callers invoke it again after changing content.
        Window& sizeToContent();

        // Places the window next to the pointer, on whichever side of it has more room.
        Window& moveNear(const PointerEvent& event, double offset);
        Window& moveNear(const PointerEvent& event);

        WindowGeometry geometry() const;
        Window& geometry(const WindowGeometry& newGeometry);

        // Detaches every listener the window owns, then removes it from the surface.
        void close();

        Window& addBehavior(std::unique_ptr<WindowBehavior> behavior);
        template <typename T>
        T* behavior() const {
            for (auto& b : behaviors_)
                if (auto typed = dynamic_cast<T*>(b.get()))
                    return typed;
            return nullptr;
        }
        bool interacting() const;
    };

}
