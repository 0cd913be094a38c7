#pragma once

#include <array>
#include <string>
#include <vector>

#include "window.hpp"

namespace floatwm {

    // Moves the window with a pointer-down on its header.
    //
    // While dragging, only a presentational `translate()` transform follows the
    // pointer; the anchored geometry is re-measured and committed on pointer-up.
    // Move/up listeners live on the surface so that a fast pointer leaving the
    // window does not lose the drag.
    class DragBehavior : public WindowBehavior {
        Window* window_{nullptr};
        bool dragging_{false};
        Point drag_start_{};
        Point translation_{};
        ListenerId move_listener_{0};
        ListenerId up_listener_{0};

        void onPointerDown(PointerEvent& event);
        void onPointerMove(PointerEvent& event);
        void onPointerUp(PointerEvent& event);
        void releaseCapture();

    public:
        const char* name() const override { return "drag"; }
        void attach(Window& window) override;
        void detach() override;
        bool active() const override { return dragging_; }

        bool dragging() const { return dragging_; }
        // Current translation of an ongoing drag, zero when idle.
        Point translation() const { return translation_; }
    };

    struct ResizeHandle {
        const char* name;
        // "horizontal" (top/bottom), "vertical" (left/right) or "corner".
        const char* kind;
        std::vector<WindowEdge> edges;
        Element* element{nullptr};
    };

    // Resizes the window from eight handles around its perimeter.
    //
    // Each handle moves the edges it is named after. Unlike dragging, geometry is
    // committed on every pointer-move, and no step may take the window below its
    // minimum size.
    class ResizeBehavior : public WindowBehavior {
        Window* window_{nullptr};
        Size min_;
        Element* resizer_{nullptr};
        std::vector<ResizeHandle> handles_{};
        ResizeHandle* active_handle_{nullptr};
        WindowGeometry start_geometry_{};
        Point drag_start_{};
        ListenerId move_listener_{0};
        ListenerId up_listener_{0};

        void onPointerDown(ResizeHandle& handle, PointerEvent& event);
        void onPointerMove(PointerEvent& event);
        void onPointerUp(PointerEvent& event);
        void releaseCapture();

    public:
        static constexpr double DEFAULT_MIN_WIDTH = 200;
        static constexpr double DEFAULT_MIN_HEIGHT = 200;

        explicit ResizeBehavior(double minWidth = DEFAULT_MIN_WIDTH, double minHeight = DEFAULT_MIN_HEIGHT)
            : min_({minWidth, minHeight}) {}

        const char* name() const override { return "resize"; }
        void attach(Window& window) override;
        void detach() override;
        bool active() const override { return active_handle_ != nullptr; }

        bool resizing() const { return active_handle_ != nullptr; }
        double minWidth() const { return min_.width; }
        void minWidth(double value) { min_.width = value; }
        double minHeight() const { return min_.height; }
        void minHeight(double value) { min_.height = value; }

        const std::vector<ResizeHandle>& handles() const { return handles_; }
        Element* handle(const std::string& name) const;

        // The geometry a move of (dx, dy) from `start` produces through `handle`,
        // honoring the minimum size.
        static WindowGeometry resizedGeometry(const WindowGeometry& start, const std::vector<WindowEdge>& edges,
                                              double dx, double dy, Size minimum);
    };

}
