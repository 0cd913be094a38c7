#include <algorithm>
#include <format>
#include <sstream>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    namespace {
        struct HandleLayout {
            const char* name;
            const char* kind;
            const char* cursor;
            std::vector<std::pair<const char*, const char*>> styles;
        };

        // Edge handles stop short of the corners so that corner handles always win there.
        const std::vector<HandleLayout>& handleLayouts() {
            static const std::vector<HandleLayout> layouts{
                {"top", "horizontal", "ns-resize", {{"top", "-3px"}, {"left", "7px"}, {"right", "7px"}, {"height", "6px"}}},
                {"top-right", "corner", "nesw-resize", {{"top", "-3px"}, {"right", "-3px"}, {"width", "10px"}, {"height", "10px"}}},
                {"right", "vertical", "ew-resize", {{"right", "-3px"}, {"top", "7px"}, {"bottom", "7px"}, {"width", "6px"}}},
                {"bottom-right", "corner", "nwse-resize", {{"bottom", "-3px"}, {"right", "-3px"}, {"width", "10px"}, {"height", "10px"}}},
                {"bottom", "horizontal", "ns-resize", {{"bottom", "-3px"}, {"left", "7px"}, {"right", "7px"}, {"height", "6px"}}},
                {"bottom-left", "corner", "nesw-resize", {{"bottom", "-3px"}, {"left", "-3px"}, {"width", "10px"}, {"height", "10px"}}},
                {"left", "vertical", "ew-resize", {{"left", "-3px"}, {"top", "7px"}, {"bottom", "7px"}, {"width", "6px"}}},
                {"top-left", "corner", "nwse-resize", {{"top", "-3px"}, {"left", "-3px"}, {"width", "10px"}, {"height", "10px"}}},
            };
            return layouts;
        }

        // "top-right" -> {Top, Right}
        std::vector<WindowEdge> edgesOf(const std::string& handleName) {
            std::vector<WindowEdge> edges{};
            std::istringstream parts{handleName};
            std::string part;
            while (std::getline(parts, part, '-')) {
                for (auto edge : {WindowEdge::Top, WindowEdge::Right, WindowEdge::Bottom, WindowEdge::Left})
                    if (part == windowEdgeName(edge))
                        edges.emplace_back(edge);
            }
            return edges;
        }
    }

    WindowGeometry ResizeBehavior::resizedGeometry(const WindowGeometry& start, const std::vector<WindowEdge>& edges,
                                                   double dx, double dy, Size minimum) {
        WindowGeometry next = start;
        for (auto edge : edges) {
            bool horizontal = edge == WindowEdge::Left || edge == WindowEdge::Right;
            // top/left follow the pointer, right/bottom offsets shrink as it moves right/down
            double sign = (edge == WindowEdge::Top || edge == WindowEdge::Left) ? 1 : -1;
            double delta = horizontal ? dx : dy;
            double startDimension = horizontal ? start.width : start.height;
            double minDimension = horizontal ? minimum.width : minimum.height;

            double limit = edgeOffset(start, edge) + startDimension - minDimension;
            double candidate = edgeOffset(start, edge) + sign * delta;
            edgeOffset(next, edge) = std::min(candidate, limit);
        }
        next.width = start.containerWidth - next.left - next.right;
        next.height = start.containerHeight - next.top - next.bottom;
        return next;
    }

    void ResizeBehavior::attach(Window& window) {
        window_ = &window;
        resizer_ = window.main()->append("resize");
        resizer_->style("position", "absolute")
                .style("top", "0px")
                .style("right", "0px")
                .style("bottom", "0px")
                .style("left", "0px")
                .style("pointer-events", "none");

        auto& layouts = handleLayouts();
        handles_.reserve(layouts.size());
        for (auto& layout : layouts) {
            auto element = resizer_->append(std::format("rsz-{} rsz-{}", layout.name, layout.kind));
            element->style("position", "absolute").style("cursor", layout.cursor);
            for (auto& [name, value] : layout.styles)
                element->style(name, value);
            handles_.emplace_back(ResizeHandle{layout.name, layout.kind, edgesOf(layout.name), element});
        }
        for (size_t i = 0; i < handles_.size(); i++)
            handles_[i].element->on(PointerEventType::Down, [this, i](PointerEvent& event) { onPointerDown(handles_[i], event); });
    }

    void ResizeBehavior::detach() {
        releaseCapture();
        active_handle_ = nullptr;
        for (auto& handle : handles_)
            handle.element->on(PointerEventType::Down, nullptr);
        if (resizer_)
            resizer_->remove();
        resizer_ = nullptr;
        handles_.clear();
    }

    Element* ResizeBehavior::handle(const std::string& name) const {
        for (auto& h : handles_)
            if (name == h.name)
                return h.element;
        return nullptr;
    }

    void ResizeBehavior::onPointerDown(ResizeHandle& handle, PointerEvent& event) {
        event.preventDefault();
        if (window_->interacting()) {
            Logger::global()->logDiagnostic("Window %s: pointer-down on %s ignored during %s",
                                            window_->id().c_str(), handle.name, active_handle_ ? "resize" : "another interaction");
            return;
        }

        start_geometry_ = window_->geometry();
        window_->bringToFront();
        drag_start_ = {event.pageX(), event.pageY()};
        active_handle_ = &handle;

        auto& surface = window_->manager().surface();
        move_listener_ = surface.addEventListener(PointerEventType::Move, [this](PointerEvent& e) { onPointerMove(e); });
        up_listener_ = surface.addEventListener(PointerEventType::Up, [this](PointerEvent& e) { onPointerUp(e); });
        Logger::global()->logDiagnostic("Window %s: resize from %s started at %.0fx%.0f",
                                        window_->id().c_str(), handle.name, start_geometry_.width, start_geometry_.height);
    }

    void ResizeBehavior::onPointerMove(PointerEvent& event) {
        auto next = resizedGeometry(start_geometry_, active_handle_->edges,
                                    event.pageX() - drag_start_.x, event.pageY() - drag_start_.y, min_);
        window_->geometry(next);
    }

    void ResizeBehavior::onPointerUp(PointerEvent& event) {
        releaseCapture();
        active_handle_ = nullptr;
        Logger::global()->logDiagnostic("Window %s: resize ended", window_->id().c_str());
    }

    void ResizeBehavior::releaseCapture() {
        if (!window_)
            return;
        auto& surface = window_->manager().surface();
        if (move_listener_)
            surface.removeEventListener(move_listener_);
        if (up_listener_)
            surface.removeEventListener(up_listener_);
        move_listener_ = up_listener_ = 0;
    }

}
