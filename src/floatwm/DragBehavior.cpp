#include <format>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    void DragBehavior::attach(Window& window) {
        window_ = &window;
        window.header()->classed("window-draggable-header", true)
                .style("cursor", "grab")
                .on(PointerEventType::Down, [this](PointerEvent& event) { onPointerDown(event); });
    }

    void DragBehavior::detach() {
        releaseCapture();
        if (window_ && window_->header())
            window_->header()->on(PointerEventType::Down, nullptr);
        dragging_ = false;
        translation_ = {};
    }

    void DragBehavior::onPointerDown(PointerEvent& event) {
        event.preventDefault();
        // one drag or resize per window; a second press is not a new interaction
        if (window_->interacting()) {
            Logger::global()->logDiagnostic("Window %s: pointer-down ignored during %s", window_->id().c_str(),
                                            dragging_ ? "drag" : "another interaction");
            return;
        }

        window_->bringToFront();
        window_->root()->style("cursor", "grabbing");
        window_->header()->style("cursor", "grabbing");

        drag_start_ = {event.pageX(), event.pageY()};
        translation_ = {};
        dragging_ = true;

        auto& surface = window_->manager().surface();
        move_listener_ = surface.addEventListener(PointerEventType::Move, [this](PointerEvent& e) { onPointerMove(e); });
        up_listener_ = surface.addEventListener(PointerEventType::Up, [this](PointerEvent& e) { onPointerUp(e); });
        Logger::global()->logDiagnostic("Window %s: drag started at (%.1f, %.1f)", window_->id().c_str(), drag_start_.x, drag_start_.y);
    }

    void DragBehavior::onPointerMove(PointerEvent& event) {
        translation_ = {event.pageX() - drag_start_.x, event.pageY() - drag_start_.y};
        window_->root()->style("transform", std::format("translate({}, {})",
            formatPixels(translation_.x), formatPixels(translation_.y)));
    }

    void DragBehavior::onPointerUp(PointerEvent& event) {
        // the translated box becomes the real position
        window_->geometry(window_->geometry());

        window_->root()->style("cursor", "auto").removeStyle("transform");
        window_->header()->style("cursor", "grab");

        releaseCapture();
        dragging_ = false;
        Logger::global()->logDiagnostic("Window %s: drag ended, moved by (%.1f, %.1f)",
                                        window_->id().c_str(), translation_.x, translation_.y);
        translation_ = {};
    }

    void DragBehavior::releaseCapture() {
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
