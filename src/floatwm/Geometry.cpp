#include <floatwm/floatwm.hpp>

namespace floatwm {

    const char* windowEdgeName(WindowEdge edge) {
        switch (edge) {
            case WindowEdge::Top: return "top";
            case WindowEdge::Right: return "right";
            case WindowEdge::Bottom: return "bottom";
            case WindowEdge::Left: return "left";
        }
        return "";
    }

    double& edgeOffset(WindowGeometry& geometry, WindowEdge edge) {
        switch (edge) {
            case WindowEdge::Top: return geometry.top;
            case WindowEdge::Right: return geometry.right;
            case WindowEdge::Bottom: return geometry.bottom;
            case WindowEdge::Left: break;
        }
        return geometry.left;
    }

    double edgeOffset(const WindowGeometry& geometry, WindowEdge edge) {
        return edgeOffset(const_cast<WindowGeometry&>(geometry), edge);
    }

    WindowGeometry computeGeometry(const Element& window, const Element& container) {
        auto surface = window.surface();
        auto parentPos = surface->boundingClientRect(container);
        auto childPos = surface->boundingClientRect(window);

        return WindowGeometry{
            .top = childPos.top() - parentPos.top(),
            .right = parentPos.right() - childPos.right(),
            .bottom = parentPos.bottom() - childPos.bottom(),
            .left = childPos.left() - parentPos.left(),
            .width = childPos.width,
            .height = childPos.height,
            .containerWidth = parentPos.width,
            .containerHeight = parentPos.height
        };
    }

    void applyGeometry(Element& window, const WindowGeometry& geometry) {
        window.style("top", formatPixels(geometry.top))
              .style("right", formatPixels(geometry.right))
              .style("bottom", formatPixels(geometry.bottom))
              .style("left", formatPixels(geometry.left))
              .style("width", formatPixels(geometry.width))
              .style("height", formatPixels(geometry.height));
    }

}
