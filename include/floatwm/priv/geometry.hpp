#pragma once

#include "surface.hpp"

namespace floatwm {

    // Window position as distances from all four container edges, plus the
    // window size and the container size it was measured against.
    struct WindowGeometry {
        double top{0};
        double right{0};
        double bottom{0};
        double left{0};
        double width{0};
        double height{0};
        double containerWidth{0};
        double containerHeight{0};
    };

    enum class WindowEdge {
        Top,
        Right,
        Bottom,
        Left
    };

    const char* windowEdgeName(WindowEdge edge);
    double& edgeOffset(WindowGeometry& geometry, WindowEdge edge);
    double edgeOffset(const WindowGeometry& geometry, WindowEdge edge);

    // Measures `window` against `container` from their current layout. No side effects.
    WindowGeometry computeGeometry(const Element& window, const Element& container);

    // Writes top/right/bottom/left/width/height as px styles. All six are always
    // written, since any of them may still be unset ("auto") from an earlier state.
    void applyGeometry(Element& window, const WindowGeometry& geometry);

}
