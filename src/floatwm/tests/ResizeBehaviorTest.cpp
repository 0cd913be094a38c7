#include <gtest/gtest.h>

#include <floatwm/floatwm.hpp>

using namespace floatwm;

class ResizeBehaviorTest : public ::testing::Test {
protected:
    Surface surface{1000, 800};
    WindowManager manager{surface};
    std::unique_ptr<Window> window;
    ResizeBehavior* resize{nullptr};

    void createWindow(std::optional<double> minWidth = std::nullopt, std::optional<double> minHeight = std::nullopt) {
        window = manager.createResizableWindow({}, minWidth, minHeight);
        window->setList({{"width", "300px"}, {"height", "300px"}, {"top", "100px"}, {"left", "10px"}});
        window->show();
        resize = window->behavior<ResizeBehavior>();
    }

    void SetUp() override {
        createWindow();
        ASSERT_NE(resize, nullptr);
    }

    void TearDown() override {
        window.reset();
    }

    void dragFrom(double x, double y, double dx, double dy) {
        surface.dispatchPointerDown(x, y);
        surface.dispatchPointerMove(x + dx, y + dy);
        surface.dispatchPointerUp(x + dx, y + dy);
    }
};

TEST_F(ResizeBehaviorTest, CreatesEightHandles) {
    ASSERT_EQ(resize->handles().size(), 8);
    for (auto name : {"top", "top-right", "right", "bottom-right", "bottom", "bottom-left", "left", "top-left"}) {
        auto h = resize->handle(name);
        ASSERT_NE(h, nullptr) << name;
        EXPECT_TRUE(h->classed(std::string{"rsz-"} + name));
        EXPECT_TRUE(h->hasListener(PointerEventType::Down));
    }
    EXPECT_TRUE(resize->handle("right")->classed("rsz-vertical"));
    EXPECT_TRUE(resize->handle("top")->classed("rsz-horizontal"));
    EXPECT_TRUE(resize->handle("top-left")->classed("rsz-corner"));
    EXPECT_EQ(resize->handle("middle"), nullptr);
    ASSERT_NE(window->main()->select("resize"), nullptr);
}

TEST_F(ResizeBehaviorTest, HandlesShowResizeCursors) {
    EXPECT_EQ(surface.cursorAt(310, 250), "ew-resize");
    EXPECT_EQ(surface.cursorAt(150, 100), "ns-resize");
    EXPECT_EQ(surface.cursorAt(308, 398), "nwse-resize");
    EXPECT_EQ(surface.cursorAt(12, 398), "nesw-resize");
    // the overlay itself does not take hits away from the window body
    EXPECT_EQ(surface.cursorAt(150, 250), "auto");
}

TEST_F(ResizeBehaviorTest, RightEdgeStopsAtMinimumWidth) {
    dragFrom(310, 250, -500, 0);
    auto g = window->geometry();
    EXPECT_EQ(g.width, 200);
    EXPECT_EQ(g.left, 10);
    EXPECT_EQ(g.right, 790);
    EXPECT_EQ(g.height, 300);
    EXPECT_FALSE(resize->resizing());
    EXPECT_EQ(surface.listenerCount(), 0);
}

TEST_F(ResizeBehaviorTest, RightEdgeGrows) {
    dragFrom(310, 250, 40, 25);
    auto g = window->geometry();
    EXPECT_EQ(g.width, 340);
    EXPECT_EQ(g.height, 300);
    EXPECT_EQ(g.top, 100);
}

TEST_F(ResizeBehaviorTest, BottomRightCornerResizesBothAxes) {
    dragFrom(308, 398, 50, 60);
    auto g = window->geometry();
    EXPECT_EQ(g.width, 350);
    EXPECT_EQ(g.height, 360);
    EXPECT_EQ(g.left, 10);
    EXPECT_EQ(g.top, 100);
}

TEST_F(ResizeBehaviorTest, LeftEdgeMovesLeftOffsetWithinLimit) {
    dragFrom(10, 250, 250, 0);
    auto g = window->geometry();
    EXPECT_EQ(g.left, 110);
    EXPECT_EQ(g.width, 200);
    EXPECT_EQ(g.right, 690);
}

TEST_F(ResizeBehaviorTest, TopEdgeGrowsUpward) {
    dragFrom(150, 100, 0, -50);
    auto g = window->geometry();
    EXPECT_EQ(g.top, 50);
    EXPECT_EQ(g.height, 350);
    EXPECT_EQ(g.bottom, 400);
}

TEST_F(ResizeBehaviorTest, GeometryIsAppliedOnEveryMove) {
    surface.dispatchPointerDown(310, 250);
    EXPECT_TRUE(resize->resizing());
    EXPECT_TRUE(window->interacting());
    surface.dispatchPointerMove(330, 250);
    EXPECT_EQ(window->root()->style("width"), "320px");
    surface.dispatchPointerMove(350, 250);
    EXPECT_EQ(window->root()->style("width"), "340px");
    surface.dispatchPointerUp(350, 250);
    EXPECT_FALSE(window->interacting());
}

TEST_F(ResizeBehaviorTest, ResizeDoesNotStartDrag) {
    surface.dispatchPointerDown(150, 100);
    auto drag = window->behavior<DragBehavior>();
    ASSERT_NE(drag, nullptr);
    EXPECT_FALSE(drag->dragging());
    EXPECT_TRUE(resize->resizing());
    surface.dispatchPointerUp(150, 100);
}

TEST_F(ResizeBehaviorTest, CustomMinimumSize) {
    createWindow(100, 120);
    EXPECT_EQ(resize->minWidth(), 100);
    EXPECT_EQ(resize->minHeight(), 120);
    dragFrom(310, 250, -500, 0);
    EXPECT_EQ(window->geometry().width, 100);
    dragFrom(50, 398, 0, -500);
    EXPECT_EQ(window->geometry().height, 120);
}

TEST_F(ResizeBehaviorTest, ReentrantPressIsIgnored) {
    surface.dispatchPointerDown(310, 250);
    surface.dispatchPointerMove(320, 250);
    surface.dispatchPointerDown(150, 100);
    EXPECT_EQ(surface.listenerCount(), 2);
    surface.dispatchPointerMove(330, 250);
    surface.dispatchPointerUp(330, 250);
    auto g = window->geometry();
    EXPECT_EQ(g.width, 320);
    EXPECT_EQ(g.top, 100);
}

TEST_F(ResizeBehaviorTest, HeaderPressDuringResizeDoesNotStartDrag) {
    auto drag = window->behavior<DragBehavior>();
    ASSERT_NE(drag, nullptr);
    surface.dispatchPointerDown(310, 250);
    surface.dispatchPointerMove(320, 250);
    surface.dispatchPointerDown(50, 110);
    EXPECT_TRUE(resize->resizing());
    EXPECT_FALSE(drag->dragging());
    EXPECT_EQ(surface.listenerCount(), 2);

    surface.dispatchPointerMove(330, 250);
    EXPECT_FALSE(window->root()->hasStyle("transform"));
    surface.dispatchPointerUp(330, 250);
    EXPECT_FALSE(window->interacting());
    EXPECT_EQ(surface.listenerCount(), 0);
    auto g = window->geometry();
    EXPECT_EQ(g.width, 320);
    EXPECT_EQ(g.left, 10);
    EXPECT_EQ(g.top, 100);
}

TEST_F(ResizeBehaviorTest, HandlePressDuringDragDoesNotStartResize) {
    auto drag = window->behavior<DragBehavior>();
    ASSERT_NE(drag, nullptr);
    surface.dispatchPointerDown(50, 110);
    ASSERT_TRUE(drag->dragging());
    surface.dispatchPointerDown(310, 250);
    EXPECT_FALSE(resize->resizing());
    EXPECT_EQ(surface.listenerCount(), 2);

    surface.dispatchPointerMove(70, 130);
    surface.dispatchPointerUp(70, 130);
    EXPECT_FALSE(window->interacting());
    auto g = window->geometry();
    EXPECT_EQ(g.left, 30);
    EXPECT_EQ(g.top, 120);
    EXPECT_EQ(g.width, 300);
    EXPECT_EQ(g.height, 300);
}

TEST_F(ResizeBehaviorTest, CloseRemovesHandles) {
    auto right = resize->handle("right");
    window->close();
    EXPECT_FALSE(surface.alive(right));
    EXPECT_TRUE(resize->handles().empty());
}

TEST(ResizedGeometryTest, EdgeArithmetic) {
    WindowGeometry start{.top = 100, .right = 690, .bottom = 400, .left = 10, .width = 300, .height = 300,
                         .containerWidth = 1000, .containerHeight = 800};
    Size minimum{200, 200};

    auto g = ResizeBehavior::resizedGeometry(start, {WindowEdge::Top, WindowEdge::Left}, -10, -20, minimum);
    EXPECT_EQ(g.left, 0);
    EXPECT_EQ(g.top, 80);
    EXPECT_EQ(g.width, 310);
    EXPECT_EQ(g.height, 320);
    EXPECT_DOUBLE_EQ(g.left + g.width + g.right, g.containerWidth);
    EXPECT_DOUBLE_EQ(g.top + g.height + g.bottom, g.containerHeight);

    g = ResizeBehavior::resizedGeometry(start, {WindowEdge::Bottom}, 0, -1000, minimum);
    EXPECT_EQ(g.height, 200);
    EXPECT_EQ(g.bottom, 500);

    g = ResizeBehavior::resizedGeometry(start, {}, 50, 50, minimum);
    EXPECT_EQ(g.width, 300);
    EXPECT_EQ(g.height, 300);
}
