#include <gtest/gtest.h>

#include <floatwm/floatwm.hpp>

using namespace floatwm;

class GeometryTest : public ::testing::Test {
protected:
    Surface surface{1000, 800};
    Element* window{nullptr};

    void SetUp() override {
        window = surface.container()->append("window-container");
        window->style("position", "absolute")
               .style("top", "100px")
               .style("left", "10px")
               .style("width", "300px")
               .style("height", "300px");
    }
};

TEST_F(GeometryTest, ComputesOffsetsFromAllFourSides) {
    auto g = computeGeometry(*window, *surface.container());
    EXPECT_EQ(g.top, 100);
    EXPECT_EQ(g.left, 10);
    EXPECT_EQ(g.width, 300);
    EXPECT_EQ(g.height, 300);
    EXPECT_EQ(g.right, 690);
    EXPECT_EQ(g.bottom, 400);
    EXPECT_EQ(g.containerWidth, 1000);
    EXPECT_EQ(g.containerHeight, 800);
}

TEST_F(GeometryTest, EdgesAndSizesAddUpToContainer) {
    window->style("transform", "translate(33px, -17px)");
    auto g = computeGeometry(*window, *surface.container());
    EXPECT_DOUBLE_EQ(g.left + g.width + g.right, g.containerWidth);
    EXPECT_DOUBLE_EQ(g.top + g.height + g.bottom, g.containerHeight);
    EXPECT_EQ(g.left, 43);
    EXPECT_EQ(g.top, 83);
}

TEST_F(GeometryTest, ApplyWritesAllSixProperties) {
    WindowGeometry g{.top = 20, .right = 30, .bottom = 40, .left = 50, .width = 920, .height = 740,
                     .containerWidth = 1000, .containerHeight = 800};
    applyGeometry(*window, g);
    EXPECT_EQ(window->style("top"), "20px");
    EXPECT_EQ(window->style("right"), "30px");
    EXPECT_EQ(window->style("bottom"), "40px");
    EXPECT_EQ(window->style("left"), "50px");
    EXPECT_EQ(window->style("width"), "920px");
    EXPECT_EQ(window->style("height"), "740px");

    auto back = computeGeometry(*window, *surface.container());
    EXPECT_EQ(back.top, 20);
    EXPECT_EQ(back.right, 30);
    EXPECT_EQ(back.width, 920);
}

TEST_F(GeometryTest, ApplyingTheCurrentGeometryIsStable) {
    auto before = computeGeometry(*window, *surface.container());
    applyGeometry(*window, before);
    auto after = computeGeometry(*window, *surface.container());
    EXPECT_EQ(before.top, after.top);
    EXPECT_EQ(before.right, after.right);
    EXPECT_EQ(before.bottom, after.bottom);
    EXPECT_EQ(before.left, after.left);
    EXPECT_EQ(before.width, after.width);
    EXPECT_EQ(before.height, after.height);
}

TEST(WindowEdgeTest, OffsetAccessorsMatchFields) {
    WindowGeometry g{.top = 1, .right = 2, .bottom = 3, .left = 4};
    EXPECT_EQ(edgeOffset(g, WindowEdge::Top), 1);
    EXPECT_EQ(edgeOffset(g, WindowEdge::Right), 2);
    EXPECT_EQ(edgeOffset(g, WindowEdge::Bottom), 3);
    EXPECT_EQ(edgeOffset(g, WindowEdge::Left), 4);
    edgeOffset(g, WindowEdge::Bottom) = 9;
    EXPECT_EQ(g.bottom, 9);
    EXPECT_STREQ(windowEdgeName(WindowEdge::Right), "right");
}
