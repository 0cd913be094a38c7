#include <gtest/gtest.h>

#include <floatwm/floatwm.hpp>

using namespace floatwm;

class WindowTest : public ::testing::Test {
protected:
    Surface surface{1000, 800};
    WindowManager manager{surface};

    std::unique_ptr<Window> placedWindow() {
        auto w = manager.createWindow();
        w->setList({{"width", "300px"}, {"height", "300px"}, {"top", "100px"}, {"left", "10px"}});
        return w;
    }

    void click(double x, double y) {
        surface.dispatchPointerDown(x, y);
        surface.dispatchPointerUp(x, y);
    }
};

TEST_F(WindowTest, NewWindowIsHiddenInsideContainer) {
    auto w = manager.createWindow();
    EXPECT_TRUE(w->hidden());
    EXPECT_EQ(w->root()->parent(), surface.container());
    EXPECT_EQ(surface.getElementById(w->id()), w->root());
    EXPECT_FALSE(w->footerVisible());
    EXPECT_TRUE(w->closeButtonVisible());
    EXPECT_EQ(w->theme(), "light");
}

TEST_F(WindowTest, SetListThenShowReadsBackGeometry) {
    auto w = placedWindow();
    w->show();
    EXPECT_FALSE(w->hidden());
    auto g = w->geometry();
    EXPECT_EQ(g.top, 100);
    EXPECT_EQ(g.left, 10);
    EXPECT_EQ(g.width, 300);
    EXPECT_EQ(g.height, 300);
    EXPECT_EQ(g.right, 690);
    EXPECT_EQ(g.bottom, 400);
}

TEST_F(WindowTest, SetRoutesTitleAndTheme) {
    auto w = manager.createWindow();
    w->setList({{"title", "Hello &amp; welcome"}, {"theme", "dark"}});
    EXPECT_EQ(w->title(), "Hello &amp; welcome");
    EXPECT_EQ(w->header()->select("window-title")->textContent(), "Hello & welcome");
    EXPECT_EQ(w->theme(), "dark");
    EXPECT_FALSE(w->root()->hasStyle("title"));
    EXPECT_FALSE(w->root()->select("window-contents")->classed("window-theme-light"));
}

TEST_F(WindowTest, ThemeNameSkipsBarePrefixClass) {
    auto contents = surface.container()->append("window-theme- window-theme-dark");
    EXPECT_EQ(Window::themeNameOf(contents), "dark");
    EXPECT_EQ(Window::themeNameOf(surface.container()->append("window-theme-")), "");
    EXPECT_EQ(Window::themeNameOf(nullptr), "");

    auto w = manager.createWindow();
    w->setTheme("solar");
    EXPECT_EQ(Window::themeNameOf(w->root()->select("window-contents")), w->theme());
}

TEST_F(WindowTest, HideAndShowToggleVisibility) {
    auto w = placedWindow();
    w->show();
    w->hide();
    EXPECT_TRUE(w->hidden());
    EXPECT_EQ(surface.hitTest(100, 200), surface.container());
    w->show();
    EXPECT_FALSE(w->hidden());
    EXPECT_TRUE(w->root()->isAncestorOf(surface.hitTest(100, 200)));
}

TEST_F(WindowTest, ShowRaisesOnlyWhenBelowCurrent) {
    auto a = manager.createWindow();
    auto b = manager.createWindow();
    EXPECT_EQ(a->stackOrder(), 11);
    EXPECT_EQ(b->stackOrder(), 12);

    a->show();
    EXPECT_EQ(a->stackOrder(), 13);
    // already on top: no new value is taken
    a->bringToFront();
    EXPECT_EQ(a->stackOrder(), 13);
    a->bringToFront(true);
    EXPECT_EQ(a->stackOrder(), 14);
}

TEST_F(WindowTest, RibbonColorPaintsHeaderAndFooter) {
    auto w = manager.createWindow();
    w->ribbonColor("#ff0000");
    EXPECT_EQ(w->header()->style("background-color"), "#ff0000");
    EXPECT_EQ(w->footer()->style("background-color"), "#ff0000");
}

TEST_F(WindowTest, FooterAndCloseButtonToggles) {
    auto w = manager.createWindow();
    w->showFooter();
    EXPECT_TRUE(w->footerVisible());
    w->hideCloseButton();
    EXPECT_FALSE(w->closeButtonVisible());
    EXPECT_FALSE(w->closeButton()->displayed());
    w->showCloseButton();
    EXPECT_TRUE(w->closeButtonVisible());
}

TEST_F(WindowTest, SizeToContentWithoutFooter) {
    auto w = placedWindow();
    w->body()->html("<p>hello</p>");
    w->sizeToContent();
    // body 35x16, header 24, rounded bottom 5, border 2
    EXPECT_EQ(w->root()->style("width"), "35px");
    EXPECT_EQ(w->root()->style("height"), "47px");
}

TEST_F(WindowTest, SizeToContentWithFooter) {
    auto w = placedWindow();
    w->showFooter();
    w->body()->html("<p>hello</p>");
    w->sizeToContent();
    EXPECT_EQ(w->root()->style("height"), "52px");
}

TEST_F(WindowTest, SizeToContentUsesBodyMaxWidth) {
    auto w = placedWindow();
    w->body()->style("max-width", "70px");
    w->body()->html("abcdefghijklmnopqrst");
    w->sizeToContent();
    EXPECT_EQ(w->root()->style("width"), "70px");
    EXPECT_EQ(w->root()->style("height"), formatPixels(32 + 24 + 5 + 2));
}

TEST_F(WindowTest, MoveNearPlacesWindowAwayFromPointer) {
    auto w = manager.createWindow();
    w->setList({{"width", "200px"}, {"height", "100px"}, {"top", "0px"}, {"left", "0px"}});
    w->show();

    PointerEvent topLeft{PointerEventType::Click, {100, 100}, {100, 100}, nullptr};
    w->moveNear(topLeft);
    auto g = w->geometry();
    EXPECT_EQ(g.left, 115);
    EXPECT_EQ(g.top, 115);

    PointerEvent bottomRight{PointerEventType::Click, {900, 700}, {900, 700}, nullptr};
    w->moveNear(bottomRight, 10);
    g = w->geometry();
    EXPECT_EQ(g.left, 690);
    EXPECT_EQ(g.top, 590);
    EXPECT_EQ(g.width, 200);
    EXPECT_EQ(g.height, 100);
}

TEST_F(WindowTest, MoveNearIgnoresHiddenWindow) {
    auto w = placedWindow();
    PointerEvent event{PointerEventType::Click, {500, 500}, {500, 500}, nullptr};
    w->moveNear(event);
    EXPECT_EQ(w->root()->style("left"), "10px");
}

TEST_F(WindowTest, CloseButtonClickClosesWindow) {
    auto w = placedWindow();
    w->show();
    auto id = w->id();
    // close button: 16x16 at 4px from the top right corner
    click(10 + 300 - 4 - 8, 100 + 4 + 8);
    EXPECT_TRUE(w->closed());
    EXPECT_EQ(surface.getElementById(id), nullptr);
    EXPECT_EQ(manager.findWindow(id), nullptr);
    EXPECT_EQ(w->root(), nullptr);
}

TEST_F(WindowTest, CloseIsIdempotentAndDetachesHandlers) {
    auto w = placedWindow();
    w->show();
    auto closeButton = w->closeButton();
    ASSERT_TRUE(closeButton->hasListener(PointerEventType::Click));
    w->close();
    EXPECT_FALSE(surface.alive(closeButton));
    w->close();
    EXPECT_TRUE(w->closed());
    EXPECT_TRUE(manager.windows().empty());

    // operations after close are ignored
    w->show();
    w->setTitle("again");
    EXPECT_TRUE(w->hidden());
    EXPECT_EQ(w->title(), "");
    EXPECT_EQ(w->stackOrder(), 0);
}

TEST_F(WindowTest, DestructorClosesOpenWindow) {
    std::string id;
    {
        auto w = placedWindow();
        id = w->id();
        EXPECT_NE(surface.getElementById(id), nullptr);
    }
    EXPECT_EQ(surface.getElementById(id), nullptr);
    EXPECT_TRUE(manager.windows().empty());
}
