#include <algorithm>
#include <format>
#include <random>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    Element* installDefaultWindowTemplate(Surface& surface, const std::string& templateId, const std::string& theme) {
        auto root = surface.document()->append("window-container");
        root->id(templateId)
             .classed(Window::INACTIVE_CLASS, true)
             .style("position", "absolute");

        auto main = root->append("main-window");
        main->style("position", "absolute")
             .style("top", "0px")
             .style("right", "0px")
             .style("bottom", "0px")
             .style("left", "0px");

        auto contents = main->append(std::format("window-contents {}{}", Window::THEME_CLASS_PREFIX, theme));
        contents->style("position", "absolute")
                 .style("top", "0px")
                 .style("right", "0px")
                 .style("bottom", "0px")
                 .style("left", "0px")
                 .style("border-radius", "5px");

        auto header = contents->append("window-header");
        header->style("height", "24px");
        header->append("window-title");
        header->append("window-close-button")
              ->style("position", "absolute")
               .style("top", "4px")
               .style("right", "4px")
               .style("width", "16px")
               .style("height", "16px")
               .style("cursor", "pointer");

        contents->append("window-body");
        contents->append(std::format("window-footer {}", Window::INACTIVE_CLASS))
                ->style("height", "10px");
        return root;
    }

    WindowManager::WindowManager(Surface& surface, WindowManagerConfiguration config)
        : surface_(surface), config_(std::move(config)), stacking_(config_.stackBaseline) {
        if (!surface_.getElementById(config_.templateId)) {
            installDefaultWindowTemplate(surface_, config_.templateId, config_.defaultTheme);
            Logger::global()->logInfo("Installed default window template '%s'", config_.templateId.c_str());
        }
    }

    WindowManager::~WindowManager() {
        if (!windows_.empty())
            Logger::global()->logWarning("WindowManager destroyed with %zu open windows", windows_.size());
    }

    void WindowManager::registerWindow(Window* window) {
        windows_.emplace_back(window);
    }

    void WindowManager::unregisterWindow(Window* window) {
        windows_.erase(std::remove(windows_.begin(), windows_.end(), window), windows_.end());
    }

    std::string WindowManager::generateWindowId() {
        static std::mt19937_64 engine{std::random_device{}()};
        return std::format("win{:016x}{:016x}", engine(), engine());
    }

    std::unique_ptr<Window> WindowManager::createWindow(const WindowOptions& options) {
        auto id = options.id.value_or(generateWindowId());
        auto window = std::make_unique<Window>(*this, id, options.templateId.value_or(config_.templateId));
        Logger::global()->logInfo("Window %s: created", id.c_str());
        return window;
    }

    std::unique_ptr<Window> WindowManager::createDraggableWindow(const WindowOptions& options) {
        auto window = createWindow(options);
        window->addBehavior(std::make_unique<DragBehavior>());
        return window;
    }

    std::unique_ptr<Window> WindowManager::createResizableWindow(const WindowOptions& options,
                                                                 std::optional<double> minWidth,
                                                                 std::optional<double> minHeight) {
        auto window = createDraggableWindow(options);
        window->addBehavior(std::make_unique<ResizeBehavior>(minWidth.value_or(config_.minWidth),
                                                             minHeight.value_or(config_.minHeight)));
        return window;
    }

    Window* WindowManager::findWindow(const std::string& id) const {
        for (auto w : windows_)
            if (w->id() == id)
                return w;
        return nullptr;
    }

    Window* WindowManager::topmostVisibleWindow() const {
        Window* topmost{nullptr};
        for (auto w : windows_)
            if (!w->hidden() && (!topmost || w->stackOrder() >= topmost->stackOrder()))
                topmost = w;
        return topmost;
    }

}
