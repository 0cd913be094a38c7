#include <stdexcept>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    namespace {
        bool isGeometryProperty(const std::string& name) {
            return name == "top" || name == "right" || name == "bottom" || name == "left"
                || name == "width" || name == "height";
        }
    }

    Window::Window(WindowManager& manager, const std::string& id, const std::string& templateId)
        : manager_(manager), id_(id) {
        auto& surface = manager.surface();
        auto templ = surface.getElementById(templateId);
        if (!templ) {
            Logger::global()->logError("Window %s: template '%s' not found", id.c_str(), templateId.c_str());
            throw std::invalid_argument("floatwm: window template not found: " + templateId);
        }
        if (surface.getElementById(id)) {
            Logger::global()->logError("Window %s: element id already in use", id.c_str());
            throw std::invalid_argument("floatwm: duplicate window id: " + id);
        }

        root_ = manager.container()->appendChild(templ->clone(id));
        root_->classed(INACTIVE_CLASS, true);

        main_ = root_->select("main-window");
        contents_ = root_->select("window-contents");
        header_ = root_->select("window-header");
        title_ = header_ ? header_->select("window-title") : nullptr;
        close_button_ = root_->select("window-close-button");
        body_ = root_->select("window-body");
        footer_ = root_->select("window-footer");
        if (!main_ || !contents_ || !header_ || !title_ || !close_button_ || !body_ || !footer_) {
            root_->remove();
            root_ = nullptr;
            Logger::global()->logError("Window %s: template '%s' lacks the window structure", id.c_str(), templateId.c_str());
            throw std::invalid_argument("floatwm: incomplete window template: " + templateId);
        }

        close_button_->on(PointerEventType::Click, [this](PointerEvent&) { close(); });

        manager_.registerWindow(this);
        bringToFront(true);
    }

    Window::~Window() {
        if (!closed_ && root_)
            close();
    }

    bool Window::ensureOpen(const char* operation) const {
        if (!closed_)
            return true;
        Logger::global()->logWarning("Window %s: %s() on a closed window is ignored", id_.c_str(), operation);
        return false;
    }

    bool Window::hidden() const {
        return closed_ || root_->classed(INACTIVE_CLASS);
    }

    Window& Window::show() {
        if (!ensureOpen("show"))
            return *this;
        bringToFront();
        root_->classed(INACTIVE_CLASS, false);
        return *this;
    }

    Window& Window::hide() {
        if (!ensureOpen("hide"))
            return *this;
        root_->classed(INACTIVE_CLASS, true);
        return *this;
    }

    int32_t Window::stackOrder() const {
        if (closed_)
            return 0;
        return static_cast<int32_t>(parsePixels(root_->style("z-index")).value_or(0));
    }

    Window& Window::bringToFront(bool force) {
        if (!ensureOpen("bringToFront"))
            return *this;
        auto& stacking = manager_.stacking();
        if (force || stackOrder() < stacking.current()) {
            auto z = stacking.nextStackOrder();
            root_->style("z-index", std::to_string(z));
            Logger::global()->logDiagnostic("Window %s: stack order %d", id_.c_str(), z);
        }
        return *this;
    }

    std::string Window::title() const {
        return closed_ ? std::string{} : title_->html();
    }

    Window& Window::setTitle(const std::string& newTitle) {
        if (ensureOpen("setTitle"))
            title_->html(newTitle);
        return *this;
    }

    std::string Window::themeNameOf(const Element* contents) {
        if (!contents)
            return {};
        const std::string prefix{THEME_CLASS_PREFIX};
        for (auto& cls : contents->classList())
            if (cls.size() > prefix.size() && cls.compare(0, prefix.size(), prefix) == 0)
                return cls.substr(prefix.size());
        return {};
    }

    std::string Window::theme() const {
        return closed_ ? std::string{} : themeNameOf(contents_);
    }

    Window& Window::setTheme(const std::string& newTheme) {
        if (!ensureOpen("setTheme"))
            return *this;
        auto current = theme();
        if (!current.empty())
            contents_->classed(THEME_CLASS_PREFIX + current, false);
        contents_->classed(THEME_CLASS_PREFIX + newTheme, true);
        return *this;
    }

    Window& Window::set(const std::string& name, const std::string& value) {
        if (!ensureOpen("set"))
            return *this;
        if (name == "title")
            return setTitle(value);
        if (name == "theme")
            return setTheme(value);

        if (isGeometryProperty(name) && !value.empty() && value != "auto" && !parsePixels(value))
            Logger::global()->logWarning("Window %s: '%s' is not a pixel value for %s", id_.c_str(), value.c_str(), name.c_str());
        root_->style(name, value);
        return *this;
    }

    Window& Window::setList(const std::map<std::string, std::string>& options) {
        for (auto& [name, value] : options)
            set(name, value);
        return *this;
    }

    Window& Window::ribbonColor(const std::string& color) {
        if (!ensureOpen("ribbonColor"))
            return *this;
        header_->style("background-color", color);
        footer_->style("background-color", color);
        return *this;
    }

    Window& Window::showFooter() {
        if (ensureOpen("showFooter"))
            footer_->classed(INACTIVE_CLASS, false);
        return *this;
    }

    bool Window::footerVisible() const {
        return !closed_ && !footer_->classed(INACTIVE_CLASS);
    }

    Window& Window::hideCloseButton() {
        if (ensureOpen("hideCloseButton"))
            close_button_->classed(INACTIVE_CLASS, true);
        return *this;
    }

    Window& Window::showCloseButton() {
        if (ensureOpen("showCloseButton"))
            close_button_->classed(INACTIVE_CLASS, false);
        return *this;
    }

    bool Window::closeButtonVisible() const {
        return !closed_ && !close_button_->classed(INACTIVE_CLASS);
    }

    Window& Window::sizeToContent() {
        if (!ensureOpen("sizeToContent"))
            return *this;
        auto contentWidth = body_->scrollWidth();
        auto contentHeight = body_->scrollHeight();
        auto headerHeight = header_->scrollHeight();
        // a hidden footer still leaves the rounded bottom border
        auto footerHeight = footer_->classed(INACTIVE_CLASS)
            ? parsePixels(contents_->style("border-radius")).value_or(0)
            : footer_->scrollHeight();

        auto totalHeight = contentHeight + headerHeight + footerHeight + 2;
        return setList({{"width", formatPixels(contentWidth)}, {"height", formatPixels(totalHeight)}});
    }

    Window& Window::moveNear(const PointerEvent& event) {
        return moveNear(event, manager_.configuration().moveNearOffset);
    }

    Window& Window::moveNear(const PointerEvent& event, double offset) {
        if (!ensureOpen("moveNear") || hidden())
            return *this;

        auto& surface = manager_.surface();
        auto pos = geometry();
        auto containerPos = surface.boundingClientRect(*manager_.container());
        auto viewport = surface.viewport();
        auto x = event.clientX() - containerPos.x;
        auto y = event.clientY() - containerPos.y;

        // pointer in the left half: window goes to its right, and vice versa
        pos.left = event.clientX() < viewport.width / 2 ? x + offset : x - offset - pos.width;
        pos.right = pos.containerWidth - pos.left - pos.width;
        pos.top = event.clientY() < viewport.height / 2 ? y + offset : y - offset - pos.height;
        pos.bottom = pos.containerHeight - pos.top - pos.height;

        return geometry(pos);
    }

    WindowGeometry Window::geometry() const {
        if (closed_)
            return {};
        return computeGeometry(*root_, *manager_.container());
    }

    Window& Window::geometry(const WindowGeometry& newGeometry) {
        if (ensureOpen("geometry"))
            applyGeometry(*root_, newGeometry);
        return *this;
    }

    void Window::close() {
        if (closed_)
            return;
        close_button_->on(PointerEventType::Click, nullptr);
        for (auto& behavior : behaviors_)
            behavior->detach();
        root_->remove();

        root_ = main_ = contents_ = header_ = title_ = close_button_ = body_ = footer_ = nullptr;
        closed_ = true;
        manager_.unregisterWindow(this);
        Logger::global()->logInfo("Window %s: closed", id_.c_str());
    }

    Window& Window::addBehavior(std::unique_ptr<WindowBehavior> behavior) {
        if (!ensureOpen("addBehavior"))
            return *this;
        behavior->attach(*this);
        behaviors_.emplace_back(std::move(behavior));
        return *this;
    }

    bool Window::interacting() const {
        for (auto& b : behaviors_)
            if (b->active())
                return true;
        return false;
    }

}
