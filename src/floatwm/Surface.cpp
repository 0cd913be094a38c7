#include <algorithm>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    namespace {
        constexpr double GLYPH_WIDTH = 7.0;
        constexpr double LINE_HEIGHT = 16.0;

        size_t utf8Length(const std::string& s) {
            size_t n = 0;
            for (unsigned char c : s)
                if ((c & 0xC0) != 0x80)
                    n++;
            return n;
        }

        // Fixed-metrics text measurement for hosts that do not render glyphs.
        Size measureWithFixedGlyphs(const Element& element) {
            auto text = element.textContent();
            if (text.empty())
                return {};
            auto maxWidth = parsePixels(element.style("max-width"));
            size_t charsPerLine = maxWidth ? std::max<size_t>(1, static_cast<size_t>(*maxWidth / GLYPH_WIDTH)) : 0;

            Size result{};
            size_t start = 0;
            while (start <= text.size()) {
                auto end = text.find('\n', start);
                if (end == std::string::npos)
                    end = text.size();
                auto chars = utf8Length(text.substr(start, end - start));
                size_t lines = 1;
                if (charsPerLine > 0 && chars > charsPerLine) {
                    lines = (chars + charsPerLine - 1) / charsPerLine;
                    chars = charsPerLine;
                }
                result.width = std::max(result.width, static_cast<double>(chars) * GLYPH_WIDTH);
                result.height += static_cast<double>(lines) * LINE_HEIGHT;
                start = end + 1;
            }
            return result;
        }

        bool positioned(const Element& e) {
            auto position = e.style("position");
            return position == "absolute" || position == "fixed";
        }

        int32_t zIndexOf(const Element& e) {
            auto z = parsePixels(e.style("z-index"));
            return z ? static_cast<int32_t>(*z) : 0;
        }

        // Resolves one axis of an absolutely positioned box, CSS style:
        // an over-constrained box ignores its end offset.
        std::pair<double, double> resolveAxis(std::optional<double> start, std::optional<double> end,
                                              std::optional<double> length, double containerLength, double natural) {
            if (length) {
                if (start)
                    return {*start, *length};
                if (end)
                    return {containerLength - *end - *length, *length};
                return {0, *length};
            }
            if (start && end)
                return {*start, std::max(0.0, containerLength - *start - *end)};
            if (start)
                return {*start, natural};
            if (end)
                return {containerLength - *end - natural, natural};
            return {0, natural};
        }
    }

    const char* pointerEventTypeName(PointerEventType type) {
        switch (type) {
            case PointerEventType::Down: return "pointerdown";
            case PointerEventType::Move: return "pointermove";
            case PointerEventType::Up: return "pointerup";
            case PointerEventType::Click: return "click";
        }
        return "";
    }

    Surface::Surface(double width, double height) : viewport_({width, height}) {
        document_ = std::make_unique<Element>(this, "document");
        container_ = document_->append("windows-container");
        container_->id(CONTAINER_ID)
                .style("position", "absolute")
                .style("top", "0px")
                .style("right", "0px")
                .style("bottom", "0px")
                .style("left", "0px");
    }

    Surface::~Surface() {
        // elements report their destruction to live_elements_, so tear the tree down first
        document_.reset();
    }

    void Surface::elementCreated(const Element* element) {
        live_elements_.insert(element);
    }

    void Surface::elementDestroyed(const Element* element) {
        live_elements_.erase(element);
        if (pointer_down_target_ == element)
            pointer_down_target_ = nullptr;
    }

    bool Surface::alive(const Element* element) const {
        return element && live_elements_.contains(element);
    }

    Element* Surface::getElementById(const std::string& id) const {
        std::vector<Element*> pending{document_.get()};
        while (!pending.empty()) {
            auto e = pending.back();
            pending.pop_back();
            if (e->id() == id)
                return e;
            for (auto it = e->children().rbegin(); it != e->children().rend(); ++it)
                pending.emplace_back(it->get());
        }
        return nullptr;
    }

    void Surface::viewport(double width, double height) {
        viewport_ = {width, height};
    }

    void Surface::scrollOffset(double x, double y) {
        scroll_ = {x, y};
    }

    void Surface::measureFunction(std::function<Size(const Element& element)> measure) {
        measure_ = std::move(measure);
    }

    Size Surface::measureContent(const Element& element) const {
        if (element.html().empty())
            return {};
        return measure_ ? measure_(element) : measureWithFixedGlyphs(element);
    }

    Rect Surface::boundingClientRect(const Element& element) const {
        if (&element == document_.get())
            return {0, 0, viewport_.width, viewport_.height};
        if (!element.displayed() || !element.parent())
            return {};

        auto parent = element.parent();
        auto p = boundingClientRect(*parent);
        Rect r{};

        if (positioned(element)) {
            auto [x, w] = resolveAxis(parsePixels(element.style("left")), parsePixels(element.style("right")),
                                      parsePixels(element.style("width")), p.width, element.scrollWidth());
            auto [y, h] = resolveAxis(parsePixels(element.style("top")), parsePixels(element.style("bottom")),
                                      parsePixels(element.style("height")), p.height, element.scrollHeight());
            r = {p.x + x, p.y + y, w, h};
        } else {
            double offset = 0;
            for (auto& sibling : parent->children()) {
                if (sibling.get() == &element)
                    break;
                if (sibling->displayed() && !positioned(*sibling))
                    offset += parsePixels(sibling->style("height")).value_or(sibling->scrollHeight());
            }
            r = {p.x, p.y + offset,
                 parsePixels(element.style("width")).value_or(p.width),
                 parsePixels(element.style("height")).value_or(element.scrollHeight())};
        }

        auto translation = parseTranslate(element.style("transform"));
        r.x += translation.x;
        r.y += translation.y;
        return r;
    }

    Element* Surface::hitTestWithin(Element* element, double x, double y) const {
        // later siblings paint above earlier ones unless z-index says otherwise
        std::vector<Element*> ordered{};
        for (auto& child : element->children())
            if (child->displayed())
                ordered.emplace_back(child.get());
        std::stable_sort(ordered.begin(), ordered.end(), [](Element* a, Element* b) {
            return zIndexOf(*a) < zIndexOf(*b);
        });
        for (auto it = ordered.rbegin(); it != ordered.rend(); ++it)
            if (auto hit = hitTestWithin(*it, x, y))
                return hit;

        if (element == document_.get())
            return element;
        if (element->style("pointer-events") != "none" && boundingClientRect(*element).contains(x, y))
            return element;
        return nullptr;
    }

    Element* Surface::hitTest(double clientX, double clientY) const {
        return hitTestWithin(document_.get(), clientX, clientY);
    }

    std::string Surface::cursorAt(double clientX, double clientY) const {
        for (auto e = hitTest(clientX, clientY); e; e = e->parent()) {
            auto cursor = e->style("cursor");
            if (!cursor.empty())
                return cursor;
        }
        return "auto";
    }

    ListenerId Surface::addEventListener(PointerEventType type, EventListener listener) {
        auto id = next_listener_id_++;
        listeners_.emplace(id, std::make_pair(type, std::move(listener)));
        return id;
    }

    bool Surface::removeEventListener(ListenerId id) {
        return listeners_.erase(id) > 0;
    }

    std::vector<Element*> Surface::bubbleChain(Element* target) const {
        std::vector<Element*> chain{};
        for (auto e = target; e; e = e->parent())
            chain.emplace_back(e);
        return chain;
    }

    void Surface::dispatchToElements(PointerEvent& event) {
        // a listener may remove elements (e.g. a close button), so the path is fixed up front
        for (auto e : bubbleChain(event.target())) {
            if (event.propagationStopped())
                break;
            if (!alive(e))
                continue;
            auto listener = e->listener(event.type());
            if (!listener)
                continue;
            auto callback = *listener;
            callback(event);
        }
    }

    void Surface::dispatchToSurfaceListeners(PointerEvent& event) {
        if (event.propagationStopped())
            return;
        std::vector<ListenerId> ids{};
        for (auto& [id, entry] : listeners_)
            if (entry.first == event.type())
                ids.emplace_back(id);
        for (auto id : ids) {
            auto it = listeners_.find(id);
            if (it == listeners_.end())
                continue;
            auto callback = it->second.second;
            callback(event);
        }
    }

    bool Surface::dispatchPointerDown(double clientX, double clientY) {
        auto target = hitTest(clientX, clientY);
        PointerEvent event{PointerEventType::Down, {clientX, clientY}, {clientX + scroll_.x, clientY + scroll_.y}, target};
        pointer_down_target_ = target;
        dispatchToElements(event);
        dispatchToSurfaceListeners(event);
        return event.defaultPrevented();
    }

    bool Surface::dispatchPointerMove(double clientX, double clientY) {
        auto target = hitTest(clientX, clientY);
        PointerEvent event{PointerEventType::Move, {clientX, clientY}, {clientX + scroll_.x, clientY + scroll_.y}, target};
        dispatchToElements(event);
        dispatchToSurfaceListeners(event);
        return event.defaultPrevented();
    }

    bool Surface::dispatchPointerUp(double clientX, double clientY) {
        Point client{clientX, clientY};
        Point page{clientX + scroll_.x, clientY + scroll_.y};
        auto target = hitTest(clientX, clientY);
        PointerEvent event{PointerEventType::Up, client, page, target};
        dispatchToElements(event);
        dispatchToSurfaceListeners(event);

        // click goes to the pressed element when the release happens on it or inside it
        auto pressed = pointer_down_target_;
        pointer_down_target_ = nullptr;
        if (alive(pressed) && alive(target) && (pressed == target || pressed->isAncestorOf(target))) {
            PointerEvent click{PointerEventType::Click, client, page, pressed};
            dispatchToElements(click);
        }
        return event.defaultPrevented();
    }

}
