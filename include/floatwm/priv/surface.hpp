#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "common.hpp"

namespace floatwm {

    class Element;
    class Surface;

    enum class PointerEventType {
        Down,
        Move,
        Up,
        Click
    };

    const char* pointerEventTypeName(PointerEventType type);

    // A pointer event delivered by the host surface.
    // `client` coordinates are relative to the viewport, `page` coordinates
    // additionally include the surface scroll offset.
    class PointerEvent {
        PointerEventType type_;
        Point client_;
        Point page_;
        Element* target_;
        bool default_prevented_{false};
        bool propagation_stopped_{false};

    public:
        PointerEvent(PointerEventType type, Point client, Point page, Element* target)
            : type_(type), client_(client), page_(page), target_(target) {}

        PointerEventType type() const { return type_; }
        double clientX() const { return client_.x; }
        double clientY() const { return client_.y; }
        double pageX() const { return page_.x; }
        double pageY() const { return page_.y; }
        Element* target() const { return target_; }

        void preventDefault() { default_prevented_ = true; }
        bool defaultPrevented() const { return default_prevented_; }
        void stopPropagation() { propagation_stopped_ = true; }
        bool propagationStopped() const { return propagation_stopped_; }
    };

    using EventListener = std::function<void(PointerEvent& event)>;
    using ListenerId = uint64_t;

    // A node of the retained surface tree. Holds an open-ended inline style map
    // (CSS-like key/value strings), a class list, HTML-bearing content and at most
    // one listener per pointer event type.
    class Element {
        friend class Surface;

        Surface* surface_;
        Element* parent_{nullptr};
        std::string id_;
        std::vector<std::string> classes_{};
        std::map<std::string, std::string> styles_{};
        std::string html_{};
        std::vector<std::unique_ptr<Element>> children_{};
        std::map<PointerEventType, EventListener> listeners_{};

    public:
        Element(Surface* surface, std::string id = {});
        ~Element();

        Element(const Element&) = delete;
        Element& operator=(const Element&) = delete;

        Surface* surface() const { return surface_; }
        Element* parent() const { return parent_; }
        const std::string& id() const { return id_; }
        Element& id(const std::string& newId);

        // Inline style. An unset property reads as an empty string, and setting an
        // empty value removes the property.
        std::string style(const std::string& name) const;
        bool hasStyle(const std::string& name) const;
        Element& style(const std::string& name, const std::string& value);
        Element& removeStyle(const std::string& name);
        const std::map<std::string, std::string>& styles() const { return styles_; }

        bool classed(const std::string& className) const;
        Element& classed(const std::string& className, bool enabled);
        const std::vector<std::string>& classList() const { return classes_; }

        const std::string& html() const { return html_; }
        Element& html(const std::string& content);
        // `html()` with markup removed and the common entities decoded.
        std::string textContent() const;

        const std::vector<std::unique_ptr<Element>>& children() const { return children_; }
        // First descendant (depth-first, document order) carrying `className`.
        Element* select(const std::string& className);
        Element* append(const std::string& className);
        Element* appendChild(std::unique_ptr<Element> child);
        // Deep copy of this element and its descendants, detached from the tree.
        // Listeners are not copied.
        std::unique_ptr<Element> clone(const std::string& newId) const;
        // Detaches this element from its parent and destroys it.
        void remove();

        // Registers the listener for `type`, replacing any previous one.
        // Passing nullptr removes it.
        Element& on(PointerEventType type, EventListener listener);
        bool hasListener(PointerEventType type) const;
        const EventListener* listener(PointerEventType type) const;

        // Hidden elements (class `window-inactive` on self or an ancestor) are not laid out.
        bool displayed() const;
        bool isAncestorOf(const Element* other) const;

        // Natural size of the content, never less than an explicit px size.
        double scrollWidth() const;
        double scrollHeight() const;

    private:
        std::unique_ptr<Element> detachChild(Element* child);
    };

    // The host surface: a viewport holding the document tree, the windows
    // container and window templates, answering layout queries and turning
    // host pointer input into element and surface-level events.
    class Surface {
        std::unique_ptr<Element> document_;
        Element* container_{nullptr};
        Size viewport_;
        Point scroll_{};
        std::function<Size(const Element& element)> measure_;
        std::map<ListenerId, std::pair<PointerEventType, EventListener>> listeners_{};
        ListenerId next_listener_id_{1};
        std::unordered_set<const Element*> live_elements_{};
        Element* pointer_down_target_{nullptr};

        friend class Element;
        void elementCreated(const Element* element);
        void elementDestroyed(const Element* element);

        std::vector<Element*> bubbleChain(Element* target) const;
        void dispatchToElements(PointerEvent& event);
        void dispatchToSurfaceListeners(PointerEvent& event);
        Element* hitTestWithin(Element* element, double x, double y) const;

    public:
        static constexpr const char* CONTAINER_ID = "windows";

        Surface(double width, double height);
        ~Surface();

        Element* document() const { return document_.get(); }
        Element* container() const { return container_; }
        Element* getElementById(const std::string& id) const;
        bool alive(const Element* element) const;

        Size viewport() const { return viewport_; }
        void viewport(double width, double height);
        Point scrollOffset() const { return scroll_; }
        void scrollOffset(double x, double y);

        // Content measurement used for natural sizes. The default one uses fixed glyph metrics.
        void measureFunction(std::function<Size(const Element& element)> measure);
        Size measureContent(const Element& element) const;

        // Viewport-relative layout box of the element.
        Rect boundingClientRect(const Element& element) const;
        // Topmost displayed element at the viewport position. Elements styled
        // `pointer-events: none` are transparent to hits; their children are not.
        Element* hitTest(double clientX, double clientY) const;
        // Effective `cursor` style at the viewport position.
        std::string cursorAt(double clientX, double clientY) const;

        // Surface-level listeners receive every event of their type after element bubbling.
        ListenerId addEventListener(PointerEventType type, EventListener listener);
        bool removeEventListener(ListenerId id);
        size_t listenerCount() const { return listeners_.size(); }

        // Host input entry points. Returns whether any listener called preventDefault().
        bool dispatchPointerDown(double clientX, double clientY);
        bool dispatchPointerMove(double clientX, double clientY);
        bool dispatchPointerUp(double clientX, double clientY);
    };

    // Parses "12px", "12" or "12.5px". Returns nullopt for "auto", empty and anything else.
    std::optional<double> parsePixels(const std::string& value);
    std::string formatPixels(double value);
    // Parses "translate(Xpx, Ypx)"; anything else is treated as no translation.
    Point parseTranslate(const std::string& transform);

}
