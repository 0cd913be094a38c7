#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <sstream>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    namespace {
        std::string trim(const std::string& s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        bool isBlockTag(const std::string& tag) {
            static const char* names[] = {"br", "br/", "p", "/p", "div", "/div", "li", "/li", "tr", "/tr"};
            for (auto name : names)
                if (tag == name)
                    return true;
            return false;
        }

        void decodeEntity(const std::string& entity, std::string& out) {
            if (entity == "amp") out += '&';
            else if (entity == "lt") out += '<';
            else if (entity == "gt") out += '>';
            else if (entity == "quot") out += '"';
            else if (entity == "#39" || entity == "apos") out += '\'';
            else if (entity == "nbsp") out += ' ';
            else out += "&" + entity + ";";
        }
    }

    std::optional<double> parsePixels(const std::string& value) {
        auto s = trim(value);
        if (s.empty() || s == "auto")
            return std::nullopt;
        if (s.size() > 2 && s.compare(s.size() - 2, 2, "px") == 0)
            s.resize(s.size() - 2);
        char* end{nullptr};
        double result = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0')
            return std::nullopt;
        return result;
    }

    std::string formatPixels(double value) {
        if (value == 0)
            value = 0; // avoids "-0px"
        return std::format("{}px", value);
    }

    Point parseTranslate(const std::string& transform) {
        auto s = trim(transform);
        const std::string prefix{"translate("};
        if (s.rfind(prefix, 0) != 0 || s.back() != ')')
            return {};
        auto args = s.substr(prefix.size(), s.size() - prefix.size() - 1);
        auto comma = args.find(',');
        if (comma == std::string::npos)
            return {parsePixels(args).value_or(0), 0};
        return {parsePixels(args.substr(0, comma)).value_or(0),
                parsePixels(args.substr(comma + 1)).value_or(0)};
    }

    Element::Element(Surface* surface, std::string id) : surface_(surface), id_(std::move(id)) {
        surface_->elementCreated(this);
    }

    Element::~Element() {
        // children go first so that the surface never sees a live child of a dead parent
        children_.clear();
        surface_->elementDestroyed(this);
    }

    Element& Element::id(const std::string& newId) {
        id_ = newId;
        return *this;
    }

    std::string Element::style(const std::string& name) const {
        auto it = styles_.find(name);
        return it == styles_.end() ? std::string{} : it->second;
    }

    bool Element::hasStyle(const std::string& name) const {
        return styles_.contains(name);
    }

    Element& Element::style(const std::string& name, const std::string& value) {
        if (value.empty())
            styles_.erase(name);
        else
            styles_[name] = value;
        return *this;
    }

    Element& Element::removeStyle(const std::string& name) {
        styles_.erase(name);
        return *this;
    }

    bool Element::classed(const std::string& className) const {
        return std::find(classes_.begin(), classes_.end(), className) != classes_.end();
    }

    Element& Element::classed(const std::string& className, bool enabled) {
        auto it = std::find(classes_.begin(), classes_.end(), className);
        if (enabled && it == classes_.end())
            classes_.emplace_back(className);
        else if (!enabled && it != classes_.end())
            classes_.erase(it);
        return *this;
    }

    Element& Element::html(const std::string& content) {
        html_ = content;
        return *this;
    }

    std::string Element::textContent() const {
        std::string out;
        bool pendingSpace = false;
        auto emit = [&](char c) {
            if (pendingSpace && !out.empty() && out.back() != '\n')
                out += ' ';
            pendingSpace = false;
            out += c;
        };

        for (size_t i = 0; i < html_.size(); i++) {
            char c = html_[i];
            if (c == '<') {
                auto close = html_.find('>', i);
                if (close == std::string::npos)
                    break;
                auto tag = html_.substr(i + 1, close - i - 1);
                auto space = tag.find_first_of(" \t\r\n");
                if (space != std::string::npos)
                    tag.resize(space);
                std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                if (isBlockTag(tag) && !out.empty() && out.back() != '\n') {
                    out += '\n';
                    pendingSpace = false;
                }
                i = close;
            } else if (c == '&') {
                auto semi = html_.find(';', i);
                if (semi == std::string::npos || semi - i > 8) {
                    emit(c);
                    continue;
                }
                std::string decoded;
                decodeEntity(html_.substr(i + 1, semi - i - 1), decoded);
                for (auto d : decoded)
                    emit(d);
                i = semi;
            } else if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                pendingSpace = true;
            } else {
                emit(c);
            }
        }
        while (!out.empty() && out.back() == '\n')
            out.pop_back();
        return out;
    }

    Element* Element::select(const std::string& className) {
        for (auto& child : children_) {
            if (child->classed(className))
                return child.get();
            if (auto found = child->select(className))
                return found;
        }
        return nullptr;
    }

    Element* Element::append(const std::string& className) {
        auto child = std::make_unique<Element>(surface_);
        std::istringstream names{className};
        std::string name;
        while (names >> name)
            child->classed(name, true);
        return appendChild(std::move(child));
    }

    Element* Element::appendChild(std::unique_ptr<Element> child) {
        child->parent_ = this;
        children_.emplace_back(std::move(child));
        return children_.back().get();
    }

    std::unique_ptr<Element> Element::clone(const std::string& newId) const {
        auto copy = std::make_unique<Element>(surface_, newId);
        copy->classes_ = classes_;
        copy->styles_ = styles_;
        copy->html_ = html_;
        for (auto& child : children_)
            copy->appendChild(child->clone(child->id_));
        return copy;
    }

    std::unique_ptr<Element> Element::detachChild(Element* child) {
        auto it = std::find_if(children_.begin(), children_.end(), [child](auto& c) { return c.get() == child; });
        if (it == children_.end())
            return nullptr;
        auto owned = std::move(*it);
        children_.erase(it);
        owned->parent_ = nullptr;
        return owned;
    }

    void Element::remove() {
        if (!parent_)
            return;
        // destroys `this`; nothing may touch members afterwards
        auto self = parent_->detachChild(this);
    }

    Element& Element::on(PointerEventType type, EventListener listener) {
        if (listener)
            listeners_[type] = std::move(listener);
        else
            listeners_.erase(type);
        return *this;
    }

    bool Element::hasListener(PointerEventType type) const {
        return listeners_.contains(type);
    }

    const EventListener* Element::listener(PointerEventType type) const {
        auto it = listeners_.find(type);
        return it == listeners_.end() ? nullptr : &it->second;
    }

    bool Element::displayed() const {
        for (auto e = this; e; e = e->parent_)
            if (e->classed("window-inactive") || e->style("display") == "none")
                return false;
        return true;
    }

    bool Element::isAncestorOf(const Element* other) const {
        for (auto e = other ? other->parent_ : nullptr; e; e = e->parent_)
            if (e == this)
                return true;
        return false;
    }

    namespace {
        bool positioned(const Element& e) {
            auto position = e.style("position");
            return position == "absolute" || position == "fixed";
        }

        double flowWidth(const Element& e) {
            return parsePixels(e.style("width")).value_or(e.scrollWidth());
        }

        double flowHeight(const Element& e) {
            return parsePixels(e.style("height")).value_or(e.scrollHeight());
        }
    }

    double Element::scrollWidth() const {
        double natural = surface_->measureContent(*this).width;
        for (auto& child : children_)
            if (child->displayed() && !positioned(*child))
                natural = std::max(natural, flowWidth(*child));
        if (auto explicitWidth = parsePixels(style("width")))
            return std::max(*explicitWidth, natural);
        return natural;
    }

    double Element::scrollHeight() const {
        double natural = surface_->measureContent(*this).height;
        for (auto& child : children_)
            if (child->displayed() && !positioned(*child))
                natural += flowHeight(*child);
        if (auto explicitHeight = parsePixels(style("height")))
            return std::max(*explicitHeight, natural);
        return natural;
    }

}
