#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <vector>
#include <floatwm-gui/floatwm-gui.hpp>

namespace floatwm::gui {

namespace {
constexpr float kTextPadding = 6.0f;
constexpr float kCloseGlyphInset = 4.0f;

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

ImVec2 toScreen(const Rect& r, ImVec2 origin) {
    return ImVec2(origin.x + static_cast<float>(r.x), origin.y + static_cast<float>(r.y));
}

ImVec2 toScreenMax(const Rect& r, ImVec2 origin) {
    return ImVec2(origin.x + static_cast<float>(r.right()), origin.y + static_cast<float>(r.bottom()));
}
}

ImU32 parseColor(const std::string& color, ImU32 fallback) {
    static const std::map<std::string, ImU32> named{
        {"black", IM_COL32(0, 0, 0, 255)},
        {"white", IM_COL32(255, 255, 255, 255)},
        {"red", IM_COL32(255, 0, 0, 255)},
        {"green", IM_COL32(0, 128, 0, 255)},
        {"blue", IM_COL32(0, 0, 255, 255)},
        {"gray", IM_COL32(128, 128, 128, 255)},
        {"grey", IM_COL32(128, 128, 128, 255)},
        {"orange", IM_COL32(255, 165, 0, 255)},
        {"transparent", IM_COL32(0, 0, 0, 0)},
    };

    if (color.empty())
        return fallback;
    if (auto it = named.find(color); it != named.end())
        return it->second;

    if (color[0] == '#') {
        std::vector<int> digits;
        for (size_t i = 1; i < color.size(); i++) {
            auto d = hexDigit(color[i]);
            if (d < 0)
                return fallback;
            digits.push_back(d);
        }
        if (digits.size() == 3)
            return IM_COL32(digits[0] * 17, digits[1] * 17, digits[2] * 17, 255);
        if (digits.size() == 6 || digits.size() == 8) {
            int c[4]{0, 0, 0, 255};
            for (size_t i = 0; i < digits.size() / 2; i++)
                c[i] = digits[i * 2] * 16 + digits[i * 2 + 1];
            return IM_COL32(c[0], c[1], c[2], c[3]);
        }
        return fallback;
    }

    auto open = color.find('(');
    auto close = color.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open)
        return fallback;
    auto fn = color.substr(0, open);
    if (fn != "rgb" && fn != "rgba")
        return fallback;
    std::vector<double> parts;
    const char* p = color.c_str() + open + 1;
    const char* end = color.c_str() + close;
    while (p < end) {
        char* next{nullptr};
        double v = std::strtod(p, &next);
        if (next == p)
            return fallback;
        parts.push_back(v);
        p = next;
        while (p < end && (*p == ',' || *p == ' '))
            p++;
    }
    if (parts.size() < 3)
        return fallback;
    auto channel = [](double v) { return static_cast<int>(std::clamp(v, 0.0, 255.0)); };
    int alpha = parts.size() > 3 ? static_cast<int>(std::clamp(parts[3], 0.0, 1.0) * 255) : 255;
    return IM_COL32(channel(parts[0]), channel(parts[1]), channel(parts[2]), alpha);
}

void SurfaceRenderer::installTextMeasurer(Surface& surface) {
    surface.measureFunction([](const Element& element) {
        auto text = element.textContent();
        if (text.empty())
            return Size{};
        auto maxWidth = parsePixels(element.style("max-width"));
        auto size = ImGui::CalcTextSize(text.c_str(), nullptr, false, maxWidth ? static_cast<float>(*maxWidth) : -1.0f);
        return Size{size.x, size.y};
    });
}

void SurfaceRenderer::render(Surface& surface, ImDrawList* drawList, ImVec2 origin) {
    std::vector<Element*> windows;
    for (auto& child : surface.container()->children())
        if (child->displayed())
            windows.push_back(child.get());
    std::stable_sort(windows.begin(), windows.end(), [](Element* a, Element* b) {
        return parsePixels(a->style("z-index")).value_or(0) < parsePixels(b->style("z-index")).value_or(0);
    });

    for (auto window : windows)
        renderWindow(surface, *window, drawList, origin);
}

void SurfaceRenderer::renderWindow(Surface& surface, Element& window, ImDrawList* drawList, ImVec2 origin) {
    auto contents = window.select("window-contents");
    const auto& theme = config_.theme(Window::themeNameOf(contents));
    auto rounding = contents ? static_cast<float>(parsePixels(contents->style("border-radius")).value_or(0)) : 0.0f;

    auto bounds = surface.boundingClientRect(window);
    auto min = toScreen(bounds, origin);
    auto max = toScreenMax(bounds, origin);
    auto font = ImGui::GetFont();
    auto fontSize = ImGui::GetFontSize();

    drawList->PushClipRect(ImVec2(min.x - 1, min.y - 1), ImVec2(max.x + 1, max.y + 1), true);

    auto bodyColor = parseColor(window.style("background-color"), parseColor(theme.body, IM_COL32_WHITE));
    drawList->AddRectFilled(min, max, bodyColor, rounding);

    if (auto header = window.select("window-header"); header && header->displayed()) {
        auto r = surface.boundingClientRect(*header);
        auto headerColor = parseColor(header->style("background-color"), parseColor(theme.header, IM_COL32_BLACK));
        drawList->AddRectFilled(toScreen(r, origin), toScreenMax(r, origin), headerColor, rounding, ImDrawFlags_RoundCornersTop);

        auto titleColor = parseColor(theme.title, IM_COL32_WHITE);
        if (auto title = header->select("window-title")) {
            auto text = title->textContent();
            auto pos = toScreen(r, origin);
            pos.x += kTextPadding;
            pos.y += (static_cast<float>(r.height) - fontSize) / 2;
            ImVec4 clip(pos.x, pos.y, toScreenMax(r, origin).x - 24.0f, pos.y + fontSize);
            drawList->AddText(font, fontSize, pos, titleColor, text.c_str(), nullptr, 0.0f, &clip);
        }
        if (auto closeButton = header->select("window-close-button"); closeButton && closeButton->displayed()) {
            auto c = surface.boundingClientRect(*closeButton);
            auto a = toScreen(c, origin);
            auto b = toScreenMax(c, origin);
            drawList->AddLine(ImVec2(a.x + kCloseGlyphInset, a.y + kCloseGlyphInset),
                              ImVec2(b.x - kCloseGlyphInset, b.y - kCloseGlyphInset), titleColor, 2.0f);
            drawList->AddLine(ImVec2(b.x - kCloseGlyphInset, a.y + kCloseGlyphInset),
                              ImVec2(a.x + kCloseGlyphInset, b.y - kCloseGlyphInset), titleColor, 2.0f);
        }
    }

    if (auto body = window.select("window-body")) {
        auto r = surface.boundingClientRect(*body);
        auto text = body->textContent();
        auto wrap = parsePixels(body->style("max-width")).value_or(r.width);
        drawList->AddText(font, fontSize, toScreen(r, origin), parseColor(theme.text, IM_COL32_BLACK),
                          text.c_str(), nullptr, static_cast<float>(wrap));
    }

    if (auto footer = window.select("window-footer"); footer && footer->displayed()) {
        auto r = surface.boundingClientRect(*footer);
        auto footerColor = parseColor(footer->style("background-color"), parseColor(theme.footer, IM_COL32_BLACK));
        drawList->AddRectFilled(toScreen(r, origin), toScreenMax(r, origin), footerColor, rounding, ImDrawFlags_RoundCornersBottom);
    }

    drawList->AddRect(min, max, parseColor(theme.border, IM_COL32(80, 80, 80, 255)), rounding);

    // grip for resizable windows
    if (window.select("rsz-bottom-right")) {
        auto gripColor = parseColor(theme.border, IM_COL32(80, 80, 80, 255));
        drawList->AddTriangleFilled(ImVec2(max.x - 2, max.y - 12), ImVec2(max.x - 2, max.y - 2),
                                    ImVec2(max.x - 12, max.y - 2), gripColor);
    }

    drawList->PopClipRect();
}

void SurfaceInputBridge::update(Surface& surface, ImVec2 origin) {
    auto& io = ImGui::GetIO();
    auto pos = io.MousePos;
    if (!ImGui::IsMousePosValid(&pos))
        return;

    double x = pos.x - origin.x;
    double y = pos.y - origin.y;
    // ImGui windows are drawn over the surface and keep their own input
    bool overImGui = io.WantCaptureMouse && !pressed_;

    if (!pressed_ && !overImGui && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        surface.dispatchPointerDown(x, y);
        pressed_ = true;
    }
    if (pos.x != last_position_.x || pos.y != last_position_.y) {
        surface.dispatchPointerMove(x, y);
        last_position_ = pos;
    }
    if (pressed_ && ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
        surface.dispatchPointerUp(x, y);
        pressed_ = false;
    }

    if (overImGui)
        return;
    auto cursor = surface.cursorAt(x, y);
    if (cursor == "grab" || cursor == "grabbing" || cursor == "pointer")
        ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
    else if (cursor == "ns-resize")
        ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeNS);
    else if (cursor == "ew-resize")
        ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeEW);
    else if (cursor == "nwse-resize")
        ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeNWSE);
    else if (cursor == "nesw-resize")
        ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeNESW);
}

}
