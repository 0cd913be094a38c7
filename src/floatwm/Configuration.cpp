#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <choc/text/choc_JSON.h>
#include <floatwm/floatwm.hpp>

namespace floatwm {

    namespace {
        double readNumber(const choc::value::ValueView& v, double fallback) {
            if (v.isInt64()) return static_cast<double>(v.getInt64());
            if (v.isInt32()) return v.getInt32();
            if (v.isFloat64()) return v.getFloat64();
            if (v.isFloat32()) return v.getFloat32();
            return fallback;
        }

        void readString(const choc::value::ValueView& obj, const char* name, std::string& target) {
            if (obj.hasObjectMember(name) && obj[name].isString())
                target = std::string{obj[name].getString()};
        }

        void readNumber(const choc::value::ValueView& obj, const char* name, double& target) {
            if (obj.hasObjectMember(name))
                target = readNumber(obj[name], target);
        }

        WindowTheme themeFromJson(const choc::value::ValueView& j, WindowTheme theme) {
            readString(j, "header", theme.header);
            readString(j, "title", theme.title);
            readString(j, "body", theme.body);
            readString(j, "text", theme.text);
            readString(j, "footer", theme.footer);
            readString(j, "border", theme.border);
            return theme;
        }

        choc::value::Value themeToJson(const WindowTheme& theme) {
            return choc::value::createObject("WindowTheme",
                                             "header", theme.header,
                                             "title", theme.title,
                                             "body", theme.body,
                                             "text", theme.text,
                                             "footer", theme.footer,
                                             "border", theme.border);
        }
    }

    const WindowTheme& WindowManagerConfiguration::theme(const std::string& name) const {
        static const WindowTheme builtin{};
        if (auto it = themes.find(name); it != themes.end())
            return it->second;
        if (auto it = themes.find(defaultTheme); it != themes.end())
            return it->second;
        return builtin;
    }

    WindowManagerConfiguration WindowManagerConfiguration::fromJson(const std::string& json) {
        WindowManagerConfiguration config{};
        choc::value::Value parsed;
        try {
            parsed = choc::json::parse(json);
        } catch (const choc::json::ParseError& e) {
            Logger::global()->logError("Configuration: malformed JSON at %zu:%zu: %s",
                                       e.lineAndColumn.line, e.lineAndColumn.column, e.what());
            return config;
        }
        auto root = parsed.getView();
        if (!root.isObject()) {
            Logger::global()->logWarning("Configuration: top-level value is not an object; using defaults");
            return config;
        }

        if (root.hasObjectMember("stackBaseline")) {
            auto baseline = readNumber(root["stackBaseline"], config.stackBaseline);
            // leave headroom for raises above the baseline
            constexpr double maxBaseline = std::numeric_limits<int32_t>::max() / 2;
            if (baseline < 0 || baseline > maxBaseline) {
                Logger::global()->logWarning("Configuration: stackBaseline %g is out of range; clamped", baseline);
                baseline = std::clamp(baseline, 0.0, maxBaseline);
            }
            config.stackBaseline = static_cast<int32_t>(baseline);
        }
        readString(root, "templateId", config.templateId);
        readString(root, "defaultTheme", config.defaultTheme);
        readNumber(root, "minWidth", config.minWidth);
        readNumber(root, "minHeight", config.minHeight);
        readNumber(root, "moveNearOffset", config.moveNearOffset);

        if (root.hasObjectMember("themes") && root["themes"].isObject()) {
            auto themes = root["themes"];
            for (uint32_t i = 0; i < themes.size(); i++) {
                auto member = themes.getObjectMemberAt(i);
                if (!member.value.isObject()) {
                    Logger::global()->logWarning("Configuration: theme '%s' is not an object", member.name);
                    continue;
                }
                // a partial preset inherits the colors of the existing one (or the built-ins)
                config.themes[member.name] = themeFromJson(member.value, config.theme(member.name));
            }
        }
        return config;
    }

    std::string WindowManagerConfiguration::toJson() const {
        auto themesJson = choc::value::createObject("Themes");
        for (auto& [name, theme] : themes)
            themesJson.addMember(name, themeToJson(theme));

        auto j = choc::value::createObject("WindowManagerConfiguration",
                                           "stackBaseline", stackBaseline,
                                           "templateId", templateId,
                                           "defaultTheme", defaultTheme,
                                           "minWidth", minWidth,
                                           "minHeight", minHeight,
                                           "moveNearOffset", moveNearOffset,
                                           "themes", themesJson);
        return choc::json::toString(j, true);
    }

    WindowManagerConfiguration WindowManagerConfiguration::load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            Logger::global()->logInfo("Configuration: %s does not exist; using defaults", path.string().c_str());
            return {};
        }

        std::ostringstream ss;
        std::ifstream ifs{path.string()};
        ss << ifs.rdbuf();
        return fromJson(ss.str());
    }

    void WindowManagerConfiguration::save(const std::filesystem::path& path) const {
        if (path.has_parent_path() && !std::filesystem::exists(path.parent_path()))
            std::filesystem::create_directories(path.parent_path());

        std::ofstream ofs{path.string()};
        if (!ofs) {
            Logger::global()->logError("Configuration: cannot write %s", path.string().c_str());
            return;
        }
        ofs << toJson();
    }

}
