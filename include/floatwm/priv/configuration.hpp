#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "stacking.hpp"

namespace floatwm {

    // Colors of a named window theme preset. Values are CSS-like color strings.
    struct WindowTheme {
        std::string header{"#3476a0"};
        std::string title{"#ffffff"};
        std::string body{"#ffffff"};
        std::string text{"#202020"};
        std::string footer{"#3476a0"};
        std::string border{"#505050"};
    };

    class WindowManagerConfiguration {
    public:
        int32_t stackBaseline{StackingRegistry::DEFAULT_BASELINE};
        std::string templateId{"window-template"};
        std::string defaultTheme{"light"};
        double minWidth{200};
        double minHeight{200};
        double moveNearOffset{15};
        std::map<std::string, WindowTheme> themes{
            {"light", WindowTheme{}},
            {"dark", WindowTheme{"#1c3d5a", "#e8e8e8", "#25272e", "#e0e0e0", "#1c3d5a", "#101014"}}
        };

        // Falls back to the default theme, then to built-in colors, for unknown names.
        const WindowTheme& theme(const std::string& name) const;

        // Members missing from the JSON keep their defaults. Malformed JSON is
        // logged and yields the defaults.
        static WindowManagerConfiguration fromJson(const std::string& json);
        std::string toJson() const;

        // A missing file yields the defaults.
        static WindowManagerConfiguration load(const std::filesystem::path& path);
        void save(const std::filesystem::path& path) const;
    };

}
