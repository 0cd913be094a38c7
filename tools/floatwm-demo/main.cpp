#include <algorithm>
#include <format>
#include <iostream>
#include <memory>
#include <vector>

#include <cxxopts.hpp>
#include <cpptrace/from_current.hpp>
#include <imgui.h>

#include <floatwm/floatwm.hpp>
#include <floatwm-gui/floatwm-gui.hpp>
#include "ImGuiApp.hpp"

using namespace floatwm;

namespace {

const char* LOREM = "<p>Lorem ipsum dolor sit amet, consectetur adipiscing elit. Sed justo mauris, porttitor sed nibh non, "
    "interdum aliquet tellus. Duis eget est lectus. In ultrices finibus semper. Nullam dictum, tortor non placerat "
    "convallis, nibh diam sagittis risus, non ultricies diam nisi nec neque. Phasellus dapibus convallis metus. "
    "Proin cursus, metus quis ullamcorper suscipit, neque mauris dictum ex, a mattis velit lorem ac erat. "
    "Pellentesque habitant morbi tristique senectus et netus et malesuada fames ac turpis egestas.</p>";

class DemoApp {
    WindowManagerConfiguration config_;
    Surface surface_;
    WindowManager manager_;
    gui::SurfaceRenderer renderer_;
    gui::SurfaceInputBridge input_{};
    // declared after the manager so that windows go away first
    std::vector<std::unique_ptr<Window>> windows_{};
    int created_{0};
    int theme_index_{0};

    Window& adopt(std::unique_ptr<Window> window) {
        windows_.emplace_back(std::move(window));
        return *windows_.back();
    }

    void pruneClosed() {
        windows_.erase(std::remove_if(windows_.begin(), windows_.end(),
                                      [](auto& w) { return w->closed(); }),
                       windows_.end());
    }

    void populate() {
        auto& plain = adopt(manager_.createWindow());
        plain.setList({{"width", "300px"}, {"height", "300px"}, {"top", "100px"}, {"left", "10px"},
                       {"title", "This is a very, very, very, very long title indeed"}});
        plain.show();
        plain.body()->html(LOREM);
        plain.sizeToContent();

        auto& draggable = adopt(manager_.createDraggableWindow());
        draggable.setList({{"width", "300px"}, {"height", "300px"}, {"top", "100px"}, {"left", "350px"},
                           {"title", "Draggable Window"}});
        draggable.show();
        draggable.body()->html(LOREM);
        draggable.sizeToContent();

        auto& resizable = adopt(manager_.createResizableWindow());
        resizable.setList({{"width", "300px"}, {"height", "300px"}, {"top", "100px"}, {"left", "700px"},
                           {"title", "Resizable Window"}});
        resizable.showFooter();
        resizable.show();
        resizable.body()->html(LOREM);
        resizable.sizeToContent();
    }

    void spawnNear(const PointerEvent& event) {
        auto& window = adopt(manager_.createDraggableWindow());
        window.setList({{"width", "220px"}, {"height", "120px"}, {"title", std::format("Note {}", ++created_)}});
        window.body()->html(std::format("<p>Opened at {:.0f}, {:.0f}</p>", event.clientX(), event.clientY()));
        window.show();
        window.moveNear(event);
    }

    void controlPanel() {
        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
        ImGui::Begin("floatwm");

        if (ImGui::Button("Plain")) {
            auto& w = adopt(manager_.createWindow());
            w.setList({{"width", "260px"}, {"height", "160px"}, {"top", "420px"}, {"left", "20px"},
                       {"title", std::format("Window {}", ++created_)}});
            w.show();
        }
        ImGui::SameLine();
        if (ImGui::Button("Draggable")) {
            auto& w = adopt(manager_.createDraggableWindow());
            w.setList({{"width", "260px"}, {"height", "160px"}, {"top", "420px"}, {"left", "300px"},
                       {"title", std::format("Draggable {}", ++created_)}});
            w.show();
        }
        ImGui::SameLine();
        if (ImGui::Button("Resizable")) {
            auto& w = adopt(manager_.createResizableWindow());
            w.setList({{"width", "260px"}, {"height", "220px"}, {"top", "420px"}, {"left", "580px"},
                       {"title", std::format("Resizable {}", ++created_)}});
            w.showFooter();
            w.show();
        }

        std::vector<const char*> themeNames;
        for (auto& [name, theme] : config_.themes)
            themeNames.emplace_back(name.c_str());
        if (!themeNames.empty() && ImGui::Combo("Theme", &theme_index_, themeNames.data(), static_cast<int>(themeNames.size()))) {
            for (auto& w : windows_)
                w->setTheme(themeNames[theme_index_]);
        }

        ImGui::Separator();
        auto topmost = manager_.topmostVisibleWindow();
        for (auto& w : windows_) {
            ImGui::PushID(w->id().c_str());
            bool visible = !w->hidden();
            if (ImGui::Checkbox("##visible", &visible))
                visible ? w->show() : w->hide();
            ImGui::SameLine();
            ImGui::Text("%s%s (z %d)", w->title().c_str(),
                        w.get() == topmost ? " *" : "", w->stackOrder());
            ImGui::SameLine();
            if (ImGui::SmallButton("front"))
                w->bringToFront();
            ImGui::SameLine();
            if (ImGui::SmallButton("close"))
                w->close();
            ImGui::PopID();
        }
        ImGui::TextDisabled("Right-click the desktop to open a note.");
        ImGui::End();
    }

public:
    DemoApp(WindowManagerConfiguration config, double width, double height)
        : config_(std::move(config)),
          surface_(width, height),
          manager_(surface_, config_),
          renderer_(manager_.configuration()) {
    }

    bool init() {
        gui::SurfaceRenderer::installTextMeasurer(surface_);
        populate();
        return true;
    }

    bool frame(int width, int height) {
        surface_.viewport(width, height);

        auto& io = ImGui::GetIO();
        if (!io.WantCaptureMouse && ImGui::IsMouseClicked(ImGuiMouseButton_Right)
            && !surface_.container()->isAncestorOf(surface_.hitTest(io.MousePos.x, io.MousePos.y))) {
            PointerEvent event{PointerEventType::Click, {io.MousePos.x, io.MousePos.y},
                               {io.MousePos.x, io.MousePos.y}, surface_.container()};
            spawnNear(event);
        }

        input_.update(surface_, ImVec2(0, 0));
        pruneClosed();

        renderer_.render(surface_, ImGui::GetBackgroundDrawList(), ImVec2(0, 0));
        controlPanel();
        pruneClosed();
        return true;
    }

    void shutdown() {
        windows_.clear();
    }
};

int runMain(int argc, char** argv) {
    cxxopts::Options options("floatwm-demo", "floating windows on an ImGui desktop");
    options.add_options()
        ("h,help", "print this help message")
        ("c,config", "Window manager configuration JSON file", cxxopts::value<std::string>())
        ("w,width", "Initial window width", cxxopts::value<int>()->default_value("1100"))
        ("height", "Initial window height", cxxopts::value<int>()->default_value("700"))
        ("save-config", "Write the effective configuration to the given file and exit", cxxopts::value<std::string>())
        ("v,verbose", "Echo diagnostic messages (drag and resize traces) to stderr")
    ;
    auto parsedOpts = options.parse(argc, argv);
    if (parsedOpts.contains("h")) {
        std::cerr << options.help();
        return EXIT_SUCCESS;
    }
    if (parsedOpts.contains("verbose"))
        Logger::global()->stderrLevel(Logger::DIAGNOSTIC);

    auto config = parsedOpts.contains("config")
        ? WindowManagerConfiguration::load(parsedOpts["config"].as<std::string>())
        : WindowManagerConfiguration{};
    if (parsedOpts.contains("save-config")) {
        config.save(parsedOpts["save-config"].as<std::string>());
        return EXIT_SUCCESS;
    }

    demo::ImGuiAppConfig appConfig{};
    appConfig.windowTitle = "floatwm demo";
    appConfig.windowWidth = parsedOpts["width"].as<int>();
    appConfig.windowHeight = parsedOpts["height"].as<int>();

    DemoApp app{config, static_cast<double>(appConfig.windowWidth), static_cast<double>(appConfig.windowHeight)};
    return demo::ImGuiApp::run(appConfig,
        [&] { return app.init(); },
        [&](int width, int height) { return app.frame(width, height); },
        [&] { app.shutdown(); });
}

}

int main(int argc, char** argv) {
    int result;
    CPPTRACE_TRY {
        result = runMain(argc, argv);
    } CPPTRACE_CATCH(const std::exception& e) {
        std::cerr << "Exception in floatwm-demo: " << e.what() << std::endl;
        cpptrace::from_current_exception().print();
        result = EXIT_FAILURE;
    }
    Logger::stopDefaultLogger();
    return result;
}
