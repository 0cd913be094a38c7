#include "PlatformBackend.hpp"

#if defined(USE_SDL3_BACKEND)
    #include <SDL3/SDL.h>
    #include <imgui_impl_sdl3.h>
#elif defined(USE_GLFW_BACKEND)
    #include <GLFW/glfw3.h>
    #include <imgui_impl_glfw.h>
#else
    #error "floatwm-demo needs USE_SDL3_BACKEND or USE_GLFW_BACKEND"
#endif

#if defined(__APPLE__)
    #include <OpenGL/gl3.h>
#else
    #include <GL/gl.h>
#endif

#include <imgui_impl_opengl3.h>
#include <floatwm/floatwm.hpp>

namespace floatwm::demo {

#if defined(USE_SDL3_BACKEND)

struct PlatformWindow::Native {
    SDL_Window* window;
    SDL_GLContext context;
    bool quitRequested{false};
};

namespace {
    PlatformWindow::Native* createNative(const char* title, int width, int height) {
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            Logger::global()->logError("SDL3: %s", SDL_GetError());
            return nullptr;
        }
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
#ifdef __APPLE__
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
#endif
        auto window = SDL_CreateWindow(title, width, height, SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);
        auto context = window ? SDL_GL_CreateContext(window) : nullptr;
        if (!context) {
            Logger::global()->logError("SDL3: cannot create an OpenGL window: %s", SDL_GetError());
            if (window)
                SDL_DestroyWindow(window);
            SDL_Quit();
            return nullptr;
        }
        SDL_GL_MakeCurrent(window, context);
        SDL_GL_SetSwapInterval(1);
        return new PlatformWindow::Native{window, context};
    }

    void destroyNative(PlatformWindow::Native* native) {
        SDL_GL_DestroyContext(native->context);
        SDL_DestroyWindow(native->window);
        SDL_Quit();
        delete native;
    }

    bool initImGuiPlatform(PlatformWindow::Native& native) {
        return ImGui_ImplSDL3_InitForOpenGL(native.window, native.context);
    }

    void shutdownImGuiPlatform() { ImGui_ImplSDL3_Shutdown(); }
    void newPlatformFrame() { ImGui_ImplSDL3_NewFrame(); }

    bool pollNative(PlatformWindow::Native& native) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT || event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED)
                native.quitRequested = true;
        }
        return !native.quitRequested;
    }

    void windowSize(const PlatformWindow::Native& native, int* width, int* height) {
        SDL_GetWindowSize(native.window, width, height);
    }

    void drawableSize(const PlatformWindow::Native& native, int* width, int* height) {
        SDL_GetWindowSizeInPixels(native.window, width, height);
    }

    void swapBuffers(PlatformWindow::Native& native) { SDL_GL_SwapWindow(native.window); }
}

const char* PlatformWindow::backendName() { return "SDL3"; }

#else

struct PlatformWindow::Native {
    GLFWwindow* window;
};

namespace {
    PlatformWindow::Native* createNative(const char* title, int width, int height) {
        if (!glfwInit()) {
            Logger::global()->logError("GLFW: failed to initialize");
            return nullptr;
        }
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif
        auto window = glfwCreateWindow(width, height, title, nullptr, nullptr);
        if (!window) {
            Logger::global()->logError("GLFW: cannot create an OpenGL window");
            glfwTerminate();
            return nullptr;
        }
        glfwMakeContextCurrent(window);
        glfwSwapInterval(1);
        return new PlatformWindow::Native{window};
    }

    void destroyNative(PlatformWindow::Native* native) {
        glfwDestroyWindow(native->window);
        glfwTerminate();
        delete native;
    }

    // ImGui installs its own GLFW input callbacks here
    bool initImGuiPlatform(PlatformWindow::Native& native) {
        return ImGui_ImplGlfw_InitForOpenGL(native.window, true);
    }

    void shutdownImGuiPlatform() { ImGui_ImplGlfw_Shutdown(); }
    void newPlatformFrame() { ImGui_ImplGlfw_NewFrame(); }

    bool pollNative(PlatformWindow::Native& native) {
        glfwPollEvents();
        return !glfwWindowShouldClose(native.window);
    }

    void windowSize(const PlatformWindow::Native& native, int* width, int* height) {
        glfwGetWindowSize(native.window, width, height);
    }

    void drawableSize(const PlatformWindow::Native& native, int* width, int* height) {
        glfwGetFramebufferSize(native.window, width, height);
    }

    void swapBuffers(PlatformWindow::Native& native) { glfwSwapBuffers(native.window); }
}

const char* PlatformWindow::backendName() { return "GLFW"; }

#endif

PlatformWindow::~PlatformWindow() {
    close();
}

bool PlatformWindow::open(const char* title, int width, int height) {
    if (native_)
        return true;
    auto native = createNative(title, width, height);
    if (!native)
        return false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    if (!initImGuiPlatform(*native)) {
        Logger::global()->logError("%s: ImGui platform backend failed to initialize", backendName());
        ImGui::DestroyContext();
        destroyNative(native);
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init("#version 150")) {
        Logger::global()->logError("ImGui OpenGL3 renderer failed to initialize");
        shutdownImGuiPlatform();
        ImGui::DestroyContext();
        destroyNative(native);
        return false;
    }
    native_ = native;
    Logger::global()->logInfo("floatwm-demo: %s + OpenGL3, %dx%d", backendName(), width, height);
    return true;
}

void PlatformWindow::close() {
    if (!native_)
        return;
    ImGui_ImplOpenGL3_Shutdown();
    shutdownImGuiPlatform();
    ImGui::DestroyContext();
    destroyNative(native_);
    native_ = nullptr;
}

bool PlatformWindow::processEvents() {
    return native_ && pollNative(*native_);
}

void PlatformWindow::newFrame() {
    ImGui_ImplOpenGL3_NewFrame();
    newPlatformFrame();
    ImGui::NewFrame();
}

ImVec2 PlatformWindow::logicalSize() const {
    int width = 0, height = 0;
    if (native_)
        windowSize(*native_, &width, &height);
    return ImVec2(static_cast<float>(width), static_cast<float>(height));
}

void PlatformWindow::present(const ImVec4& clearColor) {
    ImGui::Render();
    int width = 0, height = 0;
    drawableSize(*native_, &width, &height);
    glViewport(0, 0, width, height);
    glClearColor(clearColor.x * clearColor.w, clearColor.y * clearColor.w, clearColor.z * clearColor.w, clearColor.w);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    swapBuffers(*native_);
}

}
