#pragma once

#include "pch.hpp"

class Window {
  private:
    SDL_Window *window = nullptr;
    SDL_GLContext glContext = nullptr;

  public:
    static constexpr real MAX_PIXEL_RATIO = 2.0f;

    Window() = default;

    void init(const std::string &title, ivec2 resolution) {
        if (!SDL_Init(SDL_INIT_VIDEO))
            throw std::runtime_error(std::string("Failed to initialise SDL: ") + SDL_GetError());
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK,
                            SDL_GL_CONTEXT_PROFILE_CORE);
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
        SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
        window = SDL_CreateWindow(title.c_str(), resolution.x, resolution.y,
                                  SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE |
                                      SDL_WINDOW_HIGH_PIXEL_DENSITY);
        if (!window)
            throw std::runtime_error(std::string("Failed to create window: ") + SDL_GetError());
    }

    void setContext() {
        glContext = SDL_GL_CreateContext(window);
        if (!glContext)
            throw std::runtime_error(std::string("Failed to create GL context: ") + SDL_GetError());
        SDL_GL_MakeCurrent(window, glContext);
        if (!gladLoadGL(SDL_GL_GetProcAddress))
            throw std::runtime_error("Failed to load OpenGL functions");
        SDL_GL_SetSwapInterval(1);
        glEnable(GL_DEPTH_TEST);
        glDisable(GL_CULL_FACE);
    }

    ivec2 getSize() const {
        ivec2 size(1);
        SDL_GetWindowSize(window, &size.x, &size.y);
        return size;
    }
    ivec2 getPixelSize() const {
        ivec2 size(1);
        SDL_GetWindowSizeInPixels(window, &size.x, &size.y);
        return size;
    }
    real getPixelRatio() const {
        real density = SDL_GetWindowPixelDensity(window);
        if (density <= 0.0f)
            density = 1.0f;
        return std::min(density, MAX_PIXEL_RATIO);
    }

    SDL_Window *get() const { return window; }
    SDL_GLContext getContext() const { return glContext; }

    void swapBuffer() { SDL_GL_SwapWindow(window); }

    // Blocks until the user dismisses the box.
    void alert(const std::string &title, const std::string &message) {
        if (!SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, title.c_str(), message.c_str(), window))
            std::cerr << "[ERROR] " << "Could not show message box: " << SDL_GetError() << "\n";
    }

    void shutdown() {
        if (glContext) {
            SDL_GL_DestroyContext(glContext);
            glContext = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        SDL_Quit();
    }
};
