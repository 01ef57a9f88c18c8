#pragma once

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_opengl3.h>
#include "pch.hpp"

// Dear ImGui host: owns the context and both backends. Widgets are emitted
// by systems between beginFrame() and endFrame().
class Panel {
  private:
    bool ready = false;

  public:
    Panel() = default;

    void init(SDL_Window *window, SDL_GLContext context) {
        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::GetIO().IniFilename = nullptr;
        ImGui::StyleColorsDark();
        ImGui_ImplSDL3_InitForOpenGL(window, context);
        ImGui_ImplOpenGL3_Init("#version 330 core");
        ready = true;
    }

    void processEvent(const SDL_Event &event) {
        if (ready)
            ImGui_ImplSDL3_ProcessEvent(&event);
    }

    // True when the panel consumes the event and the scene must not see it.
    bool captures(const SDL_Event &event) const {
        if (!ready)
            return false;
        const ImGuiIO &io = ImGui::GetIO();
        switch (event.type) {
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
        case SDL_EVENT_MOUSE_WHEEL:
            return io.WantCaptureMouse;
        case SDL_EVENT_KEY_DOWN:
        case SDL_EVENT_KEY_UP:
        case SDL_EVENT_TEXT_INPUT:
            return io.WantCaptureKeyboard;
        default:
            return false;
        }
    }

    void beginFrame() {
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();
    }

    void endFrame() {
        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    }

    void shutdown() {
        if (!ready)
            return;
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        ready = false;
    }
};
