//
// Created by Philip on 7/18/2023.
//

#pragma once
#define SDL_MAIN_HANDLED
#include <SDL2/SDL.h>
#include <string>
#include <stdexcept>
#include "../FrameBuffer.hpp"

/**
 * Simple SDL window for one window at a time
 */
class Window {
private:
    int width,height;

    SDL_Renderer *renderer = nullptr;
    SDL_Window *window = nullptr;

    SDL_Texture* frame_texture = nullptr;
public:
    /**
     * Create an SDL window
     * Do not create multiple windows
     * @param width Width of window in pixels
     * @param height Height of window in pixels
     * @param name Name of window
     * @throws runtime_error SDL could not create the window
     */
    Window(int width,int height, const std::string& name) : width(width), height(height) {
        if(SDL_Init(SDL_INIT_VIDEO) != 0){
            throw std::runtime_error(std::string("Unable to initialize SDL: ") + SDL_GetError());
        }
        if(SDL_CreateWindowAndRenderer(width, height, SDL_WINDOW_RESIZABLE, &window, &renderer) != 0){
            std::string error = SDL_GetError();
            SDL_Quit();
            throw std::runtime_error("Unable to create window: " + error);
        }
        SDL_SetWindowTitle(window, name.c_str());
        frame_texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ABGR8888, SDL_TEXTUREACCESS_STREAMING, width, height);
        SDL_RenderSetLogicalSize(renderer, width, height);
    }

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    /**
     * Draw a frame buffer to the screen
     * @param buffer Frame buffer to draw. Must be same size;
     */
    void drawFrameBuffer(const FrameBuffer& buffer){
        assert(buffer.getHeight() == height);
        assert(buffer.getWidth() == width);
        SDL_RenderClear(renderer);
        SDL_UpdateTexture(frame_texture , nullptr, buffer.getRawImage(), width * 4);
        SDL_RenderCopy(renderer, frame_texture , nullptr, nullptr);
        SDL_RenderPresent(renderer);
    }

    /**
     * Call this in the main loop to check if window is still open and poll events
     * @return True if open
     */
    bool isOpen() {
        SDL_Event event;
        while(SDL_PollEvent(&event)){
            if(event.type == SDL_QUIT) return false;
        };
        return true;
    }

    /**
     * Check if a key is held. Updated by isOpen.
     */
    [[nodiscard]] bool isKeyDown(SDL_Scancode key) const {
        return SDL_GetKeyboardState(nullptr)[key] != 0;
    }

    /**
     * Close SDL
     */
    ~Window(){
        SDL_DestroyTexture(frame_texture);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
    }
};
