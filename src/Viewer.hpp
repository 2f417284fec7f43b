//
// Created by Philip on 9/4/2023.
//

#pragma once

#include <chrono>
#include <iostream>
#include <glm/gtc/matrix_transform.hpp>
#include "Renderer/SDL/Window.hpp"
#include "Renderer/Renderer.hpp"
#include "Renderer/Transform.hpp"

/**
 * Displays a lit model and lets the user move it
 */
class Viewer {
public:
    //settings
    static const int WIDTH = 400;
    static const int HEIGHT = 400;
    constexpr static float TURN_SPEED = 1.5f; //Radians per second
    constexpr static float MOVE_SPEED = 2.0f; //Units per second
private:
    Window window{WIDTH,HEIGHT,"Phong Viewer"};
    FrameBuffer frame_buffer{WIDTH,HEIGHT,{0,0,0,1},Renderer::CLEAR_DEPTH};
    Renderer renderer{WIDTH,HEIGHT};

    Mesh mesh;
    Texture texture = makeCheckerboard(64,8,{230,230,230},{40,90,200});
    ModelTransform model{};
    FragmentUniforms uniforms{};
    FragmentUniforms wireframe_uniforms{}; //Same light, black flat color
    bool show_wireframe;
    glm::mat4 view, projection;

    /**
     * Apply held keys to the model
     * @param delta_time Seconds since last frame
     */
    void handleInput(float delta_time){
        if(window.isKeyDown(SDL_SCANCODE_LEFT)) model.rotateY(-TURN_SPEED * delta_time);
        if(window.isKeyDown(SDL_SCANCODE_RIGHT)) model.rotateY(TURN_SPEED * delta_time);
        float step = MOVE_SPEED * delta_time;
        if(window.isKeyDown(SDL_SCANCODE_W)) model.move(0,-step);
        if(window.isKeyDown(SDL_SCANCODE_S)) model.move(0,step);
        if(window.isKeyDown(SDL_SCANCODE_A)) model.move(-step,0);
        if(window.isKeyDown(SDL_SCANCODE_D)) model.move(step,0);
    }

public:
    /**
     * Create the viewer
     * @param shading Flat or smooth normals for the model
     * @param use_texture Color the model with a checkerboard instead of a flat color
     * @param show_wireframe Draw black triangle edges over the model
     */
    Viewer(ShadingMode shading, bool use_texture, bool show_wireframe) : mesh(withShading(makeSphere(24,32),shading)), show_wireframe(show_wireframe) {
        glm::vec3 camera_position{0,0,4};
        view = glm::lookAt(camera_position,{0,0,0},{0,1,0});
        projection = glm::perspective(glm::radians(60.0f),(float)WIDTH/(float)HEIGHT,0.1f,100.0f);

        uniforms.light.position = {5,5,5};
        uniforms.light.ambient = {0.1f,0.1f,0.1f};
        uniforms.light.diffuse = {1,1,1};
        uniforms.light.specular = {1,1,1};
        uniforms.camera_position = camera_position;
        uniforms.flat_color = {1,1,1};
        uniforms.use_texture = use_texture;
        uniforms.texture = &texture;
        wireframe_uniforms = uniforms;
        wireframe_uniforms.use_texture = false;
        wireframe_uniforms.flat_color = {0,0,0};
        renderer.setBackground({0.05f,0.05f,0.08f});
    }

    /**
     * Render until the window is closed
     */
    void run(){
        auto last_frame = std::chrono::steady_clock::now();
        while(window.isOpen()){
            auto now = std::chrono::steady_clock::now();
            float delta_time = std::chrono::duration<float>(now - last_frame).count();
            last_frame = now;
            handleInput(delta_time);

            TransformSet transforms{model.getMatrix(),view,projection};
            //Edges first so the filled pass fails the depth test on them
            if(show_wireframe) renderer.queueDraw(&mesh,transforms,wireframe_uniforms,PolygonMode::LINE);
            renderer.queueDraw(&mesh,transforms,uniforms);
            renderer.getResult(frame_buffer);
            window.drawFrameBuffer(frame_buffer);
        }
    }
};
