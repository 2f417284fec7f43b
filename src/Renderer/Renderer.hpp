//
// Created by Philip on 7/18/2023.
//

#pragma once

#include <vector>
#include <array>
#include <algorithm>
#include <thread>
#include <limits>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include "Texture.hpp"
#include "Shaders/FragmentShader.hpp"
#include "Shaders/VertexShader.hpp"
#include "FrameBuffer.hpp"
#include "Interpolation.hpp"
#include "Mesh.hpp"

/**
 * How triangles are filled
 */
enum class PolygonMode {
    FILL,
    LINE //Only pixels near triangle edges
};

/**
 * A Multithreading Software rasterizer
 */
class Renderer {
public:
    /**
     * Max threads for rendering
     */
    const static int MAX_THREADS = 4;

    /**
     * Depth of empty pixels
     */
    constexpr static float CLEAR_DEPTH = std::numeric_limits<float>::max();

    /**
     * Width of wireframe lines in pixels, measured inward from each edge
     */
    constexpr static float LINE_WIDTH = 1.0f;

    /**
     * Joins every started thread when it goes out of scope, including when starting a later thread throws
     */
    template<size_t N> struct ThreadJoiner {
        std::array<std::thread,N>& threads;
        ~ThreadJoiner(){
            for (std::thread& thread : threads) {
                if(thread.joinable()) thread.join();
            }
        }
    };
private:
    int width, height;
    glm::vec3 background_color{0,0,0};

    /**
     * A request to draw an object
     */
    struct DrawCall{
        const Mesh* mesh;
        TransformSet transforms;
        FragmentUniforms uniforms;
        PolygonMode mode;
        size_t start; //Start triangle in mesh
        size_t end; //End triangle(not inclusive)
    };

    /**
     * Data specific to each render thread
     */
    struct ThreadData{
        FrameBuffer frame_buffer;
        std::vector<DrawCall> tasks{};
    };

    std::vector<DrawCall> incoming_tasks{}; //Main task list
    std::vector<ThreadData> thread_data{};
    std::array<std::thread,MAX_THREADS> thread_pool{};

    /**
     * Renders draw calls
     * @param id Thread location in pool
     */
    void renderThread(int id){
        ThreadData& data = thread_data[id];
        data.frame_buffer.clear({background_color,1.0f},CLEAR_DEPTH);
        for(const DrawCall& draw_call : data.tasks){
            draw(data.frame_buffer,draw_call);
        }
        data.tasks.clear();
    }

    /**
     * Check if a triangle can be rasterized
     * @param vertices Vertex shader outputs
     * @return True if any vertex is behind the near plane
     */
    static bool cull(const VertexOutput vertices[3]){
        for (int i = 0; i < 3; ++i) {
            const glm::vec4& pos = vertices[i].clip_position;
            if(pos.w <= 0 || pos.z < -pos.w) return true;
        }
        return false;
    }

    /**
     * Rasterize a triangle to the frame buffer
     * @param vertices Vertex shader outputs of the triangle
     * @param frame_buffer Frame buffer to write to
     * @param uniforms Fragment shader inputs
     * @param mode Fill the triangle or only draw its edges
     */
    void rasterize(const VertexOutput vertices[3], FrameBuffer& frame_buffer, const FragmentUniforms& uniforms, PolygonMode mode) const {
        if(cull(vertices)) return;
        //Get screen space (x,y,depth). Y points down on screen.
        glm::vec3 screen_space[3];
        glm::vec4 clip_space[3];
        for (int i = 0; i < 3; ++i) {
            clip_space[i] = vertices[i].clip_position;
            glm::vec3 ndc = glm::vec3(clip_space[i]) / clip_space[i].w; //normalize with w
            screen_space[i] = {(ndc.x + 1.0f) * ((float)width/2.0f), (1.0f - ndc.y) * ((float)height/2.0f), ndc.z};
        }
        //get bounding box(also clamp to screen bounds)
        glm::vec2 low = glm::min(glm::min(glm::vec2(screen_space[0]),glm::vec2(screen_space[1])),glm::vec2(screen_space[2]));
        glm::vec2 high = glm::max(glm::max(glm::vec2(screen_space[0]),glm::vec2(screen_space[1])),glm::vec2(screen_space[2]));
        glm::vec2 limit = {(float)(width-1),(float)(height-1)};
        glm::ivec2 box_min = glm::ivec2(glm::clamp(glm::floor(low),glm::vec2(0,0),limit));
        glm::ivec2 box_max = glm::ivec2(glm::clamp(glm::ceil(high),glm::vec2(0,0),limit));

        //Distance from each vertex to the opposite edge, to turn barycentric coordinates into pixel distances
        glm::vec3 heights{0,0,0};
        if(mode == PolygonMode::LINE){
            glm::vec2 a(screen_space[0]), b(screen_space[1]), c(screen_space[2]);
            float double_area = std::fabs((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y));
            heights = glm::vec3{double_area / glm::length(c - b), double_area / glm::length(a - c), double_area / glm::length(b - a)};
        }

        for (int x = box_min.x; x <= box_max.x; x++) {
            for (int y = box_min.y; y <= box_max.y; y++) {
                glm::vec3 barycentric;
                float depth;
                //Sample at pixel center
                if(inTriangle({(float)x + 0.5f,(float)y + 0.5f},screen_space,depth,barycentric)) {
                    if(depth >= frame_buffer.getDepth(x,y)) continue;
                    if(mode == PolygonMode::LINE){
                        glm::vec3 edge_distance = barycentric * heights;
                        if(glm::min(glm::min(edge_distance.x,edge_distance.y),edge_distance.z) >= LINE_WIDTH) continue;
                    }
                    FragmentInput input = interpolate(vertices,perspectiveWeights(barycentric,clip_space));
                    frame_buffer.setPixel(x,y,FragmentShader::run(input,uniforms),depth);
                }
            }
        }
    }

    /**
    * Draw part of a mesh
    * @param frame_buffer Frame buffer to draw to.
    * @param draw_call Mesh range and uniforms
    */
    void draw(FrameBuffer& frame_buffer, const DrawCall& draw_call) const {
        VertexShader vertex_shader(draw_call.transforms);
        for (size_t i = draw_call.start; i < draw_call.end; ++i) {
            const Triangle& triangle = draw_call.mesh->tris[i];
            VertexOutput vertices[3];
            for (int v = 0; v < 3; ++v) {
                vertices[v] = vertex_shader.run(triangle.vertices[v]);
            }
            rasterize(vertices,frame_buffer,draw_call.uniforms,draw_call.mode);
        }
    }

    /**
     * Combine right frame buffer into the left
     * @warning Must be the same size
     */
    static void combineFrameBuffers(FrameBuffer& left, const FrameBuffer& right){
        for (int y = 0; y < left.getHeight(); ++y) {
            for (int x = 0; x < left.getWidth(); ++x) {
                left.setPixelIfDepth(x,y,right.getColor(x,y),right.getDepth(x,y));
            }
        }
    }

public:
    /**
     * Create a renderer
     * @param width,height Resolution in pixels
     */
    Renderer(int width, int height) : width(width), height(height) {
        for (int i = 0; i < MAX_THREADS; ++i) {
            thread_data.push_back(ThreadData{FrameBuffer(width,height,{background_color,1.0f},CLEAR_DEPTH)});
        }
    }

    /**
     * Set the color of pixels that nothing was drawn to
     */
    void setBackground(const glm::vec3& color){
        background_color = color;
    }

    /**
     * Draw a mesh
     * @param mesh Mesh to draw. Must stay alive until getResult.
     * @param transforms Model, view and projection matrices
     * @param uniforms Light, camera and color source. The texture must stay alive until getResult.
     * @param mode Filled triangles or wireframe
     */
    void queueDraw(const Mesh* mesh, const TransformSet& transforms, const FragmentUniforms& uniforms, PolygonMode mode = PolygonMode::FILL){
        incoming_tasks.push_back(DrawCall{mesh,transforms,uniforms,mode,0,mesh->tris.size()});
    }

    /**
     * Get the result of the render and wait for it to finish
     * @param frame_buffer Frame buffer to write the result to.
     * @throws invalid_argument Frame buffer is not the same dimensions as renderer.
     * @throws system_error A render thread could not be started. Queued draws are dropped.
     */
    void getResult(FrameBuffer& frame_buffer){
        if(frame_buffer.getWidth() != width || frame_buffer.getHeight() != height){
            throw std::invalid_argument("Frame buffer size does not match renderer");
        }
        size_t num_triangles = 0;
        for (const DrawCall& draw_call : incoming_tasks) {
            num_triangles += draw_call.end - draw_call.start;
        }

        //Spread triangles evenly over threads, splitting draw calls where needed
        size_t max_tris_per_thread = num_triangles/MAX_THREADS + 1;
        int current_thread = 0;
        size_t triangles_in_current_thread = 0;
        for (DrawCall draw_call : incoming_tasks) {
            while(draw_call.start < draw_call.end){
                size_t available = max_tris_per_thread - triangles_in_current_thread;
                DrawCall part = draw_call;
                part.end = std::min(draw_call.end,draw_call.start + available);
                thread_data[current_thread].tasks.push_back(part);
                triangles_in_current_thread += part.end - part.start;
                draw_call.start = part.end;
                if(triangles_in_current_thread == max_tris_per_thread){
                    current_thread++;
                    triangles_in_current_thread = 0;
                }
            }
        }

        try {
            ThreadJoiner<MAX_THREADS> joiner{thread_pool};
            for (int i = 0; i < MAX_THREADS; ++i) {
                thread_pool[i] = std::thread(&Renderer::renderThread,this, i);
            }
        } catch (const std::system_error&) {
            //Started threads are joined by now
            for (ThreadData& data : thread_data) {
                data.tasks.clear();
            }
            incoming_tasks.clear();
            throw;
        }

        //Combine frame buffers
        for (int i = MAX_THREADS-1; i >= 1; --i) {
            combineFrameBuffers(thread_data[i-1].frame_buffer,thread_data[i].frame_buffer);
        }
        frame_buffer = thread_data[0].frame_buffer;

        incoming_tasks.clear();
    }
};
