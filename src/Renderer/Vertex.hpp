//
// Created by Philip on 9/2/2023.
//

#pragma once

#include <glm/glm.hpp>

/**
 * Model space vertex attributes
 */
struct Vertex {
    glm::vec3 position; //Model space
    glm::vec3 normal; //Model space, does not need to be normalized
    glm::vec2 tex; //UV coords. Slot is kept but nothing fills it by default.
};

/**
 * Vertex shader result
 */
struct VertexOutput {
    glm::vec4 clip_position; //Only used for rasterization
    glm::vec3 world_position;
    glm::vec3 world_normal;
    glm::vec2 tex;
};

/**
 * Vertex shader results interpolated across a triangle for one pixel
 */
struct FragmentInput {
    glm::vec3 world_position;
    glm::vec3 world_normal; //Interpolated, so usually not unit length
    glm::vec2 tex;
};
