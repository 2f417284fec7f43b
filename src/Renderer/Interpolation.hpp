//
// Created by Philip on 9/3/2023.
//

#pragma once

#include <cmath>
#include <glm/glm.hpp>
#include "Vertex.hpp"

/**
 * Get interpolated value
 * @param input Input values
 * @param uvw Barycentric coordinates
 * @return Interpolated value
 */
template<int T> glm::vec<T,float> applyBarycentric(const glm::vec<T,float> input[3],const glm::vec3& uvw){
    return input[0] * uvw.x + input[1] * uvw.y  + input[2] * uvw.z;
}

/**
 * Correct screen space barycentric coordinates for perspective
 * @param uvw Screen space barycentric coordinates
 * @param clip_space Clip space vertex positions(homogeneous coordinates)
 * @return Barycentric coordinates that interpolate linearly in world space. Sum to 1.
 * @see https://computergraphics.stackexchange.com/questions/4079/perspective-correct-texture-mapping
 */
inline glm::vec3 perspectiveWeights(const glm::vec3& uvw, const glm::vec4 clip_space[3]){
    glm::vec3 weights = {uvw.x / clip_space[0].w, uvw.y / clip_space[1].w, uvw.z / clip_space[2].w};
    return weights / (weights.x + weights.y + weights.z);
}

/**
 * Interpolate vertex shader outputs for one pixel
 * @param vertices Vertex shader outputs of a triangle
 * @param uvw Barycentric coordinates
 * @return Fragment shader input. The normal is not renormalized.
 */
inline FragmentInput interpolate(const VertexOutput vertices[3], const glm::vec3& uvw){
    glm::vec3 positions[3] = {vertices[0].world_position,vertices[1].world_position,vertices[2].world_position};
    glm::vec3 normals[3] = {vertices[0].world_normal,vertices[1].world_normal,vertices[2].world_normal};
    glm::vec2 tex[3] = {vertices[0].tex,vertices[1].tex,vertices[2].tex};
    return FragmentInput{applyBarycentric(positions,uvw),applyBarycentric(normals,uvw),applyBarycentric(tex,uvw)};
}

/**
 * Check if a point is in a triangle
 * @param point Screen space point
 * @param positions Screen space positions
 * @param depth Output pixel depth from triangle
 * @param uvw Output barycentric coordinates
 * @return True if in triangle. Zero area triangles contain nothing.
 * @see https://codeplea.com/triangular-interpolation
 */
inline bool inTriangle(const glm::vec2& point, const glm::vec3 positions[3], float& depth, glm::vec3& uvw) {
    float determinant = (positions[1].y-positions[2].y) * (positions[0].x-positions[2].x) +
                        (positions[2].x-positions[1].x) * (positions[0].y-positions[2].y);
    if(determinant == 0.0f || !std::isfinite(determinant)) return false;
    float invDET = 1.0f/determinant;
    float w1 = ((positions[1].y-positions[2].y) * (point.x-positions[2].x) + (positions[2].x-positions[1].x) * (point.y-positions[2].y)) * invDET;
    float w2 = ((positions[2].y-positions[0].y) * (point.x-positions[2].x) + (positions[0].x-positions[2].x) * (point.y-positions[2].y)) * invDET;
    float w3 = 1.0f - w1 - w2;

    if(w1 < 0 || w2 < 0 || w3 < 0) return false;

    depth = positions[0].z * w1 +  positions[1].z * w2 + positions[2].z * w3;
    uvw = {w1,w2,w3};
    return true;
}
