//
// Created by Philip on 7/18/2023.
//

#pragma once

#include <vector>
#include <cassert>
#include <cmath>
#include <glm/gtc/constants.hpp>
#include "Triangle.hpp"

/**
 * A geometric construct consisting of triangles
 */
struct Mesh {
    std::vector<Triangle> tris;
};

/**
 * How normals are distributed over a triangle
 */
enum class ShadingMode {
    FLAT, //Every vertex of a triangle uses the face normal
    SMOOTH //Vertex normals are used as is
};

/**
 * Get a copy of a mesh with normals for a shading mode
 * @param mesh Input mesh
 * @param mode Shading mode
 * @return Mesh with updated normals
 */
inline Mesh withShading(const Mesh& mesh, ShadingMode mode){
    if(mode == ShadingMode::SMOOTH) return mesh;
    Mesh flat = mesh;
    for (Triangle& triangle : flat.tris) {
        glm::vec3 face_normal = triangle.faceNormal();
        for (Vertex& vertex : triangle.vertices) {
            vertex.normal = face_normal;
        }
    }
    return flat;
}

/**
 * Create a square in the XY plane facing +Z
 * @param half_size Half of the side length
 * @return Two triangle mesh
 */
inline Mesh makeQuad(float half_size){
    const glm::vec3 normal{0,0,1};
    Vertex bottom_left{{-half_size,-half_size,0},normal,{0,1}};
    Vertex bottom_right{{half_size,-half_size,0},normal,{1,1}};
    Vertex top_right{{half_size,half_size,0},normal,{1,0}};
    Vertex top_left{{-half_size,half_size,0},normal,{0,0}};
    Mesh mesh;
    mesh.tris.push_back(Triangle{{bottom_left,bottom_right,top_right}});
    mesh.tris.push_back(Triangle{{bottom_left,top_right,top_left}});
    return mesh;
}

/**
 * Create a unit UV sphere centered at the origin
 * @param rings Latitude divisions. At least 2.
 * @param segments Longitude divisions. At least 3.
 * @return Sphere mesh with smooth normals
 */
inline Mesh makeSphere(int rings, int segments){
    assert(rings >= 2);
    assert(segments >= 3);
    auto point = [&](int ring, int segment) {
        float theta = glm::pi<float>() * (float)ring / (float)rings; //From +Y down
        float phi = glm::two_pi<float>() * (float)segment / (float)segments;
        glm::vec3 position{std::sin(theta) * std::cos(phi), std::cos(theta), -std::sin(theta) * std::sin(phi)};
        glm::vec2 uv{(float)segment / (float)segments, (float)ring / (float)rings};
        return Vertex{position,position,uv};
    };
    Mesh mesh;
    for (int ring = 0; ring < rings; ++ring) {
        for (int segment = 0; segment < segments; ++segment) {
            Vertex a = point(ring,segment);
            Vertex b = point(ring + 1,segment);
            Vertex c = point(ring + 1,segment + 1);
            Vertex d = point(ring,segment + 1);
            if(ring != 0) mesh.tris.push_back(Triangle{{a,b,d}}); //Top cap has no upper triangle
            if(ring != rings - 1) mesh.tris.push_back(Triangle{{b,c,d}});
        }
    }
    return mesh;
}
