//
// Created by Philip on 7/18/2023.
//

#pragma once

#include "Vertex.hpp"

/**
 * A mesh triangle
 */
struct Triangle {
    Vertex vertices[3];

    /**
     * Get the geometric normal from the winding order (counter clockwise is front)
     * @return Unit face normal. Undefined for zero area triangles.
     */
    [[nodiscard]] glm::vec3 faceNormal() const {
        glm::vec3 edge_a = vertices[1].position - vertices[0].position;
        glm::vec3 edge_b = vertices[2].position - vertices[0].position;
        return glm::normalize(glm::cross(edge_a,edge_b));
    }
};
