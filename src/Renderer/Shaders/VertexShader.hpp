//
// Created by Philip on 7/18/2023.
//

#pragma once

#include <glm/glm.hpp>
#include "../Vertex.hpp"
#include "../Transform.hpp"

/**
 * Transforms vertices into world space and clip space
 * Bound to the transforms of one draw call. Create a new one whenever the model matrix changes.
 */
class VertexShader {
private:
    glm::mat4 model_matrix;
    glm::mat4 clip_matrix; //projection * view * model
    glm::mat3 normal_matrix; //For correcting normals
public:

    /**
     * Get the matrix that transforms normals into world space
     * @param model Model matrix. Must be invertible.
     * @return Inverse transpose of the model matrix
     * @see https://learnopengl.com/Lighting/Basic-Lighting
     */
    [[nodiscard]] static glm::mat3 normalMatrix(const glm::mat4& model){
        return glm::mat3(glm::transpose(glm::inverse(model)));
    }

    /**
     * Create a vertex shader for a draw call
     * @param transforms Model, view and projection matrices
     */
    explicit VertexShader(const TransformSet& transforms) : model_matrix(transforms.model),
    clip_matrix(transforms.projection * transforms.view * transforms.model), normal_matrix(normalMatrix(transforms.model)) {}

    /**
     * Transform a vertex from model space
     * @param vertex Model space vertex
     * @return World space position and normal plus clip space position
     * A zero length normal gives an undefined world normal
     */
    [[nodiscard]] VertexOutput run(const Vertex& vertex) const {
        VertexOutput output{};
        glm::vec4 position = {vertex.position,1.0f};
        output.world_normal = glm::normalize(normal_matrix * glm::normalize(vertex.normal));
        output.world_position = glm::vec3(model_matrix * position);
        output.clip_position = clip_matrix * position;
        output.tex = vertex.tex;
        return output;
    }
};
