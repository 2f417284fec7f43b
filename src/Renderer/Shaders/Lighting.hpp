//
// Created by Philip on 9/2/2023.
//

#pragma once

#include <cmath>
#include <glm/glm.hpp>
#include "../Light.hpp"

/**
 * Phong specular exponent
 */
const float SHININESS = 32.0f;

/**
 * Point light falloff coefficients
 * @see https://learnopengl.com/Lighting/Light-casters
 */
const float ATTENUATION_CONSTANT = 1.0f;
const float ATTENUATION_LINEAR = 0.09f;
const float ATTENUATION_QUADRATIC = 0.032f;

/**
 * Separate parts of the lighting equation for one pixel
 * Ambient, diffuse and specular are not attenuated yet
 */
struct LightingTerms {
    glm::vec3 ambient;
    glm::vec3 diffuse;
    glm::vec3 specular;
    float attenuation;

    /**
     * Get the combined light
     */
    [[nodiscard]] glm::vec3 total() const {
        return (ambient + diffuse + specular) * attenuation;
    }
};

/**
 * Get the light falloff at a distance
 * @param distance Distance from the light. 0 or more.
 * @return Factor in (0,1]
 */
inline float attenuation(float distance){
    return 1.0f / (ATTENUATION_CONSTANT + ATTENUATION_LINEAR * distance + ATTENUATION_QUADRATIC * (distance * distance));
}

/**
 * Evaluate the phong model for a point light
 * @param normal Interpolated world space normal. Not normalized.
 * @param position World space pixel position
 * @param light Light to use
 * @param camera_position World space camera position
 * @return Unattenuated terms and the attenuation
 * @see https://learnopengl.com/Lighting/Basic-Lighting
 * Undefined when position is the light position
 */
inline LightingTerms computeLightingTerms(const glm::vec3& normal, const glm::vec3& position, const PointLight& light, const glm::vec3& camera_position){
    LightingTerms terms{};
    glm::vec3 unit_normal = glm::normalize(normal);

    terms.ambient = light.ambient;

    //Diffuse uses the interpolated normal as is
    glm::vec3 light_direction = glm::normalize(light.position - position);
    terms.diffuse = light.diffuse * glm::max(0.0f,glm::dot(light_direction,normal));

    glm::vec3 view_direction = glm::normalize(camera_position - position);
    glm::vec3 reflect_direction = glm::reflect(-light_direction,unit_normal);
    float specular = std::pow(glm::max(0.0f,glm::dot(view_direction,reflect_direction)),SHININESS);
    terms.specular = light.specular * specular;

    terms.attenuation = attenuation(glm::length(light.position - position));
    return terms;
}

/**
 * Evaluate the phong model for a point light
 * @see computeLightingTerms
 * @return Linear RGB light
 */
inline glm::vec3 computeLighting(const glm::vec3& normal, const glm::vec3& position, const PointLight& light, const glm::vec3& camera_position){
    return computeLightingTerms(normal,position,light,camera_position).total();
}
