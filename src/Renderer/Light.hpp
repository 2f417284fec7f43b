//
// Created by Philip on 9/2/2023.
//

#pragma once

#include <glm/glm.hpp>

/**
 * A single point light
 */
struct PointLight {
    glm::vec3 position{0,0,0}; //World space
    glm::vec3 ambient{0,0,0}; //Ia
    glm::vec3 diffuse{1,1,1}; //Id
    glm::vec3 specular{1,1,1}; //Is
};
