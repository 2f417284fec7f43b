//
// Created by Philip on 7/18/2023.
//

#pragma once

#include <cassert>
#include <glm/glm.hpp>
#include "Lighting.hpp"
#include "../Texture.hpp"
#include "../Vertex.hpp"

/**
 * Display gamma
 */
const float GAMMA = 2.2f;

/**
 * Convert display color to linear
 */
inline glm::vec3 decodeGamma(const glm::vec3& color){
    return glm::pow(color,glm::vec3(GAMMA));
}

/**
 * Convert linear color to display
 */
inline glm::vec3 encodeGamma(const glm::vec3& color){
    return glm::pow(color,glm::vec3(1.0f / GAMMA));
}

/**
 * Per draw call inputs of the fragment shader
 */
struct FragmentUniforms {
    PointLight light{};
    glm::vec3 camera_position{0,0,0};
    bool use_texture = false; //Use texture instead of flat color
    glm::vec3 flat_color{1,1,1};
    const Texture* texture = nullptr; //Must be set if use_texture
};

/**
 * Shade pixels
 */
class FragmentShader {
public:
    /**
     * Pick the surface color
     * @param uv Pixel uv
     * @param uniforms Draw call inputs
     * @return Texture color if enabled, otherwise the flat color. Display space.
     */
    static glm::vec3 baseColor(const glm::vec2& uv, const FragmentUniforms& uniforms){
        if(uniforms.use_texture){
            assert(uniforms.texture != nullptr);
            return uniforms.texture->sample(uv);
        }
        return uniforms.flat_color;
    }

    /**
     * Light a color in linear space
     * @param base Display space color
     * @param lighting Linear light
     * @return Opaque display space color
     */
    static glm::vec4 composeColor(const glm::vec3& base, const glm::vec3& lighting){
        glm::vec3 shaded = decodeGamma(base) * lighting;
        return {encodeGamma(shaded),1.0f};
    }

    /**
     * Run the fragment shader
     * @param input Interpolated vertex shader outputs
     * @param uniforms Draw call inputs
     * @return RGBA. Alpha is always 1.
     */
    static glm::vec4 run(const FragmentInput& input, const FragmentUniforms& uniforms){
        glm::vec3 lighting = computeLighting(input.world_normal,input.world_position,uniforms.light,uniforms.camera_position);
        return composeColor(baseColor(input.tex,uniforms),lighting);
    }
};
