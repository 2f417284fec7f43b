//
// Created by Philip on 9/2/2023.
//

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>

/**
 * Matrices for a single draw call
 * Immutable while the draw call is running
 */
struct TransformSet {
    glm::mat4 model{1.0f}; //Object to world
    glm::mat4 view{1.0f}; //World to camera
    glm::mat4 projection{1.0f}; //Camera to clip
};

/**
 * Position, orientation and size of a model in the world
 */
class ModelTransform {
private:
    glm::vec3 translation{0,0,0};
    glm::quat rotation{1,0,0,0};
    glm::vec3 scale{1,1,1};

    glm::mat4 matrix{1.0f};

    /**
     * Rebuild the model matrix. Scale first, then rotate, then translate.
     */
    void calculateMatrix(){
        glm::mat4 translate = glm::translate(glm::mat4(1.0f),translation);
        glm::mat4 rotate = glm::mat4_cast(rotation);
        glm::mat4 scaling = glm::scale(glm::mat4(1.0f),scale);
        matrix = translate * rotate * scaling;
    }

public:
    /**
     * Move on the x and z axes
     * @param dx Translation on x
     * @param dz Translation on z
     */
    void move(float dx, float dz){
        translation += glm::vec3{dx,0,dz};
        calculateMatrix();
    }

    /**
     * Rotate around the y axis on top of the current rotation
     * @param radians Angle to rotate by
     */
    void rotateY(float radians){
        rotation = glm::angleAxis(radians,glm::vec3{0,1,0}) * rotation;
        calculateMatrix();
    }

    /**
     * Set the position
     */
    void setTranslation(const glm::vec3& new_translation){
        translation = new_translation;
        calculateMatrix();
    }

    /**
     * Set the per axis scale. Can be non uniform.
     */
    void setScale(const glm::vec3& new_scale){
        scale = new_scale;
        calculateMatrix();
    }

    [[nodiscard]] const glm::vec3& getTranslation() const {
        return translation;
    }

    [[nodiscard]] const glm::quat& getRotation() const {
        return rotation;
    }

    [[nodiscard]] const glm::vec3& getScale() const {
        return scale;
    }

    /**
     * Get the model (object to world) matrix
     */
    [[nodiscard]] const glm::mat4& getMatrix() const {
        return matrix;
    }
};
