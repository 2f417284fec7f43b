//
// Created by Philip on 7/18/2023.
//

#pragma once
#include <glm/glm.hpp>
#include <vector>
#include <cstdint>
#include <cassert>
#include <cmath>

/**
 * The final image is stored here
 */
class FrameBuffer {
private:
    int width,height;
    std::vector<glm::vec4> colors; // r,g,b,a in 0-1 range
    std::vector<float> depths;
    std::vector<uint8_t> bit_pixels; //rgba

    /**
     * Convert a 0-1 channel to 8 bits
     * NaN becomes 0
     */
    static uint8_t toByte(float channel){
        if(std::isnan(channel)) return 0;
        return (uint8_t)(glm::clamp(channel,0.0f,1.0f) * 255.0f + 0.5f);
    }
public:

    /**
     * Create a new framebuffer
     * @param width Width in pixels
     * @param height Height in pixels
     * @param color Initial pixel color. R,G,B,A
     * @param depth Initial pixel depth
     */
    FrameBuffer(int width, int height, const glm::vec4& color, float depth) : width(width), height(height), colors(width*height), depths(width*height), bit_pixels(width*height*4) {
        clear(color,depth);
    }

    /**
     * Set every pixel to the same value
     */
    void clear(const glm::vec4& color, float depth){
        for (int x = 0; x < width; ++x) {
            for (int y = 0; y < height; ++y) {
                setPixel(x,y,color,depth);
            }
        }
    }

    /**
     * Get pixel color at coordinate
     * @param x,y Coordinate. Must be in bounds.
     * @return R,G,B,A
     */
    [[nodiscard]] const glm::vec4& getColor(int x, int y) const {
        assert(x >= 0 && x < width);
        assert(y >= 0 && y < height);
        return colors[y*width+x];
    }

    /**
     * Get pixel depth at coordinate
     * @param x,y Coordinate. Must be in bounds.
     */
    [[nodiscard]] float getDepth(int x, int y) const {
        assert(x >= 0 && x < width);
        assert(y >= 0 && y < height);
        return depths[y*width+x];
    }

    /**
    * Set pixel value at coordinate
    * @param x,y Coordinate. Must be in bounds.
    * @param color R,G,B,A
    * @param depth Pixel depth
    */
    void setPixel(int x, int y, const glm::vec4& color, float depth) {
        assert(x >= 0 && x < width);
        assert(y >= 0 && y < height);
        colors[y*width+x] = color;
        depths[y*width+x] = depth;
        int offset = (y*width+x)*4;
        bit_pixels[offset + 0] = toByte(color.r);
        bit_pixels[offset + 1] = toByte(color.g);
        bit_pixels[offset + 2] = toByte(color.b);
        bit_pixels[offset + 3] = toByte(color.a);
    }

    /**
   * Set pixel value at coordinate if depth is less than current pixel
   * @param x,y Coordinate. Must be in bounds.
   * @param color R,G,B,A
   * @param depth Pixel depth
   */
    void setPixelIfDepth(int x, int y, const glm::vec4& color, float depth){
        if(depth < getDepth(x,y)){
            setPixel(x,y,color,depth);
        }
    }

    /**
     * Get width of buffer in pixels
     */
    [[nodiscard]] int getWidth() const {
        return width;
    }

    /**
     * Get height of buffer in pixels
     */
    [[nodiscard]] int getHeight() const {
        return height;
    }

    /**
     * Get pointer to raw rgba image.
     */
    [[nodiscard]] const uint8_t *getRawImage() const {
        return bit_pixels.data();
    }
};
