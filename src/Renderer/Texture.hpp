//
// Created by Philip on 7/18/2023.
//

#pragma once

#include <cstdint>
#include <vector>
#include <cassert>
#include <cmath>
#include <limits>
#include <glm/glm.hpp>

/**
 * A simple 8-bit color texture
 */
class Texture {
private:
    int channels;
    int width,height;
    std::vector<uint8_t> pixels;

    /**
     * Repeat a texel coordinate into range
     */
    static int wrap(int coordinate, int size){
        return ((coordinate % size) + size) % size;
    }

    /**
     * Repeat a whole texel coordinate into range without overflowing int
     */
    static int wrap(float coordinate, int size){
        float repeated = std::fmod(coordinate,(float)size); //Exact, magnitude below size
        return wrap((int)repeated,size);
    }

    /**
     * Get a texel as normalized floats
     */
    [[nodiscard]] glm::vec3 getTexel(int x, int y) const {
        Color color = getPixel(x,y);
        return glm::vec3{(float)color.r,(float)color.g,(float)color.b} / 255.0f;
    }

public:
    /**
     * Create an empty texture
     * @param width Width in pixels
     * @param height Height in pixels
     * @param channels Channel count. At least 3(r,g,b).
     */
    Texture(int width,int height,int channels = 3) : channels(channels), width(width), height(height), pixels(channels*width*height){
        assert(channels>=3);
        assert(width > 0 && height > 0);
    }

    /**
     * Set r g b pixel
     * @param r Red
     * @param g Green
     * @param b Blue
     * @param x,y Coordinate. Must be in bounds.
     */
    void setPixel(uint8_t r,uint8_t g,uint8_t b, int x, int y){
        assert(x >= 0 && x < width);
        assert(y >= 0 && y < height);
        int offset = (y*width+x)*channels;
        pixels[offset + 0] = r;
        pixels[offset + 1] = g;
        pixels[offset + 2] = b;
    }

    /**
     * Set the alpha of a pixel
     * @param alpha Alpha value
     * @param x,y Coordinate. Must be in bounds.
     * Must have more than 3 channels
     */
    void setAlpha(uint8_t alpha, int x,int y){
        assert(x >= 0 && x < width);
        assert(y >= 0 && y < height);
        assert(channels > 3);
        pixels[(y*width+x)*channels+3] = alpha;
    }

    /**
     * Simple 8-bit color struct
     */
    struct Color {
        uint8_t r,g,b;
    };

    /**
     * Get color of pixel
     * @param x,y Coordinates. Must be in bounds.
     * @return RGB color
     */
    [[nodiscard]] Color getPixel(int x,int y) const {
        assert(x >= 0 && x < width);
        assert(y >= 0 && y < height);
        int offset = (y*width+x)*channels;
        return Color{ pixels[offset + 0], pixels[offset + 1], pixels[offset + 2]};
    }

    /**
     * Sample the texture with bilinear filtering and repeat wrapping
     * @param uv Texture coordinates. (0,0) is the top left corner of the image.
     * @return RGB in 0-1 range. Alpha is ignored. NaN for non finite uv.
     * @see https://learnopengl.com/Getting-started/Textures
     */
    [[nodiscard]] glm::vec3 sample(const glm::vec2& uv) const {
        if(!std::isfinite(uv.x) || !std::isfinite(uv.y)){
            return glm::vec3(std::numeric_limits<float>::quiet_NaN());
        }
        //Texel centers are at half coordinates
        float x = uv.x * (float)width - 0.5f;
        float y = uv.y * (float)height - 0.5f;
        float floor_x = std::floor(x);
        float floor_y = std::floor(y);
        float fraction_x = x - floor_x;
        float fraction_y = y - floor_y;

        int x0 = wrap(floor_x,width);
        int y0 = wrap(floor_y,height);
        int x1 = wrap(x0 + 1,width);
        int y1 = wrap(y0 + 1,height);

        glm::vec3 top = glm::mix(getTexel(x0,y0),getTexel(x1,y0),fraction_x);
        glm::vec3 bottom = glm::mix(getTexel(x0,y1),getTexel(x1,y1),fraction_x);
        return glm::mix(top,bottom,fraction_y);
    }

    /**
     * Get width in pixels
     */
    [[nodiscard]] int getWidth() const{
        return width;
    }

    /**
     * Get height in pixels
     */
    [[nodiscard]] int getHeight() const{
        return height;
    }

    /**
     * Get number of channels
     */
    [[nodiscard]] int getChannels() const{
        return channels;
    }
};

/**
 * Create a checkerboard texture
 * @param size Width and height in pixels
 * @param cells Number of cells along each side. Must divide size.
 * @param a,b Cell colors
 */
inline Texture makeCheckerboard(int size, int cells, Texture::Color a, Texture::Color b){
    assert(cells > 0 && size % cells == 0);
    Texture texture(size,size);
    int cell_size = size / cells;
    for (int x = 0; x < size; ++x) {
        for (int y = 0; y < size; ++y) {
            const Texture::Color& color = ((x / cell_size + y / cell_size) % 2 == 0) ? a : b;
            texture.setPixel(color.r,color.g,color.b,x,y);
        }
    }
    return texture;
}
