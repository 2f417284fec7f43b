#include <iostream>
#include <string>
#include "Viewer.hpp"

//--flat for flat shading, --texture to use a checkerboard texture, --wireframe to outline triangles
int main(int argc, char* argv[]) {
    ShadingMode shading = ShadingMode::SMOOTH;
    bool use_texture = false;
    bool show_wireframe = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if(arg == "--flat"){
            shading = ShadingMode::FLAT;
        }else if(arg == "--texture"){
            use_texture = true;
        }else if(arg == "--wireframe"){
            show_wireframe = true;
        }else{
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Usage: " << argv[0] << " [--flat] [--texture] [--wireframe]\n";
            return 1;
        }
    }

    std::cout << "Shading: " << (shading == ShadingMode::FLAT ? "flat" : "smooth") << ", color: " << (use_texture ? "texture" : "flat color") << (show_wireframe ? ", wireframe" : "") << "\n";
    std::cout << "Left/Right arrows rotate the model. W/A/S/D move it.\n";

    try {
        Viewer viewer{shading,use_texture,show_wireframe};
        viewer.run();
    } catch (const std::runtime_error& error){
        std::cerr << error.what() << "\n";
        return 1;
    }
    return 0;
}
