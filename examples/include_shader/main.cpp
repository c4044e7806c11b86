#include <shaderplus/workspace.hpp>

#include <fstream>
#include <iostream>

using namespace shaderplus;

static std::string readFile(const char* path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return {};

    f.seekg(0, std::ios::end);
    size_t s = f.tellg();
    f.seekg(0, std::ios::beg);
    std::string out(s, '\0');
    f.read(out.data(), s);

    return out;
}

int main()
{
    auto shaderText = readFile("shaders/my-shader.wgsl");
    auto vertexText = readFile("shaders/vertex.wgsl");
    if (shaderText.empty() || vertexText.empty())
    {
        std::cout << "Failed to read shader sources.\n";
        return 1;
    }

    auto ws = Workspace::fromMemory("shaders",
                                    {
                                        {"my-shader.wgsl", shaderText},
                                        {"vertex.wgsl", vertexText},
                                    });
    if (!ws.isOk())
    {
        std::cout << "FAIL: " << ws.error().message << "\n";
        return 1;
    }

    Workspace& workspace = ws.value();
    workspace.environment().setGlobalInteger("LIGHT_COUNT", 4);

    for (bool useTangents : {false, true})
    {
        workspace.environment().setGlobalBool("USE_TANGENTS", useTangents);

        auto r = workspace.getShader("my-shader.wgsl");
        if (!r.isOk())
        {
            std::cout << "FAIL: " << r.error().message << "\n";
            return 1;
        }

        std::cout << "USE_TANGENTS = " << (useTangents ? "true" : "false") << "\n";
        std::cout << r.value() << "\n";
    }

    return 0;
}
