#ifndef SHADER_H
#define SHADER_H

#include <stdexcept>
#include <string>

#include <glad/glad.h>

class ShaderError : public std::runtime_error {
public:
    explicit ShaderError(const std::string& what) : std::runtime_error(what) {}
};

// Linked GL program built from source files. Construction throws ShaderError on a missing
// file, compile error or link error.
class Shader {
public:
    Shader(const std::string& vertexPath, const std::string& fragmentPath);
    explicit Shader(const std::string& computePath);
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    void use() const;

    static std::string ReadFileToString(const std::string& path);

    GLuint getID() const { return ID; }

private:
    GLuint ID = 0;
};

#endif
