#include "Shader.h"

#include <vector>
#include <iostream>
#include <fstream>
#include <sstream>

static std::string infoLog(GLuint object, bool isProgram)
{
    GLint len = 0;
    if (isProgram) glGetProgramiv(object, GL_INFO_LOG_LENGTH, &len);
    else glGetShaderiv(object, GL_INFO_LOG_LENGTH, &len);

    std::vector<char> log(len > 1 ? len : 1, '\0');
    if (isProgram) glGetProgramInfoLog(object, (GLsizei)log.size(), nullptr, log.data());
    else glGetShaderInfoLog(object, (GLsizei)log.size(), nullptr, log.data());
    return std::string(log.data());
}

static GLuint compileStage(GLenum type, const std::string& path)
{
    const std::string source = Shader::ReadFileToString(path);
    const char* src = source.c_str();

    GLuint sh = glCreateShader(type);
    glShaderSource(sh, 1, &src, nullptr);
    glCompileShader(sh);

    GLint ok = 0;
    glGetShaderiv(sh, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        const std::string log = infoLog(sh, false);
        glDeleteShader(sh);
        std::cerr << "[Shader] Compile failed (" << path << "):\n" << log << "\n";
        throw ShaderError("compile failed: " + path);
    }
    return sh;
}

static GLuint linkProgram(const std::vector<GLuint>& stages, const std::string& label)
{
    GLuint prog = glCreateProgram();
    for (GLuint s : stages) glAttachShader(prog, s);
    glLinkProgram(prog);

    for (GLuint s : stages) {
        glDetachShader(prog, s);
        glDeleteShader(s);
    }

    GLint ok = 0;
    glGetProgramiv(prog, GL_LINK_STATUS, &ok);
    if (!ok) {
        const std::string log = infoLog(prog, true);
        glDeleteProgram(prog);
        std::cerr << "[Shader] Link failed (" << label << "):\n" << log << "\n";
        throw ShaderError("link failed: " + label);
    }
    return prog;
}

std::string Shader::ReadFileToString(const std::string& path)
{
    std::ifstream file(path, std::ios::in);
    if (!file.is_open()) {
        throw ShaderError("failed to open shader file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Shader::Shader(const std::string& vertexPath, const std::string& fragmentPath)
{
    GLuint vs = compileStage(GL_VERTEX_SHADER, vertexPath);
    GLuint fs = 0;
    try {
        fs = compileStage(GL_FRAGMENT_SHADER, fragmentPath);
    }
    catch (const ShaderError&) {
        glDeleteShader(vs);
        throw;
    }
    ID = linkProgram({ vs, fs }, vertexPath + " + " + fragmentPath);
}

Shader::Shader(const std::string& computePath)
{
    ID = linkProgram({ compileStage(GL_COMPUTE_SHADER, computePath) }, computePath);
}

Shader::~Shader()
{
    if (ID != 0) {
        glDeleteProgram(ID);
        ID = 0;
    }
}

void Shader::use() const
{
    glUseProgram(ID);
}
