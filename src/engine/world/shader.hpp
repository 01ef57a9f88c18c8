#pragma once

#include "pch.hpp"

// Thin handle around a linked GL program. Copies share the program; the
// owner calls destroy() once.
class Shader {
  private:
    GLuint program = 0;

    static std::string readFile(const std::string &path) {
        std::ifstream file(path);
        if (!file.is_open())
            throw std::runtime_error("Failed to open shader: " + path);
        std::stringstream stream;
        stream << file.rdbuf();
        return stream.str();
    }

    static GLuint compile(GLenum type, const std::string &source, const std::string &path) {
        GLuint shader = glCreateShader(type);
        const char *code = source.c_str();
        glShaderSource(shader, 1, &code, nullptr);
        glCompileShader(shader);
        GLint success = 0;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
        if (!success) {
            char log[1024];
            glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
            glDeleteShader(shader);
            throw std::runtime_error("Failed to compile " + path + ":\n" + log);
        }
        return shader;
    }

    GLint location(const char *name) const { return glGetUniformLocation(program, name); }

  public:
    Shader() = default;

    Shader(const std::string &vertexPath, const std::string &fragmentPath) {
        GLuint vertex = compile(GL_VERTEX_SHADER, readFile(vertexPath), vertexPath);
        GLuint fragment = compile(GL_FRAGMENT_SHADER, readFile(fragmentPath), fragmentPath);
        program = glCreateProgram();
        glAttachShader(program, vertex);
        glAttachShader(program, fragment);
        glLinkProgram(program);
        glDeleteShader(vertex);
        glDeleteShader(fragment);
        GLint success = 0;
        glGetProgramiv(program, GL_LINK_STATUS, &success);
        if (!success) {
            char log[1024];
            glGetProgramInfoLog(program, sizeof(log), nullptr, log);
            glDeleteProgram(program);
            program = 0;
            throw std::runtime_error("Failed to link " + vertexPath + " + " + fragmentPath + ":\n" + log);
        }
    }

    void activate() const { glUseProgram(program); }

    void destroy() {
        if (program)
            glDeleteProgram(program);
        program = 0;
    }

    void setInt(const char *name, int value) const { glUniform1i(location(name), value); }
    void setBool(const char *name, bool value) const { glUniform1i(location(name), value ? 1 : 0); }
    void setMat4(const char *name, const mat4 &value) const {
        glUniformMatrix4fv(location(name), 1, GL_FALSE, &value[0][0]);
    }
};
