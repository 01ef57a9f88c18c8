#pragma once

#include "pch.hpp"
#include "shader.hpp"

class Framebuffer {
  private:
    GLuint buffer = 0;
    GLuint tColor = 0;
    GLuint rColor = 0;
    GLuint rDepth = 0;
    ivec2 screenSize;
    int samples;

    void generateBuffer() {
        glGenFramebuffers(1, &buffer);
        glBindFramebuffer(GL_FRAMEBUFFER, buffer);

        if (samples > 1) {
            glGenRenderbuffers(1, &rColor);
            glBindRenderbuffer(GL_RENDERBUFFER, rColor);
            glRenderbufferStorageMultisample(GL_RENDERBUFFER, samples, GL_RGBA8,
                                             screenSize.x, screenSize.y);
            glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0,
                                      GL_RENDERBUFFER, rColor);
        } else {
            glGenTextures(1, &tColor);
            glBindTexture(GL_TEXTURE_2D, tColor);
            glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, screenSize.x, screenSize.y,
                         0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
            glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0,
                                   GL_TEXTURE_2D, tColor, 0);
        }

        glGenRenderbuffers(1, &rDepth);
        glBindRenderbuffer(GL_RENDERBUFFER, rDepth);
        glRenderbufferStorageMultisample(GL_RENDERBUFFER, samples > 1 ? samples : 0,
                                         GL_DEPTH_COMPONENT24, screenSize.x, screenSize.y);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT,
                                  GL_RENDERBUFFER, rDepth);

        if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE)
            throw std::runtime_error("Framebuffer not complete!");
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
    }
    void removeBuffer() {
        if (tColor)
            glDeleteTextures(1, &tColor);
        if (rColor)
            glDeleteRenderbuffers(1, &rColor);
        if (rDepth)
            glDeleteRenderbuffers(1, &rDepth);
        if (buffer)
            glDeleteFramebuffers(1, &buffer);
        tColor = rColor = rDepth = buffer = 0;
    }

  public:
    Framebuffer(ivec2 screenSize, int samples = 1)
        : screenSize(glm::max(screenSize, ivec2(1))), samples(samples) {
        generateBuffer();
    }
    ~Framebuffer() { removeBuffer(); }
    Framebuffer(const Framebuffer &) = delete;
    Framebuffer &operator=(const Framebuffer &) = delete;

    void resetBuffer(ivec2 newScreenSize) {
        screenSize = glm::max(newScreenSize, ivec2(1));
        removeBuffer();
        generateBuffer();
    }

    void bindBuffer() {
        glViewport(0, 0, screenSize.x, screenSize.y);
        glBindFramebuffer(GL_FRAMEBUFFER, buffer);
    }

    void clearBuffer(const vec4 &color) {
        bindBuffer();
        glClearColor(color.r, color.g, color.b, color.a);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    }

    // Resolves multisampled color into a buffer of the same size.
    void resolveInto(Framebuffer &target) {
        glBindFramebuffer(GL_READ_FRAMEBUFFER, buffer);
        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, target.buffer);
        glBlitFramebuffer(0, 0, screenSize.x, screenSize.y, 0, 0, target.screenSize.x,
                          target.screenSize.y, GL_COLOR_BUFFER_BIT, GL_NEAREST);
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
    }

    GLuint getColorTexture() const { return tColor; }
    ivec2 getSize() const { return screenSize; }
};

// Scene is drawn into a multisampled buffer sized by the capped pixel ratio,
// then resolved and stretched over the window's default framebuffer.
class Pipeline {
  private:
    Framebuffer sceneBuffer;
    Framebuffer resolveBuffer;
    Shader compositeShader;

    GLuint quadVAO = 0, quadVBO = 0;
    ivec2 windowSize;

    vec4 clearColor = vec4(0.0f, 0.0f, 0.0f, 1.0f);

  public:
    Pipeline(ivec2 bufferSize, ivec2 windowSize, const std::string &shaderPath, int samples = 4)
        : sceneBuffer(bufferSize, samples), resolveBuffer(bufferSize),
          windowSize(windowSize) {
        compositeShader = Shader(shaderPath + "post.vert", shaderPath + "composite.frag");
        float quadVertices[] = {-1.0f, 1.0f, 0.0f, 1.0f, -1.0f, -1.0f,
                                0.0f, 0.0f, 1.0f, -1.0f, 1.0f, 0.0f,

                                -1.0f, 1.0f, 0.0f, 1.0f, 1.0f, -1.0f,
                                1.0f, 0.0f, 1.0f, 1.0f, 1.0f, 1.0f};
        glGenVertexArrays(1, &quadVAO);
        glGenBuffers(1, &quadVBO);
        glBindVertexArray(quadVAO);
        glBindBuffer(GL_ARRAY_BUFFER, quadVBO);
        glBufferData(GL_ARRAY_BUFFER, sizeof(quadVertices), quadVertices,
                     GL_STATIC_DRAW);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void *)0);
        glEnableVertexAttribArray(1);
        glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void *)(2 * sizeof(float)));
        glBindVertexArray(0);
    }
    ~Pipeline() {
        compositeShader.destroy();
        glDeleteBuffers(1, &quadVBO);
        glDeleteVertexArrays(1, &quadVAO);
    }
    Pipeline(const Pipeline &) = delete;
    Pipeline &operator=(const Pipeline &) = delete;

    void setResolution(ivec2 bufferSize, ivec2 newWindowSize) {
        windowSize = newWindowSize;
        sceneBuffer.resetBuffer(bufferSize);
        resolveBuffer.resetBuffer(bufferSize);
    }
    void setClearColor(const vec4 &color) { clearColor = color; }

    void beginScene() {
        sceneBuffer.clearBuffer(clearColor);
        glEnable(GL_DEPTH_TEST);
    }

    void composite() {
        sceneBuffer.resolveInto(resolveBuffer);

        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glViewport(0, 0, windowSize.x, windowSize.y);
        glClearColor(clearColor.x, clearColor.y, clearColor.z, clearColor.w);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        glDisable(GL_DEPTH_TEST);
        compositeShader.activate();
        glActiveTexture(GL_TEXTURE0);
        glBindTexture(GL_TEXTURE_2D, resolveBuffer.getColorTexture());
        compositeShader.setInt("tSceneColor", 0);
        renderQuad();
        glEnable(GL_DEPTH_TEST);
    }

    void renderQuad() const {
        glBindVertexArray(quadVAO);
        glDrawArrays(GL_TRIANGLES, 0, 6);
        glBindVertexArray(0);
    }
};
