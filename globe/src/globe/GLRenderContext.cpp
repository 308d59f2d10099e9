#include "GLRenderContext.h"

#include <string>
#include <stdexcept>

namespace {
    const GLvoid* bufferGLOffset(int offset) {
#ifndef NDEBUG
        if (offset < 0) {
            throw std::runtime_error("Illegal buffer offset");
        }
#endif
        return reinterpret_cast<const GLvoid*>(static_cast<std::size_t>(offset));
    }

    void checkGLError() {
#ifndef NDEBUG
        std::string errorCodes;
        for (GLenum error = glGetError(); error != GL_NO_ERROR; error = glGetError()) {
            errorCodes += (errorCodes.empty() ? "" : ",") + std::to_string(error);
        }
        if (!errorCodes.empty()) {
            throw std::runtime_error("Rendering failed: error codes " + errorCodes);
        }
#endif
    }
}

namespace terra { namespace globe {
    GLRenderContext::GLRenderContext(const LineShaderProgram& lineShaderProgram, std::shared_ptr<const CoordinateTransform> transform, std::shared_ptr<Logger> logger) :
        _lineShaderProgram(lineShaderProgram), _transform(std::move(transform)), _logger(std::move(logger))
    {
        std::string paddedExtensions;
        const char* extensions = reinterpret_cast<const char*>(glGetString(GL_EXTENSIONS));
        if (extensions) {
            paddedExtensions = " " + std::string(extensions) + " ";
        }
        if (paddedExtensions.find(" GL_OES_element_index_uint ") == std::string::npos) {
            log(Logger::Severity::WARNING, "GL_OES_element_index_uint not reported, 32-bit line indices may fail to render");
        }
    }

    GLRenderContext::~GLRenderContext() {
        deinitialize();
    }

    void GLRenderContext::setViewState(const ViewState& viewState) {
        _viewState = viewState;
    }

    void GLRenderContext::deinitialize() {
        for (auto it = _bufferItemSizes.begin(); it != _bufferItemSizes.end(); it++) {
            GLuint buffer = it->first;
            glDeleteBuffers(1, &buffer);
        }
        _bufferItemSizes.clear();

        for (GLuint texture : _textures) {
            glDeleteTextures(1, &texture);
        }
        _textures.clear();
    }

    RenderContext::BufferHandle GLRenderContext::createVertexBuffer(const float* data, std::size_t count, int itemSize) {
        if (itemSize <= 0 || count % itemSize != 0) {
            throw std::invalid_argument("Vertex buffer size is not a multiple of item size");
        }

        GLuint buffer = 0;
        glGenBuffers(1, &buffer);
        glBindBuffer(GL_ARRAY_BUFFER, buffer);
        glBufferData(GL_ARRAY_BUFFER, count * sizeof(float), data, GL_STATIC_DRAW);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
        checkGLError();

        _bufferItemSizes[buffer] = itemSize;
        return buffer;
    }

    RenderContext::BufferHandle GLRenderContext::createIndexBuffer(const unsigned int* data, std::size_t count) {
        GLuint buffer = 0;
        glGenBuffers(1, &buffer);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, buffer);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, count * sizeof(unsigned int), data, GL_STATIC_DRAW);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, 0);
        checkGLError();

        _bufferItemSizes[buffer] = 1;
        return buffer;
    }

    void GLRenderContext::deleteBuffer(BufferHandle buffer) {
        auto it = _bufferItemSizes.find(buffer);
        if (it == _bufferItemSizes.end()) {
            log(Logger::Severity::WARNING, "Deleting unknown buffer " + std::to_string(buffer));
            return;
        }
        GLuint glBuffer = buffer;
        glDeleteBuffers(1, &glBuffer);
        _bufferItemSizes.erase(it);
    }

    RenderContext::TextureHandle GLRenderContext::createTexture(const Bitmap& bitmap) {
        GLuint texture = 0;
        glGenTextures(1, &texture);

        // Use a different strategy if the bitmap is not of POT dimensions, simply do not create the mipmaps
        bool genMipmaps = (bitmap.width & (bitmap.width - 1)) == 0 && (bitmap.height & (bitmap.height - 1)) == 0;
        glBindTexture(GL_TEXTURE_2D, texture);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, genMipmaps ? GL_LINEAR_MIPMAP_LINEAR : GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, bitmap.width, bitmap.height, 0, GL_RGBA, GL_UNSIGNED_BYTE, bitmap.data.empty() ? NULL : bitmap.data.data());
        if (genMipmaps) {
            glGenerateMipmap(GL_TEXTURE_2D);
        }
        glBindTexture(GL_TEXTURE_2D, 0);
        checkGLError();

        _textures.insert(texture);
        return texture;
    }

    void GLRenderContext::deleteTexture(TextureHandle texture) {
        auto it = _textures.find(texture);
        if (it == _textures.end()) {
            log(Logger::Severity::WARNING, "Deleting unknown texture " + std::to_string(texture));
            return;
        }
        GLuint glTexture = texture;
        glDeleteTextures(1, &glTexture);
        _textures.erase(it);
    }

    void GLRenderContext::drawLineStrip(const LineDrawParameters& params) {
        auto verticesIt = _bufferItemSizes.find(params.verticesBuffer);
        if (verticesIt == _bufferItemSizes.end() || _bufferItemSizes.count(params.ordersBuffer) == 0 || _bufferItemSizes.count(params.indicesBuffer) == 0) {
            throw std::invalid_argument("Line strip references unknown buffers");
        }

        const LineShaderProgram& shaderProgram = _lineShaderProgram;
        glUseProgram(shaderProgram.program);

        if (params.blend) {
            glEnable(GL_BLEND);
            glBlendEquationSeparate(GL_FUNC_ADD, GL_FUNC_ADD);
            glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
        }
        else {
            glDisable(GL_BLEND);
        }
        GLboolean cullFace = glIsEnabled(GL_CULL_FACE);
        glDisable(GL_CULL_FACE);

        glUniformMatrix4fv(shaderProgram.projUniform, 1, GL_FALSE, _viewState.projectionMatrix.data());
        glUniformMatrix4fv(shaderProgram.viewUniform, 1, GL_FALSE, _viewState.viewMatrix.data());
        glUniform4fv(shaderProgram.colorUniform, 1, params.color.rgba().data());
        glUniform3f(shaderProgram.camPosUniform, _viewState.eye(0), _viewState.eye(1), _viewState.eye(2));
        glUniform2f(shaderProgram.floatParamsUniform, _viewState.planetRadius2, _viewState.tanViewAngle);
        glUniform2f(shaderProgram.viewportUniform, _viewState.viewport(0), _viewState.viewport(1));
        glUniform1f(shaderProgram.thicknessUniform, params.thickness);

        GLint itemSize = verticesIt->second;
        glBindBuffer(GL_ARRAY_BUFFER, params.verticesBuffer);
        glEnableVertexAttribArray(shaderProgram.prevAttrib);
        glVertexAttribPointer(shaderProgram.prevAttrib, itemSize, GL_FLOAT, GL_FALSE, VERTEX_STRIDE, bufferGLOffset(0));
        glEnableVertexAttribArray(shaderProgram.currentAttrib);
        glVertexAttribPointer(shaderProgram.currentAttrib, itemSize, GL_FLOAT, GL_FALSE, VERTEX_STRIDE, bufferGLOffset(CURRENT_VERTEX_OFFSET));
        glEnableVertexAttribArray(shaderProgram.nextAttrib);
        glVertexAttribPointer(shaderProgram.nextAttrib, itemSize, GL_FLOAT, GL_FALSE, VERTEX_STRIDE, bufferGLOffset(NEXT_VERTEX_OFFSET));

        glBindBuffer(GL_ARRAY_BUFFER, params.ordersBuffer);
        glEnableVertexAttribArray(shaderProgram.orderAttrib);
        glVertexAttribPointer(shaderProgram.orderAttrib, 1, GL_FLOAT, GL_FALSE, sizeof(float), bufferGLOffset(0));

        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, params.indicesBuffer);
        glDrawElements(GL_TRIANGLE_STRIP, static_cast<GLsizei>(params.indexCount), GL_UNSIGNED_INT, bufferGLOffset(0));

        glDisableVertexAttribArray(shaderProgram.orderAttrib);
        glDisableVertexAttribArray(shaderProgram.nextAttrib);
        glDisableVertexAttribArray(shaderProgram.currentAttrib);
        glDisableVertexAttribArray(shaderProgram.prevAttrib);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, 0);
        glBindBuffer(GL_ARRAY_BUFFER, 0);

        if (cullFace) {
            glEnable(GL_CULL_FACE);
        }
        if (!params.blend) {
            glEnable(GL_BLEND);
        }
        checkGLError();
    }

    std::shared_ptr<const CoordinateTransform> GLRenderContext::getCoordinateTransform() const {
        return _transform;
    }

    void GLRenderContext::log(Logger::Severity severity, const std::string& msg) const {
        if (_logger) {
            _logger->write(severity, msg);
        }
    }
} }
