/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_GLRENDERCONTEXT_H_
#define _TERRA_GLOBE_GLRENDERCONTEXT_H_

#include "RenderContext.h"
#include "Logger.h"

#include <memory>
#include <map>
#include <set>

#include <GLES2/gl2.h>
#include <GLES2/gl2ext.h>

#include <cglib/vec.h>
#include <cglib/mat.h>

namespace terra { namespace globe {
    /**
     * OpenGL ES 2 implementation of the GPU services. Must be created and used on the thread owning the GL context.
     * The line shader program is compiled by the caller, this class only binds its attributes and uniforms.
     */
    class GLRenderContext final : public RenderContext {
    public:
        struct LineShaderProgram {
            GLuint program = 0;
            GLint prevAttrib = -1;
            GLint currentAttrib = -1;
            GLint nextAttrib = -1;
            GLint orderAttrib = -1;
            GLint projUniform = -1;
            GLint viewUniform = -1;
            GLint colorUniform = -1;
            GLint camPosUniform = -1;
            GLint floatParamsUniform = -1;
            GLint viewportUniform = -1;
            GLint thicknessUniform = -1;
        };

        struct ViewState {
            cglib::mat4x4<float> projectionMatrix = cglib::mat4x4<float>::identity();
            cglib::mat4x4<float> viewMatrix = cglib::mat4x4<float>::identity();
            cglib::vec3<float> eye = cglib::vec3<float>(0, 0, 0);
            cglib::vec2<float> viewport = cglib::vec2<float>(1, 1);
            float planetRadius2 = 0;
            float tanViewAngle = 0; // tangent of half view angle divided by viewport height
        };

        explicit GLRenderContext(const LineShaderProgram& lineShaderProgram, std::shared_ptr<const CoordinateTransform> transform, std::shared_ptr<Logger> logger);
        virtual ~GLRenderContext();

        void setViewState(const ViewState& viewState);

        // Releases all buffers and textures still owned by this context
        void deinitialize();

        virtual BufferHandle createVertexBuffer(const float* data, std::size_t count, int itemSize) override;
        virtual BufferHandle createIndexBuffer(const unsigned int* data, std::size_t count) override;
        virtual void deleteBuffer(BufferHandle buffer) override;

        virtual TextureHandle createTexture(const Bitmap& bitmap) override;
        virtual void deleteTexture(TextureHandle texture) override;

        virtual void drawLineStrip(const LineDrawParameters& params) override;

        virtual std::shared_ptr<const CoordinateTransform> getCoordinateTransform() const override;

    private:
        inline static constexpr GLsizei VERTEX_STRIDE = 3 * sizeof(float);
        inline static constexpr int CURRENT_VERTEX_OFFSET = 4 * VERTEX_STRIDE;
        inline static constexpr int NEXT_VERTEX_OFFSET = 8 * VERTEX_STRIDE;

        void log(Logger::Severity severity, const std::string& msg) const;

        const LineShaderProgram _lineShaderProgram;
        const std::shared_ptr<const CoordinateTransform> _transform;
        const std::shared_ptr<Logger> _logger;
        ViewState _viewState;

        std::map<GLuint, int> _bufferItemSizes;
        std::set<GLuint> _textures;
    };
} }

#endif
