/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_RENDERCONTEXT_H_
#define _TERRA_GLOBE_RENDERCONTEXT_H_

#include "Bitmap.h"
#include "Color.h"
#include "CoordinateTransform.h"

#include <cstddef>
#include <memory>

namespace terra { namespace globe {
    /**
     * GPU services used by polylines and texture atlases. Handles are opaque, 0 is never a valid handle.
     */
    class RenderContext {
    public:
        using BufferHandle = unsigned int;
        using TextureHandle = unsigned int;

        struct LineDrawParameters {
            BufferHandle verticesBuffer = 0;
            BufferHandle ordersBuffer = 0;
            BufferHandle indicesBuffer = 0;
            std::size_t indexCount = 0;
            Color color;
            float thickness = 0; // half width in screen pixels
            bool blend = true;
        };

        virtual ~RenderContext() = default;

        virtual BufferHandle createVertexBuffer(const float* data, std::size_t count, int itemSize) = 0;
        virtual BufferHandle createIndexBuffer(const unsigned int* data, std::size_t count) = 0;
        virtual void deleteBuffer(BufferHandle buffer) = 0;

        virtual TextureHandle createTexture(const Bitmap& bitmap) = 0;
        virtual void deleteTexture(TextureHandle texture) = 0;

        virtual void drawLineStrip(const LineDrawParameters& params) = 0;

        // Can be null if the scene has no geodetic reference
        virtual std::shared_ptr<const CoordinateTransform> getCoordinateTransform() const = 0;
    };
} }

#endif
