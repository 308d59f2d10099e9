/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_TEXTUREATLAS_H_
#define _TERRA_GLOBE_TEXTUREATLAS_H_

#include "Bitmap.h"
#include "Rectangle.h"
#include "AtlasPacker.h"
#include "ImageCanvas.h"
#include "RenderContext.h"
#include "Settings.h"
#include "Logger.h"

#include <array>
#include <memory>
#include <vector>

#include <cglib/vec.h>

namespace terra { namespace globe {
    /**
     * Packs images into a single canvas. All images are sorted by size and repacked whenever a new image is added,
     * so the final layout does not depend on insertion order.
     */
    class TextureAtlas final {
    public:
        using TexCoords = std::array<cglib::vec2<float>, 4>; // top-left, bottom-left, top-right, bottom-right

        explicit TextureAtlas(const TextureAtlasSettings& settings = TextureAtlasSettings(), std::shared_ptr<Logger> logger = std::shared_ptr<Logger>());
        TextureAtlas(const TextureAtlas&) = delete;
        ~TextureAtlas();

        TextureAtlas& operator = (const TextureAtlas&) = delete;

        const TextureAtlasSettings& getSettings() const { return _settings; }

        // Throws AtlasOverflowError if the images do not fit, the atlas is left unchanged in that case
        TexCoords addImage(const std::shared_ptr<const Bitmap>& image);

        std::size_t getImageCount() const { return _entries.size(); }
        const std::shared_ptr<const Bitmap>& getImage(std::size_t index) const;
        const TexCoords& getTexCoords(std::size_t index) const;
        const Rectangle& getPlacement(std::size_t index) const;

        std::shared_ptr<Bitmap> getCanvasBitmap() const;

        const std::shared_ptr<RenderContext>& getRenderContext() const { return _renderContext; }
        void setRenderContext(std::shared_ptr<RenderContext> renderContext);

        void makeTexture();
        RenderContext::TextureHandle getTexture();

    private:
        struct Entry {
            std::shared_ptr<const Bitmap> image;
            Rectangle placement;
            TexCoords texCoords;
        };

        TexCoords calculateTexCoords(const Rectangle& placement, const Bitmap& image) const;
        void releaseTexture();

        const TextureAtlasSettings _settings;
        std::vector<Entry> _entries;
        AtlasPacker _packer;
        ImageCanvas _canvas;

        std::shared_ptr<RenderContext> _renderContext;
        RenderContext::TextureHandle _texture = 0;

        const std::shared_ptr<Logger> _logger;
    };
} }

#endif
