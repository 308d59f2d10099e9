/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_IMAGECANVAS_H_
#define _TERRA_GLOBE_IMAGECANVAS_H_

#include "Color.h"
#include "Bitmap.h"

#include <cstdint>
#include <vector>
#include <memory>

namespace terra { namespace globe {
    class ImageCanvas final {
    public:
        explicit ImageCanvas(int width, int height);

        int getWidth() const { return _width; }
        int getHeight() const { return _height; }

        void clear(const Color& color = Color());

        // Copies the bitmap with its top-left corner at (x, y), pixels outside of the canvas are skipped
        void drawImage(const Bitmap& bitmap, int x, int y);

        std::uint32_t getPixel(int x, int y) const;

        std::shared_ptr<Bitmap> buildBitmap() const;

    private:
        int _width;
        int _height;
        std::vector<std::uint32_t> _data;
    };
} }

#endif
