/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_BITMAP_H_
#define _TERRA_GLOBE_BITMAP_H_

#include <cstdint>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace terra { namespace globe {
    /**
     * RGBA8 raster, one 32-bit word per pixel (r in the lowest byte), rows top to bottom.
     */
    struct Bitmap {
        int width;
        int height;
        std::vector<std::uint32_t> data;

        explicit Bitmap(int width, int height) : width(width), height(height), data(static_cast<std::size_t>(std::max(0, width)) * std::max(0, height)) {
            if (width < 0 || height < 0) {
                throw std::invalid_argument("Negative bitmap dimensions");
            }
        }

        explicit Bitmap(int width, int height, std::vector<std::uint32_t> data) : width(width), height(height), data(std::move(data)) {
            if (width < 0 || height < 0 || this->data.size() != static_cast<std::size_t>(width) * height) {
                throw std::invalid_argument("Bitmap data does not match dimensions");
            }
        }

        std::uint32_t pixel(int x, int y) const {
            return data.at(static_cast<std::size_t>(y) * width + x);
        }
    };
} }

#endif
