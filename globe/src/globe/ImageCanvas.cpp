#include "ImageCanvas.h"

#include <algorithm>
#include <stdexcept>

namespace terra { namespace globe {
    ImageCanvas::ImageCanvas(int width, int height) : _width(width), _height(height), _data() {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument("Illegal canvas dimensions");
        }
        _data.resize(static_cast<std::size_t>(width) * height);
    }

    void ImageCanvas::clear(const Color& color) {
        std::fill(_data.begin(), _data.end(), color.pixel());
    }

    void ImageCanvas::drawImage(const Bitmap& bitmap, int x, int y) {
        int x0 = std::max(0, x);
        int x1 = std::min(_width, x + bitmap.width);
        if (x0 >= x1) {
            return;
        }
        for (int by = std::max(0, -y); by < bitmap.height && y + by < _height; by++) {
            const std::uint32_t* srcRow = &bitmap.data[static_cast<std::size_t>(by) * bitmap.width];
            std::uint32_t* dstRow = &_data[static_cast<std::size_t>(y + by) * _width];
            std::copy(srcRow + (x0 - x), srcRow + (x1 - x), dstRow + x0);
        }
    }

    std::uint32_t ImageCanvas::getPixel(int x, int y) const {
        if (x < 0 || y < 0 || x >= _width || y >= _height) {
            throw std::out_of_range("Pixel coordinates outside of canvas");
        }
        return _data[static_cast<std::size_t>(y) * _width + x];
    }

    std::shared_ptr<Bitmap> ImageCanvas::buildBitmap() const {
        return std::make_shared<Bitmap>(_width, _height, _data);
    }
} }
