#include "TextureAtlas.h"
#include "Exceptions.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace terra { namespace globe {
    TextureAtlas::TextureAtlas(const TextureAtlasSettings& settings, std::shared_ptr<Logger> logger) :
        _settings(settings),
        _entries(),
        _packer(settings.width, settings.height, settings.borderSize, settings.fitTolerance),
        _canvas(settings.width, settings.height),
        _logger(std::move(logger))
    {
    }

    TextureAtlas::~TextureAtlas() {
        releaseTexture();
    }

    TextureAtlas::TexCoords TextureAtlas::addImage(const std::shared_ptr<const Bitmap>& image) {
        if (!image) {
            throw std::invalid_argument("Null image");
        }
        if (image->width <= 0 || image->height <= 0) {
            throw std::invalid_argument("Atlas images must have nonzero size");
        }

        std::vector<std::shared_ptr<const Bitmap>> images;
        images.reserve(_entries.size() + 1);
        for (const Entry& entry : _entries) {
            images.push_back(entry.image);
        }
        images.push_back(image);

        // Pack in ascending width, then height order. Ties keep insertion order.
        std::vector<std::size_t> order(images.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&images](std::size_t i1, std::size_t i2) {
            if (images[i1]->width != images[i2]->width) {
                return images[i1]->width < images[i2]->width;
            }
            return images[i1]->height < images[i2]->height;
        });

        AtlasPacker packer(_settings.width, _settings.height, _settings.borderSize, _settings.fitTolerance);
        ImageCanvas canvas(_settings.width, _settings.height);
        std::vector<Entry> entries(images.size());
        for (std::size_t i : order) {
            const Bitmap& bitmap = *images[i];
            boost::optional<AtlasPacker::NodeIndex> node = packer.insert(bitmap.width, bitmap.height);
            if (!node) {
                if (_logger) {
                    _logger->write(Logger::Severity::WARNING, "Texture atlas of size " + std::to_string(_settings.width) + "x" + std::to_string(_settings.height) + " is full, " + std::to_string(images.size()) + " images do not fit");
                }
                throw AtlasOverflowError(image->width, image->height);
            }

            const Rectangle& placement = packer.getRectangle(*node);
            canvas.drawImage(bitmap, placement.left + _settings.borderSize, placement.top + _settings.borderSize);
            entries[i] = Entry { images[i], placement, calculateTexCoords(placement, bitmap) };
        }

        std::swap(_packer, packer);
        std::swap(_canvas, canvas);
        std::swap(_entries, entries);

        if (_renderContext) {
            makeTexture();
        }
        return _entries.back().texCoords;
    }

    const std::shared_ptr<const Bitmap>& TextureAtlas::getImage(std::size_t index) const {
        return _entries.at(index).image;
    }

    const TextureAtlas::TexCoords& TextureAtlas::getTexCoords(std::size_t index) const {
        return _entries.at(index).texCoords;
    }

    const Rectangle& TextureAtlas::getPlacement(std::size_t index) const {
        return _entries.at(index).placement;
    }

    std::shared_ptr<Bitmap> TextureAtlas::getCanvasBitmap() const {
        return _canvas.buildBitmap();
    }

    void TextureAtlas::setRenderContext(std::shared_ptr<RenderContext> renderContext) {
        if (renderContext == _renderContext) {
            return;
        }
        releaseTexture();
        _renderContext = std::move(renderContext);
    }

    void TextureAtlas::makeTexture() {
        if (!_renderContext) {
            throw DetachedResourceError("Texture atlas is not attached to a render context");
        }
        std::shared_ptr<Bitmap> bitmap = _canvas.buildBitmap();
        releaseTexture();
        _texture = _renderContext->createTexture(*bitmap);
    }

    RenderContext::TextureHandle TextureAtlas::getTexture() {
        if (!_renderContext) {
            if (_logger) {
                _logger->write(Logger::Severity::ERROR, "Texture requested from a detached texture atlas");
            }
            throw DetachedResourceError("Texture atlas is not attached to a render context");
        }
        if (_texture == 0) {
            makeTexture();
        }
        return _texture;
    }

    TextureAtlas::TexCoords TextureAtlas::calculateTexCoords(const Rectangle& placement, const Bitmap& image) const {
        float x0 = static_cast<float>(placement.left + _settings.borderSize) / _settings.width;
        float y0 = static_cast<float>(placement.top + _settings.borderSize) / _settings.height;
        float x1 = static_cast<float>(placement.left + _settings.borderSize + image.width) / _settings.width;
        float y1 = static_cast<float>(placement.top + _settings.borderSize + image.height) / _settings.height;
        return TexCoords { { cglib::vec2<float>(x0, y0), cglib::vec2<float>(x0, y1), cglib::vec2<float>(x1, y0), cglib::vec2<float>(x1, y1) } };
    }

    void TextureAtlas::releaseTexture() {
        if (_renderContext && _texture != 0) {
            _renderContext->deleteTexture(_texture);
        }
        _texture = 0;
    }
} }
