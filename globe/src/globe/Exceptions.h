/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_EXCEPTIONS_H_
#define _TERRA_GLOBE_EXCEPTIONS_H_

#include <string>
#include <stdexcept>

namespace terra { namespace globe {
    class InvalidPathError : public std::runtime_error {
    public:
        explicit InvalidPathError(const std::string& msg) : runtime_error(msg) { }
        explicit InvalidPathError(const std::string& msg, std::size_t ringIndex) : runtime_error(msg + ", ring " + std::to_string(ringIndex)), _ringIndex(ringIndex) { }

        std::size_t ringIndex() const { return _ringIndex; }

    private:
        std::size_t _ringIndex = 0;
    };

    class AtlasOverflowError : public std::runtime_error {
    public:
        explicit AtlasOverflowError(int width, int height) : runtime_error("No room in texture atlas for image of size " + std::to_string(width) + "x" + std::to_string(height)), _width(width), _height(height) { }

        int width() const { return _width; }
        int height() const { return _height; }

    private:
        int _width;
        int _height;
    };

    class DetachedResourceError : public std::runtime_error {
    public:
        explicit DetachedResourceError(const std::string& msg) : runtime_error(msg) { }
    };
} }

#endif
