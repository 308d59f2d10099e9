/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_COLOR_H_
#define _TERRA_GLOBE_COLOR_H_

#include <cstdint>
#include <array>
#include <algorithm>

namespace terra { namespace globe {
    class Color final {
    public:
        constexpr Color() : _components{ { 0, 0, 0, 0 } } { }

        constexpr explicit Color(const std::array<float, 4>& rgba) : _components(rgba) { }

        constexpr explicit Color(float r, float g, float b, float a) : _components{ { r, g, b, a } } { }

        constexpr float& operator [] (std::size_t i) {
            return _components[i];
        }

        constexpr float operator [] (std::size_t i) const {
            return _components[i];
        }

        constexpr float r() const { return _components[0]; }
        constexpr float g() const { return _components[1]; }
        constexpr float b() const { return _components[2]; }
        constexpr float a() const { return _components[3]; }

        constexpr std::array<float, 4> rgba() const {
            return _components;
        }

        constexpr std::array<std::uint8_t, 4> rgba8() const {
            std::array<std::uint8_t, 4> components8 {};
            for (std::size_t i = 0; i < 4; i++) {
                float c = std::max(0.0f, std::min(1.0f, _components[i]));
                components8[i] = static_cast<std::uint8_t>(c * 255.0f + 0.5f);
            }
            return components8;
        }

        constexpr std::uint32_t pixel() const {
            std::array<std::uint8_t, 4> components = rgba8();
            return static_cast<std::uint32_t>(components[0]) | (static_cast<std::uint32_t>(components[1]) << 8) | (static_cast<std::uint32_t>(components[2]) << 16) | (static_cast<std::uint32_t>(components[3]) << 24);
        }

        static constexpr Color fromRGBA8(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
            return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
        }

        static constexpr Color fromColorOpacity(const Color& baseColor, float opacity) {
            Color color = baseColor;
            color._components[3] = std::max(0.0f, std::min(1.0f, opacity));
            return color;
        }

    private:
        std::array<float, 4> _components; // rgba
    };

    constexpr bool operator == (const Color& color1, const Color& color2) {
        return color1[0] == color2[0] && color1[1] == color2[1] && color1[2] == color2[2] && color1[3] == color2[3];
    }

    constexpr bool operator != (const Color& color1, const Color& color2) {
        return !(color1 == color2);
    }
} }

#endif
