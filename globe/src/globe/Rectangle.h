/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_RECTANGLE_H_
#define _TERRA_GLOBE_RECTANGLE_H_

#include <algorithm>

namespace terra { namespace globe {
    struct Rectangle {
        int left = 0;
        int top = 0;
        int right = 0; // exclusive
        int bottom = 0; // exclusive

        constexpr Rectangle() = default;
        constexpr explicit Rectangle(int left, int top, int right, int bottom) : left(left), top(top), right(right), bottom(bottom) { }

        constexpr int width() const { return right - left; }
        constexpr int height() const { return bottom - top; }

        constexpr bool empty() const {
            return right <= left || bottom <= top;
        }

        constexpr bool contains(const Rectangle& other) const {
            return other.left >= left && other.top >= top && other.right <= right && other.bottom <= bottom;
        }

        constexpr bool intersects(const Rectangle& other) const {
            return std::max(left, other.left) < std::min(right, other.right) && std::max(top, other.top) < std::min(bottom, other.bottom);
        }
    };

    constexpr bool operator == (const Rectangle& rect1, const Rectangle& rect2) {
        return rect1.left == rect2.left && rect1.top == rect2.top && rect1.right == rect2.right && rect1.bottom == rect2.bottom;
    }

    constexpr bool operator != (const Rectangle& rect1, const Rectangle& rect2) {
        return !(rect1 == rect2);
    }
} }

#endif
