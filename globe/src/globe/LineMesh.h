/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_LINEMESH_H_
#define _TERRA_GLOBE_LINEMESH_H_

#include "VertexArray.h"

#include <vector>

#include <cglib/vec.h>

namespace terra { namespace globe {
    /**
     * GPU-facing line strip data. Every path point (including the two phantom points of each ring)
     * is stored as 4 identical vertices, each tagged with one of the order values 1, -1, 2, -2.
     * Indices address the 'current' vertex stream, which is offset by 4 vertices from the start of the buffer.
     * Ring sizes and closure flags describe the layout the indices were built for.
     */
    struct LineMesh {
        VertexArray<cglib::vec3<float>> vertices;
        VertexArray<float> orders;
        VertexArray<unsigned int> indices;
        std::vector<std::size_t> ringSizes;
        std::vector<bool> ringsClosed;

        bool empty() const {
            return vertices.empty();
        }

        void clear() {
            vertices.clear();
            orders.clear();
            indices.clear();
            ringSizes.clear();
            ringsClosed.clear();
        }

        void swap(LineMesh& other) noexcept {
            vertices.swap(other.vertices);
            orders.swap(other.orders);
            indices.swap(other.indices);
            ringSizes.swap(other.ringSizes);
            ringsClosed.swap(other.ringsClosed);
        }
    };
} }

#endif
