/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_PATHNORMALIZER_H_
#define _TERRA_GLOBE_PATHNORMALIZER_H_

#include "Base.h"

#include <vector>

namespace terra { namespace globe {
    class PathNormalizer final {
    public:
        PathNormalizer() = delete;

        static Point normalize(const PathVertex& vertex);
        static Path3D normalize(const RawPath3D& path);
        static std::vector<Path3D> normalize(const std::vector<RawPath3D>& paths);

    private:
        struct PointConverter : boost::static_visitor<Point> {
            Point operator() (const Point& point) const { return point; }
            Point operator() (const std::array<double, 3>& coords) const { return Point(coords[0], coords[1], coords[2]); }
        };
    };
} }

#endif
