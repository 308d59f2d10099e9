/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_BASE_H_
#define _TERRA_GLOBE_BASE_H_

#include "LonLat.h"

#include <array>
#include <vector>

#include <boost/variant.hpp>

#include <cglib/vec.h>
#include <cglib/bbox.h>

namespace terra { namespace globe {
    using Point = cglib::vec3<double>;

    using PathVertex = boost::variant<Point, std::array<double, 3>>;

    using Path3D = std::vector<Point>;
    using PathLonLat = std::vector<LonLat>;
    using RawPath3D = std::vector<PathVertex>;

    using Extent = cglib::bbox2<double>; // lon/lat degrees
} }

#endif
