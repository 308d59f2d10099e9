/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_COORDINATETRANSFORM_H_
#define _TERRA_GLOBE_COORDINATETRANSFORM_H_

#include "Base.h"

namespace terra { namespace globe {
    class CoordinateTransform {
    public:
        virtual ~CoordinateTransform() = default;

        virtual LonLat cartesianToLonLat(const Point& pos) const = 0;
        virtual Point lonLatToCartesian(const LonLat& lonLat) const = 0;

        virtual LonLat forwardMercator(const LonLat& lonLat) const {
            return lonLat.forwardMercator();
        }
    };
} }

#endif
