/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_LONLAT_H_
#define _TERRA_GLOBE_LONLAT_H_

#include <cmath>
#include <algorithm>

#include <boost/math/constants/constants.hpp>

namespace terra { namespace globe {
    /**
     * Geodetic coordinates. Longitude and latitude are in degrees, height in meters above the ellipsoid.
     * The same structure is used for EPSG:3857 (mercator) coordinates, in which case lon/lat are meters.
     */
    struct LonLat {
        double lon;
        double lat;
        double height;

        LonLat() : lon(0), lat(0), height(0) { }
        explicit LonLat(double lon, double lat, double height = 0) : lon(lon), lat(lat), height(height) { }

        LonLat forwardMercator() const {
            double clampedLat = std::max(-MAX_MERCATOR_LAT, std::min(MAX_MERCATOR_LAT, lat));
            double x = lon * POLE / 180.0;
            double y = std::log(std::tan((90.0 + clampedLat) * PI / 360.0)) / PI * POLE;
            return LonLat(x, y, height);
        }

        LonLat inverseMercator() const {
            double lon2 = lon * 180.0 / POLE;
            double lat2 = 180.0 / PI * (2.0 * std::atan(std::exp(lat / POLE * PI)) - PI * 0.5);
            return LonLat(lon2, lat2, height);
        }

        inline static constexpr double PI = boost::math::constants::pi<double>();
        inline static constexpr double POLE = 20037508.34;
        inline static constexpr double MAX_MERCATOR_LAT = 85.0511287798;
    };

    inline bool operator == (const LonLat& lonLat1, const LonLat& lonLat2) {
        return lonLat1.lon == lonLat2.lon && lonLat1.lat == lonLat2.lat && lonLat1.height == lonLat2.height;
    }

    inline bool operator != (const LonLat& lonLat1, const LonLat& lonLat2) {
        return !(lonLat1 == lonLat2);
    }
} }

#endif
