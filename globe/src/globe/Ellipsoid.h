/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_ELLIPSOID_H_
#define _TERRA_GLOBE_ELLIPSOID_H_

#include "CoordinateTransform.h"

#include <memory>

#include <boost/math/constants/constants.hpp>

namespace terra { namespace globe {
    /**
     * Geocentric (ECEF) transform over a biaxial ellipsoid.
     * Z axis points to the north pole, X axis to longitude 0, Y axis to longitude 90E.
     */
    class Ellipsoid final : public CoordinateTransform {
    public:
        explicit Ellipsoid(double equatorialRadius, double polarRadius);
        virtual ~Ellipsoid() = default;

        double getEquatorialRadius() const { return _a; }
        double getPolarRadius() const { return _b; }
        double getEccentricitySquared() const { return _e2; }

        virtual LonLat cartesianToLonLat(const Point& pos) const override;
        virtual Point lonLatToCartesian(const LonLat& lonLat) const override;

        static std::shared_ptr<const Ellipsoid> WGS84();

    private:
        inline static constexpr double PI = boost::math::constants::pi<double>();
        inline static constexpr double RADIANS = PI / 180.0;
        inline static constexpr double DEGREES = 180.0 / PI;

        inline static constexpr double WGS84_EQUATORIAL_RADIUS = 6378137.0;
        inline static constexpr double WGS84_POLAR_RADIUS = 6356752.3142451793;

        const double _a;
        const double _b;
        const double _e2;  // first eccentricity squared
        const double _ep2; // second eccentricity squared
    };
} }

#endif
