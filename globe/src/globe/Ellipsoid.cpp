#include "Ellipsoid.h"

#include <cmath>
#include <stdexcept>

namespace terra { namespace globe {
    Ellipsoid::Ellipsoid(double equatorialRadius, double polarRadius) :
        _a(equatorialRadius), _b(polarRadius), _e2(1.0 - (polarRadius * polarRadius) / (equatorialRadius * equatorialRadius)), _ep2((equatorialRadius * equatorialRadius) / (polarRadius * polarRadius) - 1.0)
    {
        if (!(equatorialRadius > 0) || !(polarRadius > 0) || polarRadius > equatorialRadius) {
            throw std::invalid_argument("Illegal ellipsoid radii");
        }
    }

    LonLat Ellipsoid::cartesianToLonLat(const Point& pos) const {
        double x = pos(0), y = pos(1), z = pos(2);
        double p = std::sqrt(x * x + y * y);
        double lon = std::atan2(y, x);

        // Bowring's formula, a single step is accurate to sub-millimeter level for terrestrial heights
        double theta = std::atan2(z * _a, p * _b);
        double sinTheta = std::sin(theta);
        double cosTheta = std::cos(theta);
        double lat = std::atan2(z + _ep2 * _b * sinTheta * sinTheta * sinTheta, p - _e2 * _a * cosTheta * cosTheta * cosTheta);

        double sinLat = std::sin(lat);
        double cosLat = std::cos(lat);
        double n = _a / std::sqrt(1.0 - _e2 * sinLat * sinLat);
        double height = p * cosLat + z * sinLat - _a * _a / n;
        return LonLat(lon * DEGREES, lat * DEGREES, height);
    }

    Point Ellipsoid::lonLatToCartesian(const LonLat& lonLat) const {
        double lat = lonLat.lat * RADIANS;
        double lon = lonLat.lon * RADIANS;
        double sinLat = std::sin(lat);
        double cosLat = std::cos(lat);
        double n = _a / std::sqrt(1.0 - _e2 * sinLat * sinLat);
        double nc = (n + lonLat.height) * cosLat;
        return Point(nc * std::cos(lon), nc * std::sin(lon), (n * (1.0 - _e2) + lonLat.height) * sinLat);
    }

    std::shared_ptr<const Ellipsoid> Ellipsoid::WGS84() {
        static const std::shared_ptr<const Ellipsoid> wgs84 = std::make_shared<Ellipsoid>(WGS84_EQUATORIAL_RADIUS, WGS84_POLAR_RADIUS);
        return wgs84;
    }
} }
