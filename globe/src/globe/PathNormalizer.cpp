#include "PathNormalizer.h"

namespace terra { namespace globe {
    Point PathNormalizer::normalize(const PathVertex& vertex) {
        return boost::apply_visitor(PointConverter(), vertex);
    }

    Path3D PathNormalizer::normalize(const RawPath3D& path) {
        Path3D points;
        points.reserve(path.size());
        for (const PathVertex& vertex : path) {
            points.push_back(normalize(vertex));
        }
        return points;
    }

    std::vector<Path3D> PathNormalizer::normalize(const std::vector<RawPath3D>& paths) {
        std::vector<Path3D> rings;
        rings.reserve(paths.size());
        for (const RawPath3D& path : paths) {
            rings.push_back(normalize(path));
        }
        return rings;
    }
} }
