/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_POLYLINEBUILDER_H_
#define _TERRA_GLOBE_POLYLINEBUILDER_H_

#include "Base.h"
#include "LineMesh.h"
#include "CoordinateTransform.h"

#include <array>
#include <vector>

namespace terra { namespace globe {
    /**
     * Builds screen-space thick line strips from cartesian or geodetic paths.
     * Several rings can be appended to the same mesh, rings are separated by degenerate triangles.
     */
    class PolylineBuilder final {
    public:
        PolylineBuilder() = delete;

        /**
         * Appends cartesian rings to the mesh. If the transform is given, geodetic and mercator
         * coordinates of every path point are appended to the output lists (one list per ring).
         * Throws InvalidPathError if any ring is malformed, in which case the mesh is not modified.
         */
        static void appendLineData3D(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh, const CoordinateTransform* transform = nullptr, std::vector<PathLonLat>* outPathsLonLat = nullptr, std::vector<PathLonLat>* outPathsMercator = nullptr);

        /**
         * Appends geodetic rings to the mesh. Cartesian and mercator coordinates of every path point
         * are appended to the output lists (one list per ring) if the lists are given.
         */
        static void appendLineDataLonLat(const std::vector<PathLonLat>& paths, bool closed, LineMesh& mesh, const CoordinateTransform& transform, std::vector<Path3D>* outPaths3D = nullptr, std::vector<PathLonLat>* outPathsMercator = nullptr);

        // Equal topology updates: only vertex positions are rewritten, orders and indices stay intact.
        // Ring count, every ring size and the closure flag must match the mesh, otherwise InvalidPathError is thrown.
        static void updateLineData3D(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh, const CoordinateTransform* transform = nullptr, std::vector<PathLonLat>* outPathsLonLat = nullptr, std::vector<PathLonLat>* outPathsMercator = nullptr);
        static void updateLineDataLonLat(const std::vector<PathLonLat>& paths, bool closed, LineMesh& mesh, const CoordinateTransform& transform, std::vector<Path3D>* outPaths3D = nullptr, std::vector<PathLonLat>* outPathsMercator = nullptr);

        // Throws InvalidPathError if any ring has too few points or non-finite coordinates
        static void validatePaths(const std::vector<Path3D>& paths);
        static void validatePaths(const std::vector<PathLonLat>& paths);

        static std::size_t calculateVertexCount(const std::vector<std::size_t>& ringSizes);
        static std::size_t calculateIndexCount(const std::vector<std::size_t>& ringSizes);

        template <typename T>
        static std::vector<std::size_t> ringSizes(const std::vector<std::vector<T>>& paths) {
            std::vector<std::size_t> sizes;
            sizes.reserve(paths.size());
            for (const std::vector<T>& path : paths) {
                sizes.push_back(path.size());
            }
            return sizes;
        }

        inline static constexpr std::array<float, 4> ORDERS = { { 1.0f, -1.0f, 2.0f, -2.0f } };

    private:
        inline static constexpr std::size_t MIN_PATH_POINTS = 2;
        inline static constexpr unsigned int VERTICES_PER_POINT = 4;

        static void checkTopology(const std::vector<std::size_t>& sizes, bool closed, const LineMesh& mesh);
        static unsigned int calculateStartIndex(const LineMesh& mesh);

        static void appendRings(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh);
        static void appendPoint(const Point& point, LineMesh& mesh);
        static void writeRings(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh);
        static std::size_t writePoint(const Point& point, std::size_t offset, LineMesh& mesh);

        static Point calculateStartPhantom(const Path3D& path, bool closed);
        static Point calculateEndPhantom(const Path3D& path, bool closed);

        static void transformPaths(const std::vector<Path3D>& paths, const CoordinateTransform& transform, std::vector<PathLonLat>& pathsLonLat, std::vector<PathLonLat>& pathsMercator);
        static void transformPaths(const std::vector<PathLonLat>& paths, const CoordinateTransform& transform, std::vector<Path3D>& paths3D, std::vector<PathLonLat>& pathsMercator);
    };
} }

#endif
