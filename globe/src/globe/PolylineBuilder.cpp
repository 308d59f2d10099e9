#include "PolylineBuilder.h"
#include "Exceptions.h"

#include <cmath>
#include <iterator>
#include <string>
#include <utility>
#include <stdexcept>

namespace {
    bool isFinite(const terra::globe::Point& point) {
        return std::isfinite(point(0)) && std::isfinite(point(1)) && std::isfinite(point(2));
    }

    bool isFinite(const terra::globe::LonLat& lonLat) {
        return std::isfinite(lonLat.lon) && std::isfinite(lonLat.lat) && std::isfinite(lonLat.height);
    }
}

namespace terra { namespace globe {
    void PolylineBuilder::appendLineData3D(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh, const CoordinateTransform* transform, std::vector<PathLonLat>* outPathsLonLat, std::vector<PathLonLat>* outPathsMercator) {
        validatePaths(paths);

        std::vector<PathLonLat> pathsLonLat, pathsMercator;
        if (transform) {
            transformPaths(paths, *transform, pathsLonLat, pathsMercator);
        }

        appendRings(paths, closed, mesh);

        if (transform) {
            if (outPathsLonLat) {
                std::move(pathsLonLat.begin(), pathsLonLat.end(), std::back_inserter(*outPathsLonLat));
            }
            if (outPathsMercator) {
                std::move(pathsMercator.begin(), pathsMercator.end(), std::back_inserter(*outPathsMercator));
            }
        }
    }

    void PolylineBuilder::appendLineDataLonLat(const std::vector<PathLonLat>& paths, bool closed, LineMesh& mesh, const CoordinateTransform& transform, std::vector<Path3D>* outPaths3D, std::vector<PathLonLat>* outPathsMercator) {
        validatePaths(paths);

        std::vector<Path3D> paths3D;
        std::vector<PathLonLat> pathsMercator;
        transformPaths(paths, transform, paths3D, pathsMercator);

        appendRings(paths3D, closed, mesh);

        if (outPaths3D) {
            std::move(paths3D.begin(), paths3D.end(), std::back_inserter(*outPaths3D));
        }
        if (outPathsMercator) {
            std::move(pathsMercator.begin(), pathsMercator.end(), std::back_inserter(*outPathsMercator));
        }
    }

    void PolylineBuilder::updateLineData3D(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh, const CoordinateTransform* transform, std::vector<PathLonLat>* outPathsLonLat, std::vector<PathLonLat>* outPathsMercator) {
        validatePaths(paths);
        checkTopology(ringSizes(paths), closed, mesh);

        std::vector<PathLonLat> pathsLonLat, pathsMercator;
        if (transform) {
            transformPaths(paths, *transform, pathsLonLat, pathsMercator);
        }

        writeRings(paths, closed, mesh);

        if (transform) {
            if (outPathsLonLat) {
                *outPathsLonLat = std::move(pathsLonLat);
            }
            if (outPathsMercator) {
                *outPathsMercator = std::move(pathsMercator);
            }
        }
    }

    void PolylineBuilder::updateLineDataLonLat(const std::vector<PathLonLat>& paths, bool closed, LineMesh& mesh, const CoordinateTransform& transform, std::vector<Path3D>* outPaths3D, std::vector<PathLonLat>* outPathsMercator) {
        validatePaths(paths);
        checkTopology(ringSizes(paths), closed, mesh);

        std::vector<Path3D> paths3D;
        std::vector<PathLonLat> pathsMercator;
        transformPaths(paths, transform, paths3D, pathsMercator);

        writeRings(paths3D, closed, mesh);

        if (outPaths3D) {
            *outPaths3D = std::move(paths3D);
        }
        if (outPathsMercator) {
            *outPathsMercator = std::move(pathsMercator);
        }
    }

    std::size_t PolylineBuilder::calculateVertexCount(const std::vector<std::size_t>& ringSizes) {
        std::size_t count = 0;
        for (std::size_t size : ringSizes) {
            count += VERTICES_PER_POINT * (size + 2);
        }
        return count;
    }

    std::size_t PolylineBuilder::calculateIndexCount(const std::vector<std::size_t>& ringSizes) {
        if (ringSizes.empty()) {
            return 0;
        }
        std::size_t count = 2 + 2 * (ringSizes.size() - 1);
        for (std::size_t size : ringSizes) {
            count += VERTICES_PER_POINT * size + 4;
        }
        return count;
    }

    void PolylineBuilder::validatePaths(const std::vector<Path3D>& paths) {
        for (std::size_t j = 0; j < paths.size(); j++) {
            if (paths[j].size() < MIN_PATH_POINTS) {
                throw InvalidPathError("Path must contain at least " + std::to_string(MIN_PATH_POINTS) + " points", j);
            }
            for (const Point& point : paths[j]) {
                if (!isFinite(point)) {
                    throw InvalidPathError("Path contains non-finite coordinates", j);
                }
            }
        }
    }

    void PolylineBuilder::validatePaths(const std::vector<PathLonLat>& paths) {
        for (std::size_t j = 0; j < paths.size(); j++) {
            if (paths[j].size() < MIN_PATH_POINTS) {
                throw InvalidPathError("Path must contain at least " + std::to_string(MIN_PATH_POINTS) + " points", j);
            }
            for (const LonLat& lonLat : paths[j]) {
                if (!isFinite(lonLat)) {
                    throw InvalidPathError("Path contains non-finite coordinates", j);
                }
            }
        }
    }

    void PolylineBuilder::checkTopology(const std::vector<std::size_t>& sizes, bool closed, const LineMesh& mesh) {
        if (sizes.size() != mesh.ringSizes.size()) {
            throw InvalidPathError("Ring count " + std::to_string(sizes.size()) + " does not match the line mesh ring count " + std::to_string(mesh.ringSizes.size()));
        }
        for (std::size_t j = 0; j < sizes.size(); j++) {
            if (sizes[j] != mesh.ringSizes[j]) {
                throw InvalidPathError("Ring size does not match the line mesh", j);
            }
            if (closed != mesh.ringsClosed[j]) {
                throw InvalidPathError("Ring closure does not match the line mesh", j);
            }
        }
    }

    unsigned int PolylineBuilder::calculateStartIndex(const LineMesh& mesh) {
        if (mesh.indices.empty()) {
            return 0;
        }
        if (mesh.indices.size() < 5) {
            throw std::invalid_argument("Line mesh indices are not terminated properly");
        }
        // Last real index of the previous ring, skipping its phantom point and the 4 trailing indices
        return mesh.indices[mesh.indices.size() - 5] + 9;
    }

    void PolylineBuilder::appendRings(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh) {
        if (paths.empty()) {
            return;
        }

        unsigned int index = calculateStartIndex(mesh);

        // Reserve everything first, appends below can not fail after this
        std::vector<std::size_t> sizes = ringSizes(paths);
        std::size_t vertexCount = calculateVertexCount(sizes);
        mesh.vertices.reserve(mesh.vertices.size() + vertexCount);
        mesh.orders.reserve(mesh.orders.size() + vertexCount);
        mesh.indices.reserve(mesh.indices.size() + calculateIndexCount(sizes));
        mesh.ringSizes.reserve(mesh.ringSizes.size() + sizes.size());
        mesh.ringsClosed.reserve(mesh.ringsClosed.size() + sizes.size());

        mesh.indices.append(index, index);

        for (std::size_t j = 0; j < paths.size(); j++) {
            const Path3D& path = paths[j];
            unsigned int startIndex = index;

            appendPoint(calculateStartPhantom(path, closed), mesh);

            for (const Point& point : path) {
                appendPoint(point, mesh);
                mesh.indices.append(index, index + 1, index + 2, index + 3);
                index += VERTICES_PER_POINT;
            }

            if (closed) {
                mesh.indices.append(startIndex, startIndex + 1, startIndex + 1, startIndex + 1);
            }
            else {
                mesh.indices.append(index - 1, index - 1, index - 1, index - 1);
            }

            appendPoint(calculateEndPhantom(path, closed), mesh);
            mesh.ringSizes.push_back(path.size());
            mesh.ringsClosed.push_back(closed);

            if (j + 1 < paths.size()) {
                index += 2 * VERTICES_PER_POINT;
                mesh.indices.append(index, index);
            }
        }
    }

    void PolylineBuilder::appendPoint(const Point& point, LineMesh& mesh) {
        cglib::vec3<float> vertex = cglib::vec3<float>::convert(point);
        mesh.vertices.append(vertex, vertex, vertex, vertex);
        mesh.orders.append(ORDERS[0], ORDERS[1], ORDERS[2], ORDERS[3]);
    }

    void PolylineBuilder::writeRings(const std::vector<Path3D>& paths, bool closed, LineMesh& mesh) {
        std::size_t offset = 0;
        for (const Path3D& path : paths) {
            offset = writePoint(calculateStartPhantom(path, closed), offset, mesh);
            for (const Point& point : path) {
                offset = writePoint(point, offset, mesh);
            }
            offset = writePoint(calculateEndPhantom(path, closed), offset, mesh);
        }
    }

    std::size_t PolylineBuilder::writePoint(const Point& point, std::size_t offset, LineMesh& mesh) {
        cglib::vec3<float> vertex = cglib::vec3<float>::convert(point);
        for (unsigned int i = 0; i < VERTICES_PER_POINT; i++) {
            mesh.vertices[offset + i] = vertex;
        }
        return offset + VERTICES_PER_POINT;
    }

    Point PolylineBuilder::calculateStartPhantom(const Path3D& path, bool closed) {
        if (closed) {
            return path.back();
        }
        return path[0] + (path[0] - path[1]);
    }

    Point PolylineBuilder::calculateEndPhantom(const Path3D& path, bool closed) {
        if (closed) {
            return path.front();
        }
        const Point& p0 = path[path.size() - 1];
        const Point& p1 = path[path.size() - 2];
        return p0 + (p0 - p1);
    }

    void PolylineBuilder::transformPaths(const std::vector<Path3D>& paths, const CoordinateTransform& transform, std::vector<PathLonLat>& pathsLonLat, std::vector<PathLonLat>& pathsMercator) {
        pathsLonLat.reserve(paths.size());
        pathsMercator.reserve(paths.size());
        for (const Path3D& path : paths) {
            PathLonLat pathLonLat, pathMercator;
            pathLonLat.reserve(path.size());
            pathMercator.reserve(path.size());
            for (const Point& point : path) {
                LonLat lonLat = transform.cartesianToLonLat(point);
                pathLonLat.push_back(lonLat);
                pathMercator.push_back(transform.forwardMercator(lonLat));
            }
            pathsLonLat.push_back(std::move(pathLonLat));
            pathsMercator.push_back(std::move(pathMercator));
        }
    }

    void PolylineBuilder::transformPaths(const std::vector<PathLonLat>& paths, const CoordinateTransform& transform, std::vector<Path3D>& paths3D, std::vector<PathLonLat>& pathsMercator) {
        paths3D.reserve(paths.size());
        pathsMercator.reserve(paths.size());
        for (const PathLonLat& path : paths) {
            Path3D path3D;
            PathLonLat pathMercator;
            path3D.reserve(path.size());
            pathMercator.reserve(path.size());
            for (const LonLat& lonLat : path) {
                path3D.push_back(transform.lonLatToCartesian(lonLat));
                pathMercator.push_back(transform.forwardMercator(lonLat));
            }
            paths3D.push_back(std::move(path3D));
            pathsMercator.push_back(std::move(pathMercator));
        }
    }
} }
