#include "Polyline.h"
#include "PolylineHandler.h"
#include "PolylineBuilder.h"
#include "PathNormalizer.h"
#include "Exceptions.h"

#include <utility>
#include <stdexcept>

namespace terra { namespace globe {
    Polyline::Polyline(std::shared_ptr<IdGenerator> idGenerator, const PolylineOptions& options, std::shared_ptr<Logger> logger) :
        _id(idGenerator ? idGenerator->generateId() : throw std::invalid_argument("Null id generator")),
        _thickness(options.settings.thickness),
        _color(options.settings.color),
        _pickingColor(0, 0, 0, 1),
        _visible(options.settings.visible),
        _closed(options.settings.closed),
        _logger(std::move(logger))
    {
        if (!options.path3D.empty()) {
            setPath3D(options.path3D);
        }
        else if (!options.pathLonLat.empty()) {
            setPathLonLat(options.pathLonLat);
        }
    }

    Polyline::~Polyline() {
        releaseBuffers();
    }

    void Polyline::setThickness(float thickness) {
        if (!(thickness >= 0)) {
            throw std::invalid_argument("Illegal polyline thickness");
        }
        _thickness = thickness;
    }

    void Polyline::setColor(const Color& color) {
        _color = color;
    }

    void Polyline::setColor(float r, float g, float b, float a) {
        _color = Color(r, g, b, a);
    }

    void Polyline::setOpacity(float opacity) {
        _color = Color::fromColorOpacity(_color, opacity);
    }

    void Polyline::setPickingColor(float r, float g, float b) {
        _pickingColor = Color(r / 255.0f, g / 255.0f, b / 255.0f, 1.0f);
    }

    void Polyline::setVisibility(bool visible) {
        _visible = visible;
    }

    void Polyline::setClosed(bool closed) {
        if (closed == _closed) {
            return;
        }
        rebuildPath(_pathSource, _path3D, _pathLonLat, closed);
    }

    bool Polyline::isEmpty() const {
        return _path3D.empty() && _pathLonLat.empty();
    }

    void Polyline::setPath3D(const std::vector<Path3D>& paths) {
        rebuildPath(PathSource::CARTESIAN, paths, std::vector<PathLonLat>(), _closed);
    }

    void Polyline::setRawPath3D(const std::vector<RawPath3D>& paths) {
        rebuildPath(PathSource::CARTESIAN, PathNormalizer::normalize(paths), std::vector<PathLonLat>(), _closed);
    }

    void Polyline::setPathLonLat(const std::vector<PathLonLat>& paths) {
        rebuildPath(PathSource::GEODETIC, std::vector<Path3D>(), paths, _closed);
    }

    void Polyline::setPath(const RawPath3D& path, bool closed) {
        rebuildPath(PathSource::CARTESIAN, std::vector<Path3D> { PathNormalizer::normalize(path) }, std::vector<PathLonLat>(), closed);
    }

    void Polyline::setPathEqualTopology3D(const std::vector<Path3D>& paths) {
        if (!_renderContext) {
            PolylineBuilder::validatePaths(paths);
            const std::vector<std::size_t> currentSizes = _pathSource == PathSource::CARTESIAN ? PolylineBuilder::ringSizes(_path3D) : PolylineBuilder::ringSizes(_pathLonLat);
            if (PolylineBuilder::ringSizes(paths) != currentSizes) {
                throw InvalidPathError("Path topology does not match the current path");
            }
            _path3D = paths;
            _pathLonLat.clear();
            _pathMercator.clear();
            _pathSource = PathSource::CARTESIAN;
            return;
        }

        std::shared_ptr<const CoordinateTransform> transform = _renderContext->getCoordinateTransform();
        std::vector<PathLonLat> pathsLonLat, pathsMercator;
        PolylineBuilder::updateLineData3D(paths, _closed, _mesh, transform.get(), &pathsLonLat, &pathsMercator);
        _path3D = paths;
        _pathLonLat = std::move(pathsLonLat);
        _pathMercator = std::move(pathsMercator);
        _pathSource = PathSource::CARTESIAN;
        _vertexBufferState = BufferState::DIRTY;
    }

    void Polyline::setPathEqualTopologyLonLat(const std::vector<PathLonLat>& paths) {
        if (!_renderContext) {
            PolylineBuilder::validatePaths(paths);
            const std::vector<std::size_t> currentSizes = _pathSource == PathSource::CARTESIAN ? PolylineBuilder::ringSizes(_path3D) : PolylineBuilder::ringSizes(_pathLonLat);
            if (PolylineBuilder::ringSizes(paths) != currentSizes) {
                throw InvalidPathError("Path topology does not match the current path");
            }
            _pathLonLat = paths;
            _path3D.clear();
            _pathMercator.clear();
            _pathSource = PathSource::GEODETIC;
            return;
        }

        std::shared_ptr<const CoordinateTransform> transform = _renderContext->getCoordinateTransform();
        if (!transform) {
            throw InvalidPathError("Geodetic path requires a coordinate transform");
        }
        std::vector<Path3D> paths3D;
        std::vector<PathLonLat> pathsMercator;
        PolylineBuilder::updateLineDataLonLat(paths, _closed, _mesh, *transform, &paths3D, &pathsMercator);
        _pathLonLat = paths;
        _path3D = std::move(paths3D);
        _pathMercator = std::move(pathsMercator);
        _pathSource = PathSource::GEODETIC;
        _vertexBufferState = BufferState::DIRTY;
    }

    Extent Polyline::getBoundingExtent() const {
        Extent extent = Extent::smallest();
        for (const PathLonLat& path : _pathLonLat) {
            for (const LonLat& lonLat : path) {
                extent.add(cglib::vec2<double>(lonLat.lon, lonLat.lat));
            }
        }
        return extent;
    }

    void Polyline::setRenderContext(std::shared_ptr<RenderContext> renderContext) {
        if (renderContext == _renderContext) {
            return;
        }

        if (!renderContext) {
            releaseBuffers();
            _renderContext.reset();
            return;
        }

        // Build the mesh first, so that a failure leaves the polyline attached to the old context
        LineMesh mesh;
        std::vector<Path3D> paths3D = _path3D;
        std::vector<PathLonLat> pathsLonLat = _pathLonLat;
        std::vector<PathLonLat> pathsMercator;
        std::shared_ptr<const CoordinateTransform> transform = renderContext->getCoordinateTransform();
        if (_pathSource == PathSource::CARTESIAN) {
            pathsLonLat.clear();
            PolylineBuilder::appendLineData3D(_path3D, _closed, mesh, transform.get(), &pathsLonLat, &pathsMercator);
        }
        else if (!_pathLonLat.empty()) {
            if (!transform) {
                throw InvalidPathError("Geodetic path requires a coordinate transform");
            }
            paths3D.clear();
            PolylineBuilder::appendLineDataLonLat(_pathLonLat, _closed, mesh, *transform, &paths3D, &pathsMercator);
        }

        releaseBuffers();
        _renderContext = std::move(renderContext);
        _mesh.swap(mesh);
        _path3D = std::move(paths3D);
        _pathLonLat = std::move(pathsLonLat);
        _pathMercator = std::move(pathsMercator);
        _vertexBufferState = BufferState::DIRTY;
        _indexBufferState = BufferState::DIRTY;
    }

    void Polyline::updateBuffers() {
        requireAttached("updateBuffers");

        if (_vertexBufferState == BufferState::DIRTY) {
            if (_verticesBuffer != 0) {
                _renderContext->deleteBuffer(_verticesBuffer);
                _verticesBuffer = 0;
            }
            if (!_mesh.vertices.empty()) {
                _verticesBuffer = _renderContext->createVertexBuffer(reinterpret_cast<const float*>(_mesh.vertices.data()), _mesh.vertices.size() * 3, 3);
            }
            _vertexBufferState = BufferState::CLEAN;
        }

        if (_indexBufferState == BufferState::DIRTY) {
            if (_ordersBuffer != 0) {
                _renderContext->deleteBuffer(_ordersBuffer);
                _ordersBuffer = 0;
            }
            if (_indicesBuffer != 0) {
                _renderContext->deleteBuffer(_indicesBuffer);
                _indicesBuffer = 0;
            }
            if (!_mesh.orders.empty()) {
                _ordersBuffer = _renderContext->createVertexBuffer(_mesh.orders.data(), _mesh.orders.size(), 1);
            }
            if (!_mesh.indices.empty()) {
                _indicesBuffer = _renderContext->createIndexBuffer(_mesh.indices.data(), _mesh.indices.size());
            }
            _indexBufferState = BufferState::CLEAN;
        }
    }

    void Polyline::draw() {
        if (!_visible || isEmpty()) {
            return;
        }
        requireAttached("draw");
        updateBuffers();

        RenderContext::LineDrawParameters params;
        params.verticesBuffer = _verticesBuffer;
        params.ordersBuffer = _ordersBuffer;
        params.indicesBuffer = _indicesBuffer;
        params.indexCount = _mesh.indices.size();
        params.color = _color;
        params.thickness = _thickness * 0.5f;
        params.blend = true;
        _renderContext->drawLineStrip(params);
    }

    void Polyline::drawPicking() {
        if (!_visible || isEmpty()) {
            return;
        }
        requireAttached("drawPicking");
        updateBuffers();

        RenderContext::LineDrawParameters params;
        params.verticesBuffer = _verticesBuffer;
        params.ordersBuffer = _ordersBuffer;
        params.indicesBuffer = _indicesBuffer;
        params.indexCount = _mesh.indices.size();
        params.color = Color::fromColorOpacity(_pickingColor, 1.0f);
        params.thickness = _thickness * 0.5f;
        params.blend = false;
        _renderContext->drawLineStrip(params);
    }

    void Polyline::clear() {
        releaseBuffers();
        _path3D.clear();
        _pathLonLat.clear();
        _pathMercator.clear();
        _mesh.clear();
        _pathSource = PathSource::CARTESIAN;
    }

    void Polyline::remove() {
        releaseBuffers();
        _renderContext.reset();
        if (PolylineHandler* handler = _handler) {
            _handler = nullptr;
            handler->unlink(this); // may release the last reference to this polyline
        }
    }

    void Polyline::rebuildPath(PathSource source, std::vector<Path3D> paths3D, std::vector<PathLonLat> pathsLonLat, bool closed) {
        std::vector<PathLonLat> pathsMercator;
        if (!_renderContext) {
            if (source == PathSource::CARTESIAN) {
                PolylineBuilder::validatePaths(paths3D);
                pathsLonLat.clear();
            }
            else {
                PolylineBuilder::validatePaths(pathsLonLat);
                paths3D.clear();
            }
            _pathSource = source;
            _path3D = std::move(paths3D);
            _pathLonLat = std::move(pathsLonLat);
            _pathMercator.clear();
            _closed = closed;
            return;
        }

        LineMesh mesh;
        std::shared_ptr<const CoordinateTransform> transform = _renderContext->getCoordinateTransform();
        if (source == PathSource::CARTESIAN) {
            pathsLonLat.clear();
            PolylineBuilder::appendLineData3D(paths3D, closed, mesh, transform.get(), &pathsLonLat, &pathsMercator);
        }
        else {
            if (!transform) {
                throw InvalidPathError("Geodetic path requires a coordinate transform");
            }
            paths3D.clear();
            PolylineBuilder::appendLineDataLonLat(pathsLonLat, closed, mesh, *transform, &paths3D, &pathsMercator);
        }

        _pathSource = source;
        _path3D = std::move(paths3D);
        _pathLonLat = std::move(pathsLonLat);
        _pathMercator = std::move(pathsMercator);
        _closed = closed;
        _mesh.swap(mesh);
        _vertexBufferState = BufferState::DIRTY;
        _indexBufferState = BufferState::DIRTY;
    }

    void Polyline::requireAttached(const std::string& operation) const {
        if (!_renderContext) {
            std::string msg = "Polyline " + std::to_string(_id) + " is not attached to a render context, " + operation + " failed";
            log(Logger::Severity::ERROR, msg);
            throw DetachedResourceError(msg);
        }
    }

    void Polyline::releaseBuffers() {
        if (_renderContext) {
            for (RenderContext::BufferHandle* buffer : { &_verticesBuffer, &_ordersBuffer, &_indicesBuffer }) {
                if (*buffer != 0) {
                    _renderContext->deleteBuffer(*buffer);
                    *buffer = 0;
                }
            }
        }
        _vertexBufferState = BufferState::DETACHED;
        _indexBufferState = BufferState::DETACHED;
    }

    void Polyline::log(Logger::Severity severity, const std::string& msg) const {
        if (_logger) {
            _logger->write(severity, msg);
        }
    }
} }
