/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_POLYLINE_H_
#define _TERRA_GLOBE_POLYLINE_H_

#include "Base.h"
#include "Color.h"
#include "LineMesh.h"
#include "Logger.h"
#include "IdGenerator.h"
#include "RenderContext.h"
#include "Settings.h"

#include <memory>
#include <string>
#include <vector>

namespace terra { namespace globe {
    class PolylineHandler;

    struct PolylineOptions {
        PolylineSettings settings;
        std::vector<Path3D> path3D; // takes precedence over pathLonLat if both are given
        std::vector<PathLonLat> pathLonLat;
    };

    /**
     * Thick screen-space polyline consisting of one or more rings.
     * The line mesh is built when the polyline is attached to a render context, GPU buffers are
     * (re)created lazily on the next draw call.
     */
    class Polyline final {
    public:
        enum class BufferState {
            DETACHED, DIRTY, CLEAN
        };

        explicit Polyline(std::shared_ptr<IdGenerator> idGenerator, const PolylineOptions& options = PolylineOptions(), std::shared_ptr<Logger> logger = std::shared_ptr<Logger>());
        Polyline(const Polyline&) = delete;
        ~Polyline();

        Polyline& operator = (const Polyline&) = delete;

        long long getId() const { return _id; }

        float getThickness() const { return _thickness; }
        void setThickness(float thickness);

        const Color& getColor() const { return _color; }
        void setColor(const Color& color);
        void setColor(float r, float g, float b, float a = 1.0f);
        void setOpacity(float opacity);

        const Color& getPickingColor() const { return _pickingColor; }
        void setPickingColor(float r, float g, float b);

        bool isVisible() const { return _visible; }
        void setVisibility(bool visible);

        bool isClosed() const { return _closed; }
        void setClosed(bool closed);

        bool isEmpty() const;

        void setPath3D(const std::vector<Path3D>& paths);
        void setRawPath3D(const std::vector<RawPath3D>& paths);
        void setPathLonLat(const std::vector<PathLonLat>& paths);
        void setPath(const RawPath3D& path, bool closed);

        // Updates point positions only, the number of rings and points per ring must match the current path
        void setPathEqualTopology3D(const std::vector<Path3D>& paths);
        void setPathEqualTopologyLonLat(const std::vector<PathLonLat>& paths);

        const std::vector<Path3D>& getPath3D() const { return _path3D; }
        const std::vector<PathLonLat>& getPathLonLat() const { return _pathLonLat; }
        const std::vector<PathLonLat>& getPathMercator() const { return _pathMercator; }

        const LineMesh& getLineMesh() const { return _mesh; }

        // Lon/lat extent of the path, empty if geodetic coordinates are not known
        Extent getBoundingExtent() const;

        const std::shared_ptr<RenderContext>& getRenderContext() const { return _renderContext; }
        void setRenderContext(std::shared_ptr<RenderContext> renderContext);

        BufferState getVertexBufferState() const { return _vertexBufferState; }
        BufferState getIndexBufferState() const { return _indexBufferState; }

        void updateBuffers();
        void draw();
        void drawPicking();

        // Releases GPU buffers and removes all rings, keeps the render context
        void clear();

        // Releases GPU buffers, detaches from the render context and removes the polyline from its handler
        void remove();

        PolylineHandler* getHandler() const { return _handler; }

    private:
        friend class PolylineHandler;

        enum class PathSource {
            CARTESIAN, GEODETIC
        };

        void rebuildPath(PathSource source, std::vector<Path3D> paths3D, std::vector<PathLonLat> pathsLonLat, bool closed);
        void requireAttached(const std::string& operation) const;
        void releaseBuffers();
        void log(Logger::Severity severity, const std::string& msg) const;

        const long long _id;
        float _thickness;
        Color _color;
        Color _pickingColor;
        bool _visible;
        bool _closed;

        PathSource _pathSource = PathSource::CARTESIAN;
        std::vector<Path3D> _path3D;
        std::vector<PathLonLat> _pathLonLat;
        std::vector<PathLonLat> _pathMercator;
        LineMesh _mesh;

        std::shared_ptr<RenderContext> _renderContext;
        BufferState _vertexBufferState = BufferState::DETACHED;
        BufferState _indexBufferState = BufferState::DETACHED;
        RenderContext::BufferHandle _verticesBuffer = 0;
        RenderContext::BufferHandle _ordersBuffer = 0;
        RenderContext::BufferHandle _indicesBuffer = 0;

        PolylineHandler* _handler = nullptr;
        const std::shared_ptr<Logger> _logger;
    };
} }

#endif
