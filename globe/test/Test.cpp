#define BOOST_TEST_MODULE GLOBE

#include "PolylineBuilder.h"
#include "PathNormalizer.h"
#include "Polyline.h"
#include "PolylineHandler.h"
#include "Ellipsoid.h"
#include "AtlasPacker.h"
#include "ImageCanvas.h"
#include "TextureAtlas.h"
#include "Settings.h"
#include "AtlasJSON.h"
#include "Exceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <random>
#include <string>

#include <picojson/picojson.h>

#include <boost/math/constants/constants.hpp>
#include <boost/test/included/unit_test.hpp>

using namespace terra::globe;

class RecordingRenderContext : public RenderContext {
public:
    explicit RecordingRenderContext(std::shared_ptr<const CoordinateTransform> transform = std::shared_ptr<const CoordinateTransform>()) : _transform(std::move(transform)) { }

    virtual BufferHandle createVertexBuffer(const float* data, std::size_t count, int itemSize) override {
        BufferHandle handle = _nextHandle++;
        vertexBuffers[handle] = std::vector<float>(data, data + count);
        itemSizes[handle] = itemSize;
        events.push_back("create:" + std::to_string(handle));
        return handle;
    }

    virtual BufferHandle createIndexBuffer(const unsigned int* data, std::size_t count) override {
        BufferHandle handle = _nextHandle++;
        indexBuffers[handle] = std::vector<unsigned int>(data, data + count);
        events.push_back("create:" + std::to_string(handle));
        return handle;
    }

    virtual void deleteBuffer(BufferHandle buffer) override {
        if (vertexBuffers.erase(buffer) + indexBuffers.erase(buffer) == 0) {
            invalidDeletes++;
        }
        events.push_back("delete:" + std::to_string(buffer));
    }

    virtual TextureHandle createTexture(const Bitmap& bitmap) override {
        TextureHandle handle = _nextHandle++;
        textures.emplace(handle, bitmap);
        events.push_back("texture:" + std::to_string(handle));
        return handle;
    }

    virtual void deleteTexture(TextureHandle texture) override {
        if (textures.erase(texture) == 0) {
            invalidDeletes++;
        }
        events.push_back("deltexture:" + std::to_string(texture));
    }

    virtual void drawLineStrip(const LineDrawParameters& params) override {
        if (vertexBuffers.count(params.verticesBuffer) == 0 || vertexBuffers.count(params.ordersBuffer) == 0 || indexBuffers.count(params.indicesBuffer) == 0) {
            invalidDraws++;
        }
        draws.push_back(params);
    }

    virtual std::shared_ptr<const CoordinateTransform> getCoordinateTransform() const override {
        return _transform;
    }

    std::size_t liveBufferCount() const {
        return vertexBuffers.size() + indexBuffers.size();
    }

    std::map<BufferHandle, std::vector<float>> vertexBuffers;
    std::map<BufferHandle, int> itemSizes;
    std::map<BufferHandle, std::vector<unsigned int>> indexBuffers;
    std::map<TextureHandle, Bitmap> textures;
    std::vector<LineDrawParameters> draws;
    std::vector<std::string> events;
    int invalidDeletes = 0;
    int invalidDraws = 0;

private:
    const std::shared_ptr<const CoordinateTransform> _transform;
    unsigned int _nextHandle = 1;
};

static bool equal(const LonLat& lonLat0, const LonLat& lonLat1) {
    static constexpr double DEGREE_EPSILON = 1.0e-7;
    static constexpr double HEIGHT_EPSILON = 1.0e-3;
    return std::abs(lonLat0.lon - lonLat1.lon) <= DEGREE_EPSILON && std::abs(lonLat0.lat - lonLat1.lat) <= DEGREE_EPSILON && std::abs(lonLat0.height - lonLat1.height) <= HEIGHT_EPSILON;
}

static picojson::value parseJSON(const std::string& json) {
    picojson::value value;
    std::string err = picojson::parse(value, json);
    if (!err.empty()) {
        throw std::runtime_error(err);
    }
    return value;
}

static Path3D createChain(double dist, int n) {
    Path3D points;
    for (int i = 0; i < n; i++) {
        points.emplace_back(i * dist, 0.0, 0.0);
    }
    return points;
}

static Path3D createRing(double radius, int n) {
    Path3D points;
    for (int i = 0; i < n; i++) {
        double angle = (i + 0.5) / n * 2 * boost::math::constants::pi<double>();
        points.emplace_back(radius * std::cos(angle), radius * std::sin(angle), 0.0);
    }
    return points;
}

static Path3D shiftPoints(Path3D points, const cglib::vec3<double>& delta) {
    for (Point& point : points) {
        point += delta;
    }
    return points;
}

static std::shared_ptr<const Bitmap> createImage(int width, int height, const Color& color = Color(1, 1, 1, 1)) {
    return std::make_shared<Bitmap>(width, height, std::vector<std::uint32_t>(static_cast<std::size_t>(width) * height, color.pixel()));
}

static bool meshesEqual(const LineMesh& mesh0, const LineMesh& mesh1) {
    return mesh0.vertices == mesh1.vertices && mesh0.orders == mesh1.orders && mesh0.indices == mesh1.indices;
}

// Build the simplest open path and check the complete mesh layout
BOOST_AUTO_TEST_CASE(openPathLayout) {
    LineMesh mesh;
    PolylineBuilder::appendLineData3D({ { Point(0, 0, 0), Point(10, 0, 0) } }, false, mesh);

    BOOST_CHECK(mesh.vertices.size() == 16);
    BOOST_CHECK(mesh.orders.size() == 16);
    for (std::size_t i = 0; i < mesh.orders.size(); i++) {
        BOOST_CHECK(mesh.orders[i] == PolylineBuilder::ORDERS[i % 4]);
    }

    const std::vector<cglib::vec3<float>> expectedPoints = { cglib::vec3<float>(-10, 0, 0), cglib::vec3<float>(0, 0, 0), cglib::vec3<float>(10, 0, 0), cglib::vec3<float>(20, 0, 0) };
    for (std::size_t i = 0; i < mesh.vertices.size(); i++) {
        BOOST_CHECK(mesh.vertices[i] == expectedPoints[i / 4]);
    }

    const std::vector<unsigned int> expectedIndices = { 0, 0, 0, 1, 2, 3, 4, 5, 6, 7, 7, 7, 7, 7 };
    BOOST_CHECK(std::vector<unsigned int>(mesh.indices.begin(), mesh.indices.end()) == expectedIndices);
}

// Vertex, order and index counts for open and closed paths of various lengths
BOOST_AUTO_TEST_CASE(meshSizes) {
    for (bool closed : { false, true }) {
        for (int n = 2; n <= 50; n++) {
            LineMesh mesh;
            PolylineBuilder::appendLineData3D({ createRing(5.0, n) }, closed, mesh);
            BOOST_CHECK(mesh.vertices.size() == static_cast<std::size_t>(4 * (n + 2)));
            BOOST_CHECK(mesh.orders.size() == mesh.vertices.size());
            BOOST_CHECK(mesh.indices.size() == static_cast<std::size_t>(2 + 4 * n + 4));
            BOOST_CHECK(mesh.indices.size() == PolylineBuilder::calculateIndexCount({ static_cast<std::size_t>(n) }));
        }
    }
}

// Closed rings wrap their phantom points around and close the strip at the first point
BOOST_AUTO_TEST_CASE(closedRingLayout) {
    Path3D ring = createRing(3.0, 5);
    LineMesh mesh;
    PolylineBuilder::appendLineData3D({ ring }, true, mesh);

    for (int i = 0; i < 4; i++) {
        BOOST_CHECK(mesh.vertices[i] == cglib::vec3<float>::convert(ring.back()));
        BOOST_CHECK(mesh.vertices[mesh.vertices.size() - 4 + i] == cglib::vec3<float>::convert(ring.front()));
    }

    std::size_t n = mesh.indices.size();
    BOOST_CHECK(mesh.indices[n - 4] == 0);
    BOOST_CHECK(mesh.indices[n - 3] == 1);
    BOOST_CHECK(mesh.indices[n - 2] == 1);
    BOOST_CHECK(mesh.indices[n - 1] == 1);
}

// Several rings in one call produce the same mesh as appending the rings one by one
BOOST_AUTO_TEST_CASE(multiRingAppend) {
    std::vector<Path3D> rings = { createChain(1.0, 3), shiftPoints(createRing(2.0, 7), cglib::vec3<double>(10, 0, 0)), createChain(-0.5, 2) };
    for (bool closed : { false, true }) {
        LineMesh mesh;
        PolylineBuilder::appendLineData3D(rings, closed, mesh);

        LineMesh incrementalMesh;
        for (const Path3D& ring : rings) {
            PolylineBuilder::appendLineData3D({ ring }, closed, incrementalMesh);
        }
        BOOST_CHECK(meshesEqual(mesh, incrementalMesh));

        std::vector<std::size_t> sizes = PolylineBuilder::ringSizes(rings);
        BOOST_CHECK(mesh.vertices.size() == PolylineBuilder::calculateVertexCount(sizes));
        BOOST_CHECK(mesh.indices.size() == PolylineBuilder::calculateIndexCount(sizes));

        // The 'next' vertex of every index must still be inside the vertex buffer
        for (unsigned int index : mesh.indices) {
            BOOST_CHECK(index + 8 < mesh.vertices.size());
        }
    }
}

// Appending to a mesh with a truncated index buffer is rejected
BOOST_AUTO_TEST_CASE(truncatedMeshAppend) {
    LineMesh mesh;
    mesh.indices.append(0u, 0u, 1u);
    BOOST_CHECK_THROW(PolylineBuilder::appendLineData3D({ createChain(1.0, 2) }, false, mesh), std::invalid_argument);
}

// Equal topology updates rewrite vertex positions exactly like a full rebuild
BOOST_AUTO_TEST_CASE(equalTopologyUpdate) {
    std::vector<Path3D> rings0 = { createChain(1.0, 4), createRing(1.0, 6) };
    std::vector<Path3D> rings1 = { shiftPoints(createChain(2.0, 4), cglib::vec3<double>(0, 1, 2)), createRing(3.5, 6) };
    for (bool closed : { false, true }) {
        LineMesh mesh;
        PolylineBuilder::appendLineData3D(rings0, closed, mesh);
        PolylineBuilder::updateLineData3D(rings1, closed, mesh);

        LineMesh rebuiltMesh;
        PolylineBuilder::appendLineData3D(rings1, closed, rebuiltMesh);
        BOOST_CHECK(meshesEqual(mesh, rebuiltMesh));
    }
}

// Topology mismatch in an update is rejected and the mesh is kept intact
BOOST_AUTO_TEST_CASE(equalTopologyMismatch) {
    LineMesh mesh;
    PolylineBuilder::appendLineData3D({ createChain(1.0, 4) }, false, mesh);
    LineMesh originalMesh = mesh;

    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(1.0, 5) }, false, mesh), InvalidPathError);
    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(1.0, 2), createChain(1.0, 2) }, false, mesh), InvalidPathError);
    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(2.0, 4) }, true, mesh), InvalidPathError);
    BOOST_CHECK(meshesEqual(mesh, originalMesh));

    // Same vertex count, different ring layout
    LineMesh singleRingMesh;
    PolylineBuilder::appendLineData3D({ createChain(1.0, 6) }, false, singleRingMesh);
    LineMesh originalSingleRingMesh = singleRingMesh;
    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(1.0, 2), createChain(1.0, 2) }, false, singleRingMesh), InvalidPathError);
    BOOST_CHECK(meshesEqual(singleRingMesh, originalSingleRingMesh));

    LineMesh twoRingMesh;
    PolylineBuilder::appendLineData3D({ createChain(1.0, 2), createChain(1.0, 2) }, false, twoRingMesh);
    LineMesh originalTwoRingMesh = twoRingMesh;
    BOOST_CHECK(twoRingMesh.vertices.size() == singleRingMesh.vertices.size());
    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(1.0, 6) }, false, twoRingMesh), InvalidPathError);
    BOOST_CHECK_THROW(PolylineBuilder::updateLineDataLonLat({ { LonLat(0, 0), LonLat(1, 1), LonLat(2, 2), LonLat(3, 3), LonLat(4, 4), LonLat(5, 5) } }, false, twoRingMesh, *Ellipsoid::WGS84()), InvalidPathError);
    BOOST_CHECK(meshesEqual(twoRingMesh, originalTwoRingMesh));

    // Rings appended with different closure can not be updated with a single flag
    LineMesh mixedMesh;
    PolylineBuilder::appendLineData3D({ createChain(1.0, 3) }, false, mixedMesh);
    PolylineBuilder::appendLineData3D({ createRing(1.0, 3) }, true, mixedMesh);
    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(2.0, 3), createRing(2.0, 3) }, false, mixedMesh), InvalidPathError);
    BOOST_CHECK_THROW(PolylineBuilder::updateLineData3D({ createChain(2.0, 3), createRing(2.0, 3) }, true, mixedMesh), InvalidPathError);
}

// An attached polyline rejects position updates with a different ring layout
BOOST_AUTO_TEST_CASE(polylineEqualTopologyMismatch) {
    auto context = std::make_shared<RecordingRenderContext>();
    PolylineOptions options;
    options.path3D = { createChain(1.0, 6) };
    Polyline polyline(std::make_shared<IdGenerator>(), options);
    polyline.setRenderContext(context);
    polyline.draw();
    std::vector<unsigned int> indices = context->indexBuffers[context->draws.back().indicesBuffer];

    BOOST_CHECK_THROW(polyline.setPathEqualTopology3D({ createChain(1.0, 2), createChain(1.0, 2) }), InvalidPathError);
    BOOST_CHECK(polyline.getPath3D().size() == 1 && polyline.getPath3D()[0].size() == 6);
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::CLEAN);

    polyline.setPathEqualTopology3D({ createChain(3.0, 6) });
    polyline.draw();
    BOOST_CHECK(context->indexBuffers[context->draws.back().indicesBuffer] == indices);

    LineMesh rebuiltMesh;
    PolylineBuilder::appendLineData3D({ createChain(3.0, 6) }, false, rebuiltMesh);
    BOOST_CHECK(meshesEqual(polyline.getLineMesh(), rebuiltMesh));
    BOOST_CHECK(context->invalidDraws == 0);
}

// Malformed paths raise errors naming the offending ring and leave the mesh untouched
BOOST_AUTO_TEST_CASE(invalidPaths) {
    LineMesh mesh;
    PolylineBuilder::appendLineData3D({ createChain(1.0, 3) }, false, mesh);
    LineMesh originalMesh = mesh;

    try {
        PolylineBuilder::appendLineData3D({ createChain(1.0, 3), createChain(1.0, 1) }, false, mesh);
        BOOST_ERROR("Single point ring accepted");
    }
    catch (const InvalidPathError& ex) {
        BOOST_CHECK(ex.ringIndex() == 1);
    }

    Path3D nanPath = createChain(1.0, 3);
    nanPath[1](2) = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK_THROW(PolylineBuilder::appendLineData3D({ nanPath }, true, mesh), InvalidPathError);
    BOOST_CHECK_THROW(PolylineBuilder::appendLineData3D({ Path3D() }, true, mesh), InvalidPathError);
    BOOST_CHECK_THROW(PolylineBuilder::appendLineDataLonLat({ { LonLat(0, 0) } }, false, mesh, *Ellipsoid::WGS84()), InvalidPathError);
    BOOST_CHECK(meshesEqual(mesh, originalMesh));

    PolylineBuilder::appendLineData3D(std::vector<Path3D>(), false, mesh);
    BOOST_CHECK(meshesEqual(mesh, originalMesh));
}

// Geodetic and cartesian builds agree and the derived coordinates round-trip
BOOST_AUTO_TEST_CASE(geodeticRoundTrip) {
    std::shared_ptr<const Ellipsoid> ellipsoid = Ellipsoid::WGS84();
    std::vector<PathLonLat> pathsLonLat = { { LonLat(24.75, 59.43, 10), LonLat(25.01, 59.52, 120), LonLat(-120.5, -33.2, 0), LonLat(179.9, 89.0, 5000) } };

    LineMesh mesh0;
    std::vector<Path3D> paths3D;
    std::vector<PathLonLat> pathsMercator0;
    PolylineBuilder::appendLineDataLonLat(pathsLonLat, false, mesh0, *ellipsoid, &paths3D, &pathsMercator0);

    LineMesh mesh1;
    std::vector<PathLonLat> pathsLonLat1;
    std::vector<PathLonLat> pathsMercator1;
    PolylineBuilder::appendLineData3D(paths3D, false, mesh1, ellipsoid.get(), &pathsLonLat1, &pathsMercator1);

    BOOST_CHECK(meshesEqual(mesh0, mesh1));
    BOOST_REQUIRE(pathsLonLat1.size() == 1 && pathsLonLat1[0].size() == pathsLonLat[0].size());
    for (std::size_t i = 0; i < pathsLonLat[0].size(); i++) {
        BOOST_CHECK(equal(pathsLonLat1[0][i], pathsLonLat[0][i]));
        BOOST_CHECK(std::abs(pathsMercator0[0][i].lon - pathsMercator1[0][i].lon) < 1.0e-2);
        BOOST_CHECK(std::abs(pathsMercator0[0][i].lat - pathsMercator1[0][i].lat) < 1.0e-2);
    }
}

// Ellipsoid axes and mercator projection constants
BOOST_AUTO_TEST_CASE(coordinateTransforms) {
    std::shared_ptr<const Ellipsoid> ellipsoid = Ellipsoid::WGS84();
    Point p0 = ellipsoid->lonLatToCartesian(LonLat(0, 0, 0));
    BOOST_CHECK(std::abs(p0(0) - ellipsoid->getEquatorialRadius()) < 1.0e-6);
    Point p1 = ellipsoid->lonLatToCartesian(LonLat(0, 90, 0));
    BOOST_CHECK(std::abs(p1(2) - ellipsoid->getPolarRadius()) < 1.0e-6);
    BOOST_CHECK_THROW(Ellipsoid(1.0, 2.0), std::invalid_argument);

    LonLat merc = LonLat(180, 0).forwardMercator();
    BOOST_CHECK(std::abs(merc.lon - LonLat::POLE) < 1.0e-6);
    BOOST_CHECK(std::abs(merc.lat) < 1.0e-6);
    BOOST_CHECK(std::abs(LonLat(0, 90).forwardMercator().lat - LonLat(0, LonLat::MAX_MERCATOR_LAT).forwardMercator().lat) < 1.0e-6);
    BOOST_CHECK(equal(LonLat(12.5, -41.25, 7).forwardMercator().inverseMercator(), LonLat(12.5, -41.25, 7)));
}

// Raw coordinate triples and points can be mixed in one path
BOOST_AUTO_TEST_CASE(rawPathNormalization) {
    RawPath3D rawPath = { PathVertex(Point(1, 2, 3)), PathVertex(std::array<double, 3> { { 4, 5, 6 } }), PathVertex(Point(7, 8, 9)) };
    Path3D path = PathNormalizer::normalize(rawPath);
    BOOST_CHECK(path == Path3D({ Point(1, 2, 3), Point(4, 5, 6), Point(7, 8, 9) }));
}

// Ids are unique and increasing
BOOST_AUTO_TEST_CASE(polylineIds) {
    auto idGenerator = std::make_shared<IdGenerator>(10);
    Polyline polyline0(idGenerator);
    Polyline polyline1(idGenerator);
    BOOST_CHECK(polyline0.getId() == 10);
    BOOST_CHECK(polyline1.getId() == 11);
    BOOST_CHECK(idGenerator->peekNextId() == 12);
}

// Drawing requires a render context, but only if there is something to draw
BOOST_AUTO_TEST_CASE(detachedPolyline) {
    auto idGenerator = std::make_shared<IdGenerator>();
    Polyline polyline(idGenerator);
    BOOST_CHECK_NO_THROW(polyline.draw());

    polyline.setPath3D({ createChain(1.0, 3) });
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::DETACHED);
    BOOST_CHECK(polyline.getLineMesh().empty());
    BOOST_CHECK_THROW(polyline.draw(), DetachedResourceError);
    BOOST_CHECK_THROW(polyline.drawPicking(), DetachedResourceError);
    BOOST_CHECK_THROW(polyline.updateBuffers(), DetachedResourceError);

    polyline.setVisibility(false);
    BOOST_CHECK_NO_THROW(polyline.draw());
}

// Buffers are built lazily on draw and old buffers are released before new ones are created
BOOST_AUTO_TEST_CASE(polylineBufferLifecycle) {
    auto context = std::make_shared<RecordingRenderContext>();
    auto idGenerator = std::make_shared<IdGenerator>();
    PolylineOptions options;
    options.path3D = { createChain(1.0, 4) };
    Polyline polyline(idGenerator, options);

    polyline.setRenderContext(context);
    BOOST_CHECK(polyline.getLineMesh().vertices.size() == 24);
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::DIRTY);
    BOOST_CHECK(polyline.getIndexBufferState() == Polyline::BufferState::DIRTY);
    BOOST_CHECK(context->liveBufferCount() == 0);

    polyline.draw();
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::CLEAN);
    BOOST_CHECK(polyline.getIndexBufferState() == Polyline::BufferState::CLEAN);
    BOOST_CHECK(context->liveBufferCount() == 3);
    BOOST_REQUIRE(context->draws.size() == 1);
    const RenderContext::LineDrawParameters& params = context->draws[0];
    BOOST_CHECK(params.indexCount == 2 + 4 * 4 + 4);
    BOOST_CHECK(params.thickness == PolylineSettings::DEFAULT_THICKNESS * 0.5f);
    BOOST_CHECK(params.color == Color(1, 1, 1, 1));
    BOOST_CHECK(params.blend);
    BOOST_CHECK(context->vertexBuffers[params.verticesBuffer].size() == 24 * 3);
    BOOST_CHECK(context->itemSizes[params.verticesBuffer] == 3);
    BOOST_CHECK(context->itemSizes[params.ordersBuffer] == 1);

    // Position-only update touches the vertex buffer alone
    RenderContext::BufferHandle oldVertices = params.verticesBuffer;
    RenderContext::BufferHandle oldIndices = params.indicesBuffer;
    polyline.setPathEqualTopology3D({ createChain(2.0, 4) });
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::DIRTY);
    BOOST_CHECK(polyline.getIndexBufferState() == Polyline::BufferState::CLEAN);
    context->events.clear();
    polyline.draw();
    BOOST_REQUIRE(context->events.size() == 2);
    BOOST_CHECK(context->events[0] == "delete:" + std::to_string(oldVertices));
    BOOST_CHECK(context->events[1].find("create:") == 0);
    BOOST_CHECK(context->draws.back().indicesBuffer == oldIndices);
    BOOST_CHECK(context->liveBufferCount() == 3);

    // Path replacement rebuilds everything
    polyline.setPath3D({ createChain(1.0, 2), createChain(3.0, 3) });
    BOOST_CHECK(polyline.getIndexBufferState() == Polyline::BufferState::DIRTY);
    polyline.draw();
    BOOST_CHECK(context->liveBufferCount() == 3);
    BOOST_CHECK(context->draws.back().indexCount == PolylineBuilder::calculateIndexCount({ 2, 3 }));

    // Invalid update keeps the current path
    BOOST_CHECK_THROW(polyline.setPathEqualTopology3D({ createChain(1.0, 2) }), InvalidPathError);
    BOOST_CHECK(polyline.getPath3D().size() == 2);

    polyline.setRenderContext(std::shared_ptr<RenderContext>());
    BOOST_CHECK(context->liveBufferCount() == 0);
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::DETACHED);
    BOOST_CHECK(context->invalidDeletes == 0);
    BOOST_CHECK(context->invalidDraws == 0);
}

// Picking draw uses the opaque picking color without blending
BOOST_AUTO_TEST_CASE(polylinePicking) {
    auto context = std::make_shared<RecordingRenderContext>();
    Polyline polyline(std::make_shared<IdGenerator>());
    polyline.setRenderContext(context);
    polyline.setPath(RawPath3D { PathVertex(Point(0, 0, 0)), PathVertex(std::array<double, 3> { { 1, 1, 1 } }) }, true);
    polyline.setThickness(4.0f);
    polyline.setColor(0.5f, 0.25f, 0.0f, 0.5f);
    polyline.setPickingColor(255, 0, 51);

    polyline.drawPicking();
    polyline.draw();
    BOOST_REQUIRE(context->draws.size() == 2);
    BOOST_CHECK(!context->draws[0].blend);
    BOOST_CHECK(context->draws[0].color == Color(1.0f, 0.0f, 0.2f, 1.0f));
    BOOST_CHECK(context->draws[0].thickness == 2.0f);
    BOOST_CHECK(context->draws[1].blend);
    BOOST_CHECK(context->draws[1].color == Color(0.5f, 0.25f, 0.0f, 0.5f));
    BOOST_CHECK(polyline.isClosed());
}

// Geodetic paths need a coordinate transform once attached
BOOST_AUTO_TEST_CASE(geodeticPolyline) {
    std::vector<PathLonLat> pathsLonLat = { { LonLat(10, 20), LonLat(15, 25), LonLat(-5, 30) } };

    Polyline polyline(std::make_shared<IdGenerator>());
    polyline.setPathLonLat(pathsLonLat);
    BOOST_CHECK(polyline.getPath3D().empty());
    BOOST_CHECK_THROW(polyline.setRenderContext(std::make_shared<RecordingRenderContext>()), InvalidPathError);
    BOOST_CHECK(!polyline.getRenderContext());

    auto context = std::make_shared<RecordingRenderContext>(Ellipsoid::WGS84());
    polyline.setRenderContext(context);
    BOOST_CHECK(polyline.getPath3D().size() == 1 && polyline.getPath3D()[0].size() == 3);
    BOOST_CHECK(polyline.getPathMercator().size() == 1);

    Extent extent = polyline.getBoundingExtent();
    BOOST_CHECK(extent.min(0) == -5 && extent.max(0) == 15);
    BOOST_CHECK(extent.min(1) == 20 && extent.max(1) == 30);

    polyline.setPathEqualTopologyLonLat({ { LonLat(11, 21), LonLat(16, 26), LonLat(-4, 31) } });
    BOOST_CHECK(polyline.getBoundingExtent().min(0) == -4);
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::DIRTY);

    // Cartesian paths get geodetic coordinates from the transform
    polyline.setPath3D({ { Ellipsoid::WGS84()->lonLatToCartesian(LonLat(1, 2)), Ellipsoid::WGS84()->lonLatToCartesian(LonLat(3, 4)) } });
    BOOST_CHECK(equal(polyline.getPathLonLat()[0][1], LonLat(3, 4)));
}

// Clearing releases buffers but keeps the polyline attached
BOOST_AUTO_TEST_CASE(polylineClear) {
    auto context = std::make_shared<RecordingRenderContext>();
    Polyline polyline(std::make_shared<IdGenerator>());
    polyline.setRenderContext(context);
    polyline.setPath3D({ createChain(1.0, 5) });
    polyline.draw();
    BOOST_CHECK(context->liveBufferCount() == 3);

    polyline.clear();
    BOOST_CHECK(context->liveBufferCount() == 0);
    BOOST_CHECK(polyline.isEmpty());
    BOOST_CHECK(polyline.getVertexBufferState() == Polyline::BufferState::DETACHED);
    BOOST_CHECK_NO_THROW(polyline.draw());
    BOOST_CHECK(context->draws.size() == 1);

    polyline.setPath3D({ createChain(1.0, 2) });
    polyline.draw();
    BOOST_CHECK(context->draws.size() == 2);
}

// Handler attaches, draws and removes its polylines
BOOST_AUTO_TEST_CASE(polylineHandler) {
    auto context = std::make_shared<RecordingRenderContext>();
    auto idGenerator = std::make_shared<IdGenerator>();
    PolylineOptions options;
    options.path3D = { createChain(1.0, 3) };
    auto polyline0 = std::make_shared<Polyline>(idGenerator, options);
    auto polyline1 = std::make_shared<Polyline>(idGenerator, options);

    PolylineHandler handler;
    handler.add(polyline0);
    handler.setRenderContext(context);
    handler.add(polyline1);
    BOOST_CHECK(polyline0->getHandler() == &handler);
    BOOST_CHECK(polyline1->getRenderContext() == context);

    handler.draw();
    handler.drawPicking();
    BOOST_CHECK(context->draws.size() == 4);
    BOOST_CHECK(context->liveBufferCount() == 6);

    polyline0->remove();
    BOOST_CHECK(handler.getPolylines().size() == 1);
    BOOST_CHECK(polyline0->getHandler() == nullptr);
    BOOST_CHECK(!polyline0->getRenderContext());
    BOOST_CHECK(context->liveBufferCount() == 3);

    PolylineHandler otherHandler;
    otherHandler.add(polyline1);
    BOOST_CHECK(handler.getPolylines().empty());
    BOOST_CHECK(polyline1->getHandler() == &otherHandler);

    BOOST_CHECK(!handler.remove(polyline1));
    otherHandler.clear();
    BOOST_CHECK(otherHandler.getPolylines().empty());
    BOOST_CHECK(context->liveBufferCount() == 0);
    BOOST_CHECK(context->invalidDeletes == 0);
}

// A polyline that can not be attached keeps every polyline of the handler on the previous context
BOOST_AUTO_TEST_CASE(polylineHandlerAttachFailure) {
    auto context = std::make_shared<RecordingRenderContext>(Ellipsoid::WGS84());
    auto contextWithoutTransform = std::make_shared<RecordingRenderContext>();
    auto idGenerator = std::make_shared<IdGenerator>();

    PolylineOptions cartesianOptions;
    cartesianOptions.path3D = { createChain(1.0, 3) };
    auto polyline0 = std::make_shared<Polyline>(idGenerator, cartesianOptions);
    PolylineOptions geodeticOptions;
    geodeticOptions.pathLonLat = { { LonLat(10, 20), LonLat(15, 25) } };
    auto polyline1 = std::make_shared<Polyline>(idGenerator, geodeticOptions);

    PolylineHandler handler;
    handler.setRenderContext(context);
    handler.add(polyline0);
    handler.add(polyline1);
    handler.draw();
    BOOST_CHECK(context->liveBufferCount() == 6);

    BOOST_CHECK_THROW(handler.setRenderContext(contextWithoutTransform), InvalidPathError);
    BOOST_CHECK(handler.getRenderContext() == context);
    BOOST_CHECK(polyline0->getRenderContext() == context);
    BOOST_CHECK(polyline1->getRenderContext() == context);
    BOOST_CHECK(contextWithoutTransform->liveBufferCount() == 0);
    BOOST_CHECK(contextWithoutTransform->invalidDeletes == 0);

    handler.draw();
    BOOST_CHECK(context->liveBufferCount() == 6);
    BOOST_CHECK(context->invalidDeletes == 0);
    BOOST_CHECK(context->invalidDraws == 0);
    BOOST_CHECK(contextWithoutTransform->draws.empty());
}

// Exact fit, splitting and fit tolerance of the packer
BOOST_AUTO_TEST_CASE(atlasPacker) {
    AtlasPacker packer(64, 32);
    boost::optional<AtlasPacker::NodeIndex> node0 = packer.insert(32, 32);
    BOOST_REQUIRE(node0);
    BOOST_CHECK(packer.getRectangle(*node0) == Rectangle(0, 0, 32, 32));
    boost::optional<AtlasPacker::NodeIndex> node1 = packer.insert(32, 32);
    BOOST_REQUIRE(node1);
    BOOST_CHECK(packer.getRectangle(*node1) == Rectangle(32, 0, 64, 32));
    BOOST_CHECK(!packer.insert(1, 1));

    packer.reset();
    BOOST_CHECK(packer.getNodeCount() == 1);
    BOOST_CHECK(packer.insert(64, 32) == AtlasPacker::NodeIndex(0));

    AtlasPacker tolerantPacker(10, 10, 0, 2);
    BOOST_CHECK(tolerantPacker.insert(9, 8) == AtlasPacker::NodeIndex(0));
    BOOST_CHECK(tolerantPacker.isOccupied(0));
    BOOST_CHECK(!tolerantPacker.insert(1, 1));

    BOOST_CHECK_THROW(AtlasPacker(0, 10), std::invalid_argument);

    // Sizes close to the integer limit do not fit, padding is not added to them
    AtlasPacker borderPacker(100, 100, 4);
    BOOST_CHECK(!borderPacker.insert(std::numeric_limits<int>::max(), 10));
    BOOST_CHECK(!borderPacker.insert(10, std::numeric_limits<int>::max() - 1));
    BOOST_CHECK(!borderPacker.insert(93, 10));
    BOOST_CHECK(borderPacker.getNodeCount() == 1);
    BOOST_CHECK(borderPacker.insert(92, 92));
    BOOST_CHECK_THROW(AtlasPacker(10, 10, std::numeric_limits<int>::max()), std::invalid_argument);
}

// Packing does not depend on insertion order
BOOST_AUTO_TEST_CASE(atlasDeterminism) {
    std::vector<std::shared_ptr<const Bitmap>> images = { createImage(50, 50), createImage(10, 10), createImage(200, 200) };
    std::vector<std::size_t> permutation = { 0, 1, 2 };
    std::map<int, Rectangle> firstPlacements;
    do {
        TextureAtlas atlas;
        for (std::size_t i : permutation) {
            atlas.addImage(images[i]);
        }
        std::map<int, Rectangle> placements;
        for (std::size_t i = 0; i < atlas.getImageCount(); i++) {
            BOOST_CHECK(atlas.getImage(i) == images[permutation[i]]);
            placements[atlas.getImage(i)->width] = atlas.getPlacement(i);
        }
        if (firstPlacements.empty()) {
            firstPlacements = placements;
        }
        BOOST_CHECK(placements == firstPlacements);
    } while (std::next_permutation(permutation.begin(), permutation.end()));
}

// Placements never overlap and stay inside the canvas
BOOST_AUTO_TEST_CASE(atlasPlacements) {
    TextureAtlasSettings settings;
    settings.width = 256;
    settings.height = 256;
    TextureAtlas atlas(settings);
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> sizeDist(1, 24);
    for (int i = 0; i < 60; i++) {
        try {
            atlas.addImage(createImage(sizeDist(rng), sizeDist(rng)));
        }
        catch (const AtlasOverflowError&) {
            break;
        }
    }
    BOOST_CHECK(atlas.getImageCount() > 10);

    Rectangle canvas(0, 0, settings.width, settings.height);
    for (std::size_t i = 0; i < atlas.getImageCount(); i++) {
        const Rectangle& placement = atlas.getPlacement(i);
        BOOST_CHECK(canvas.contains(placement));
        BOOST_CHECK(placement.width() >= atlas.getImage(i)->width + 2 * settings.borderSize);
        BOOST_CHECK(placement.height() >= atlas.getImage(i)->height + 2 * settings.borderSize);
        for (std::size_t j = i + 1; j < atlas.getImageCount(); j++) {
            BOOST_CHECK(!placement.intersects(atlas.getPlacement(j)));
        }
    }
}

// A full canvas rejects further images and keeps its state
BOOST_AUTO_TEST_CASE(atlasOverflow) {
    TextureAtlasSettings settings;
    settings.width = 100;
    settings.height = 100;
    settings.borderSize = 4;
    TextureAtlas atlas(settings);
    atlas.addImage(createImage(90, 90, Color(1, 0, 0, 1)));

    Rectangle placement = atlas.getPlacement(0);
    TextureAtlas::TexCoords texCoords = atlas.getTexCoords(0);
    std::shared_ptr<Bitmap> canvas = atlas.getCanvasBitmap();
    for (int size : { 1, 5, 90, 200 }) {
        BOOST_CHECK_THROW(atlas.addImage(createImage(size, size)), AtlasOverflowError);
    }
    BOOST_CHECK(atlas.getImageCount() == 1);
    BOOST_CHECK(atlas.getPlacement(0) == placement);
    BOOST_CHECK(atlas.getTexCoords(0) == texCoords);
    BOOST_CHECK(atlas.getCanvasBitmap()->data == canvas->data);

    try {
        atlas.addImage(createImage(3, 7));
    }
    catch (const AtlasOverflowError& ex) {
        BOOST_CHECK(ex.width() == 3 && ex.height() == 7);
    }

    BOOST_CHECK_THROW(atlas.addImage(createImage(0, 5)), std::invalid_argument);
    BOOST_CHECK_THROW(atlas.addImage(std::shared_ptr<const Bitmap>()), std::invalid_argument);
}

// Texture coordinates cover the image without its border, and the image is rasterized there
BOOST_AUTO_TEST_CASE(atlasTexCoords) {
    TextureAtlasSettings settings;
    settings.width = 100;
    settings.height = 50;
    settings.borderSize = 2;
    TextureAtlas atlas(settings);
    TextureAtlas::TexCoords texCoords = atlas.addImage(createImage(10, 20, Color(0, 1, 0, 1)));

    BOOST_CHECK(atlas.getPlacement(0) == Rectangle(0, 0, 14, 24));
    BOOST_CHECK(texCoords[0] == cglib::vec2<float>(0.02f, 0.04f));
    BOOST_CHECK(texCoords[1] == cglib::vec2<float>(0.02f, 0.44f));
    BOOST_CHECK(texCoords[2] == cglib::vec2<float>(0.12f, 0.04f));
    BOOST_CHECK(texCoords[3] == cglib::vec2<float>(0.12f, 0.44f));

    std::shared_ptr<Bitmap> canvas = atlas.getCanvasBitmap();
    BOOST_CHECK(canvas->pixel(1, 1) == 0);
    BOOST_CHECK(canvas->pixel(2, 2) == Color(0, 1, 0, 1).pixel());
    BOOST_CHECK(canvas->pixel(11, 21) == Color(0, 1, 0, 1).pixel());
    BOOST_CHECK(canvas->pixel(12, 22) == 0);
}

// Atlas textures follow the canvas and are replaced, not leaked
BOOST_AUTO_TEST_CASE(atlasTexture) {
    TextureAtlas atlas;
    BOOST_CHECK_THROW(atlas.getTexture(), DetachedResourceError);
    BOOST_CHECK_THROW(atlas.makeTexture(), DetachedResourceError);

    auto context = std::make_shared<RecordingRenderContext>();
    atlas.setRenderContext(context);
    RenderContext::TextureHandle texture0 = atlas.getTexture();
    BOOST_CHECK(context->textures.size() == 1);

    atlas.addImage(createImage(16, 16));
    RenderContext::TextureHandle texture1 = atlas.getTexture();
    BOOST_CHECK(texture1 != texture0);
    BOOST_CHECK(context->textures.size() == 1);
    BOOST_CHECK(context->textures.at(texture1).width == TextureAtlasSettings::DEFAULT_CANVAS_SIZE);
    BOOST_CHECK(context->events.back() == "texture:" + std::to_string(texture1));
    BOOST_CHECK(context->events[context->events.size() - 2] == "deltexture:" + std::to_string(texture0));

    atlas.setRenderContext(std::shared_ptr<RenderContext>());
    BOOST_CHECK(context->textures.empty());
    BOOST_CHECK(context->invalidDeletes == 0);
}

// Images are clipped at the canvas edges
BOOST_AUTO_TEST_CASE(imageCanvas) {
    ImageCanvas canvas(4, 4);
    canvas.clear(Color(0, 0, 1, 1));
    canvas.drawImage(*createImage(3, 3, Color(1, 0, 0, 1)), -1, 2);
    BOOST_CHECK(canvas.getPixel(0, 2) == Color(1, 0, 0, 1).pixel());
    BOOST_CHECK(canvas.getPixel(1, 3) == Color(1, 0, 0, 1).pixel());
    BOOST_CHECK(canvas.getPixel(2, 2) == Color(0, 0, 1, 1).pixel());
    BOOST_CHECK(canvas.getPixel(0, 1) == Color(0, 0, 1, 1).pixel());
    canvas.drawImage(*createImage(2, 2), 10, 10);
    BOOST_CHECK(canvas.buildBitmap()->data.size() == 16);
    BOOST_CHECK_THROW(canvas.getPixel(4, 0), std::out_of_range);
}

// Settings parsing with defaults and illegal values
BOOST_AUTO_TEST_CASE(settingsParsing) {
    PolylineSettings polylineSettings = PolylineSettings::parse(parseJSON(R"({ "thickness": 3, "color": "#ff000080", "visible": false })"));
    BOOST_CHECK(polylineSettings.thickness == 3.0f);
    BOOST_CHECK(polylineSettings.color == Color::fromRGBA8(255, 0, 0, 128));
    BOOST_CHECK(!polylineSettings.visible);
    BOOST_CHECK(!polylineSettings.closed);

    BOOST_CHECK(PolylineSettings::parse(parseJSON(R"({ "color": [0, 0.5, 1, 1] })")).color == Color(0, 0.5f, 1, 1));
    BOOST_CHECK(parseColor("#00ff00") == Color(0, 1, 0, 1));
    BOOST_CHECK_THROW(parseColor("#00ff0"), std::invalid_argument);
    BOOST_CHECK_THROW(PolylineSettings::parse(parseJSON(R"({ "color": "red" })")), SettingsParserError);
    BOOST_CHECK_THROW(PolylineSettings::parse(parseJSON(R"({ "thickness": -1 })")), std::runtime_error);
    BOOST_CHECK_THROW(PolylineSettings::parse(parseJSON(R"({ "closed": 1 })")), std::runtime_error);

    TextureAtlasSettings atlasSettings = TextureAtlasSettings::parse(parseJSON(R"({ "width": 512, "border": 0, "fit": 1 })"));
    BOOST_CHECK(atlasSettings.width == 512);
    BOOST_CHECK(atlasSettings.height == TextureAtlasSettings::DEFAULT_CANVAS_SIZE);
    BOOST_CHECK(atlasSettings.borderSize == 0);
    BOOST_CHECK(atlasSettings.fitTolerance == 1);
    BOOST_CHECK_THROW(TextureAtlasSettings::parse(parseJSON(R"({ "width": 0 })")), std::runtime_error);
    BOOST_CHECK_THROW(TextureAtlasSettings::parse(parseJSON(R"({ "height": 1.5 })")), std::runtime_error);
    BOOST_CHECK_THROW(TextureAtlasSettings::parse(parseJSON("[]")), std::runtime_error);
}

// JSON packing reports placements and texture coordinates in input order and validates image sizes
BOOST_AUTO_TEST_CASE(atlasJSON) {
    picojson::value outputDef = packAtlasJSON(parseJSON(R"({ "atlas": { "width": 64, "height": 64, "border": 1 }, "images": [ { "size": [10, 20] }, { "size": [30, 30], "color": "#ff0000" } ] })"));
    BOOST_CHECK(outputDef.get("width").get<std::int64_t>() == 64);
    BOOST_CHECK(outputDef.get("border").get<std::int64_t>() == 1);

    TextureAtlasSettings settings;
    settings.width = 64;
    settings.height = 64;
    settings.borderSize = 1;
    TextureAtlas atlas(settings);
    atlas.addImage(createImage(10, 20));
    atlas.addImage(createImage(30, 30));

    const picojson::array& imagesDef = outputDef.get("images").get<picojson::array>();
    BOOST_REQUIRE(imagesDef.size() == 2);
    for (std::size_t i = 0; i < imagesDef.size(); i++) {
        const picojson::array& placementDef = imagesDef[i].get("placement").get<picojson::array>();
        BOOST_REQUIRE(placementDef.size() == 4);
        const Rectangle& placement = atlas.getPlacement(i);
        BOOST_CHECK(placementDef[0].get<std::int64_t>() == placement.left);
        BOOST_CHECK(placementDef[1].get<std::int64_t>() == placement.top);
        BOOST_CHECK(placementDef[2].get<std::int64_t>() == placement.right);
        BOOST_CHECK(placementDef[3].get<std::int64_t>() == placement.bottom);

        const picojson::array& texCoordsDef = imagesDef[i].get("texcoords").get<picojson::array>();
        BOOST_REQUIRE(texCoordsDef.size() == 4);
        for (std::size_t j = 0; j < 4; j++) {
            BOOST_CHECK(static_cast<float>(texCoordsDef[j].get<picojson::array>()[0].get<double>()) == atlas.getTexCoords(i)[j](0));
            BOOST_CHECK(static_cast<float>(texCoordsDef[j].get<picojson::array>()[1].get<double>()) == atlas.getTexCoords(i)[j](1));
        }
    }

    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "images": [ { "size": [-5, 10] } ] })")), SettingsParserError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "images": [ { "size": [4.5, 10] } ] })")), SettingsParserError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "images": [ { "size": [10] } ] })")), SettingsParserError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "images": [ { "size": [1e12, 10] } ] })")), SettingsParserError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "images": [ { "size": [10, 10], "color": "red" } ] })")), SettingsParserError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "atlas": { "width": 16, "height": 16 }, "images": [ { "size": [2000000000, 10] } ] })")), AtlasOverflowError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON(R"({ "atlas": { "width": 16, "height": 16 }, "images": [ { "size": [8, 8] }, { "size": [8, 8] } ] })")), AtlasOverflowError);
    BOOST_CHECK_THROW(packAtlasJSON(parseJSON("{}")), SettingsParserError);
}
