#include "PolylineHandler.h"

#include <algorithm>
#include <exception>
#include <utility>
#include <stdexcept>

namespace terra { namespace globe {
    PolylineHandler::~PolylineHandler() {
        for (const std::shared_ptr<Polyline>& polyline : _polylines) {
            polyline->_handler = nullptr;
        }
    }

    void PolylineHandler::setRenderContext(std::shared_ptr<RenderContext> renderContext) {
        // Attach all or nothing, polylines moved before a failing one are returned to their previous context
        std::vector<std::shared_ptr<RenderContext>> previousContexts;
        previousContexts.reserve(_polylines.size());
        try {
            for (const std::shared_ptr<Polyline>& polyline : _polylines) {
                previousContexts.push_back(polyline->getRenderContext());
                polyline->setRenderContext(renderContext);
            }
        }
        catch (const std::exception&) {
            for (std::size_t i = 0; i < previousContexts.size(); i++) {
                _polylines[i]->setRenderContext(previousContexts[i]);
            }
            throw;
        }
        _renderContext = std::move(renderContext);
    }

    void PolylineHandler::add(const std::shared_ptr<Polyline>& polyline) {
        if (!polyline) {
            throw std::invalid_argument("Null polyline");
        }
        if (polyline->_handler == this) {
            return;
        }
        if (_renderContext) {
            polyline->setRenderContext(_renderContext);
        }
        if (polyline->_handler) {
            polyline->_handler->unlink(polyline.get());
        }
        polyline->_handler = this;
        _polylines.push_back(polyline);
    }

    bool PolylineHandler::remove(const std::shared_ptr<Polyline>& polyline) {
        if (!polyline || polyline->_handler != this) {
            return false;
        }
        polyline->remove();
        return true;
    }

    void PolylineHandler::clear() {
        std::vector<std::shared_ptr<Polyline>> polylines;
        std::swap(polylines, _polylines);
        for (const std::shared_ptr<Polyline>& polyline : polylines) {
            polyline->_handler = nullptr;
            polyline->remove();
        }
    }

    void PolylineHandler::draw() {
        for (const std::shared_ptr<Polyline>& polyline : _polylines) {
            polyline->draw();
        }
    }

    void PolylineHandler::drawPicking() {
        for (const std::shared_ptr<Polyline>& polyline : _polylines) {
            polyline->drawPicking();
        }
    }

    void PolylineHandler::unlink(const Polyline* polyline) {
        auto it = std::find_if(_polylines.begin(), _polylines.end(), [polyline](const std::shared_ptr<Polyline>& other) {
            return other.get() == polyline;
        });
        if (it != _polylines.end()) {
            _polylines.erase(it);
        }
    }
} }
