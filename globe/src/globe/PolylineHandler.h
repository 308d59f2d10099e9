/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_POLYLINEHANDLER_H_
#define _TERRA_GLOBE_POLYLINEHANDLER_H_

#include "Polyline.h"
#include "RenderContext.h"

#include <memory>
#include <vector>

namespace terra { namespace globe {
    class PolylineHandler final {
    public:
        PolylineHandler() = default;
        PolylineHandler(const PolylineHandler&) = delete;
        ~PolylineHandler();

        PolylineHandler& operator = (const PolylineHandler&) = delete;

        const std::vector<std::shared_ptr<Polyline>>& getPolylines() const { return _polylines; }

        const std::shared_ptr<RenderContext>& getRenderContext() const { return _renderContext; }
        // If any polyline can not be attached, the exception is rethrown and no polyline changes its context
        void setRenderContext(std::shared_ptr<RenderContext> renderContext);

        // Takes the polyline over from its previous handler, if any
        void add(const std::shared_ptr<Polyline>& polyline);
        bool remove(const std::shared_ptr<Polyline>& polyline);
        void clear();

        void draw();
        void drawPicking();

    private:
        friend class Polyline;

        void unlink(const Polyline* polyline);

        std::vector<std::shared_ptr<Polyline>> _polylines;
        std::shared_ptr<RenderContext> _renderContext;
    };
} }

#endif
