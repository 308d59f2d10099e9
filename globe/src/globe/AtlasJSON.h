/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_ATLASJSON_H_
#define _TERRA_GLOBE_ATLASJSON_H_

#include "Bitmap.h"
#include "Settings.h"
#include "Logger.h"

#include <memory>

#include <picojson/picojson.h>

namespace terra { namespace globe {
    /**
     * Reads a solid color image definition of the form { "size": [width, height], "color": "#rrggbb" }.
     * Images larger than the atlas raise AtlasOverflowError before any pixels are allocated.
     */
    std::shared_ptr<const Bitmap> readAtlasImage(const picojson::value& imageDef, const TextureAtlasSettings& settings);

    /**
     * Packs the images of { "atlas": {...}, "images": [...] } and returns the atlas size, border
     * and the placement and texture coordinates of every image, in input order.
     */
    picojson::value packAtlasJSON(const picojson::value& inputDef, std::shared_ptr<Logger> logger = std::shared_ptr<Logger>());
} }

#endif
