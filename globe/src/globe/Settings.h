/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_SETTINGS_H_
#define _TERRA_GLOBE_SETTINGS_H_

#include "Color.h"

#include <string>
#include <stdexcept>

#include <picojson/picojson.h>

namespace terra { namespace globe {
    class SettingsParserError : public std::runtime_error {
    public:
        explicit SettingsParserError(const std::string& msg, const std::string& key) : runtime_error(msg + ": " + key), _key(key) { }

        const std::string& key() const { return _key; }

    private:
        std::string _key;
    };

    struct PolylineSettings {
        inline static constexpr float DEFAULT_THICKNESS = 1.5f;

        float thickness = DEFAULT_THICKNESS;
        Color color = Color(1, 1, 1, 1);
        bool visible = true;
        bool closed = false;

        static PolylineSettings parse(const picojson::value& settingsDef);
    };

    struct TextureAtlasSettings {
        inline static constexpr int DEFAULT_CANVAS_SIZE = 1024;
        inline static constexpr int DEFAULT_BORDER_SIZE = 2;

        int width = DEFAULT_CANVAS_SIZE;
        int height = DEFAULT_CANVAS_SIZE;
        int borderSize = DEFAULT_BORDER_SIZE; // padding on each side of an image
        int fitTolerance = 0; // maximum slack for reusing a leaf without splitting

        static TextureAtlasSettings parse(const picojson::value& settingsDef);
    };

    // Throw SettingsParserError naming the key if the value is not a number or an integer in range
    double parseNumber(const picojson::value& valueDef, const std::string& key);
    int parseInteger(const picojson::value& valueDef, const std::string& key, int minValue);

    Color parseColor(const std::string& str);
} }

#endif
