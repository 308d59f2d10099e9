#include "Settings.h"

#include <cstdint>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <boost/spirit/include/qi.hpp>

namespace {
    double readNumber(const picojson::value& settingsDef, const std::string& key) {
        return terra::globe::parseNumber(settingsDef.get(key), key);
    }

    int readInteger(const picojson::value& settingsDef, const std::string& key, int minValue) {
        return terra::globe::parseInteger(settingsDef.get(key), key, minValue);
    }

    bool readBoolean(const picojson::value& settingsDef, const std::string& key) {
        const picojson::value& valueDef = settingsDef.get(key);
        if (!valueDef.is<bool>()) {
            throw terra::globe::SettingsParserError("Expecting boolean", key);
        }
        return valueDef.get<bool>();
    }

    terra::globe::Color readColor(const picojson::value& settingsDef, const std::string& key) {
        const picojson::value& valueDef = settingsDef.get(key);
        if (valueDef.is<std::string>()) {
            try {
                return terra::globe::parseColor(valueDef.get<std::string>());
            }
            catch (const std::invalid_argument& ex) {
                throw terra::globe::SettingsParserError(ex.what(), key);
            }
        }
        if (valueDef.is<picojson::array>()) {
            const picojson::array& componentsDef = valueDef.get<picojson::array>();
            if (componentsDef.size() != 4) {
                throw terra::globe::SettingsParserError("Expecting 4 color components", key);
            }
            std::array<float, 4> rgba;
            for (std::size_t i = 0; i < 4; i++) {
                if (!componentsDef[i].is<double>() && !componentsDef[i].is<std::int64_t>()) {
                    throw terra::globe::SettingsParserError("Expecting numeric color component", key);
                }
                double value = componentsDef[i].is<double>() ? componentsDef[i].get<double>() : static_cast<double>(componentsDef[i].get<std::int64_t>());
                if (value < 0 || value > 1) {
                    throw terra::globe::SettingsParserError("Color component out of range", key);
                }
                rgba[i] = static_cast<float>(value);
            }
            return terra::globe::Color(rgba);
        }
        throw terra::globe::SettingsParserError("Expecting color string or array", key);
    }
}

namespace terra { namespace globe {
    PolylineSettings PolylineSettings::parse(const picojson::value& settingsDef) {
        if (!settingsDef.is<picojson::object>()) {
            throw SettingsParserError("Expecting object", "polyline");
        }

        PolylineSettings settings;
        if (settingsDef.contains("thickness")) {
            double thickness = readNumber(settingsDef, "thickness");
            if (!(thickness >= 0) || !std::isfinite(thickness)) {
                throw SettingsParserError("Illegal thickness", "thickness");
            }
            settings.thickness = static_cast<float>(thickness);
        }
        if (settingsDef.contains("color")) {
            settings.color = readColor(settingsDef, "color");
        }
        if (settingsDef.contains("visible")) {
            settings.visible = readBoolean(settingsDef, "visible");
        }
        if (settingsDef.contains("closed")) {
            settings.closed = readBoolean(settingsDef, "closed");
        }
        return settings;
    }

    TextureAtlasSettings TextureAtlasSettings::parse(const picojson::value& settingsDef) {
        if (!settingsDef.is<picojson::object>()) {
            throw SettingsParserError("Expecting object", "atlas");
        }

        TextureAtlasSettings settings;
        if (settingsDef.contains("width")) {
            settings.width = readInteger(settingsDef, "width", 1);
        }
        if (settingsDef.contains("height")) {
            settings.height = readInteger(settingsDef, "height", 1);
        }
        if (settingsDef.contains("border")) {
            settings.borderSize = readInteger(settingsDef, "border", 0);
        }
        if (settingsDef.contains("fit")) {
            settings.fitTolerance = readInteger(settingsDef, "fit", 0);
        }
        return settings;
    }

    double parseNumber(const picojson::value& valueDef, const std::string& key) {
        if (valueDef.is<double>()) {
            return valueDef.get<double>();
        }
        if (valueDef.is<std::int64_t>()) {
            return static_cast<double>(valueDef.get<std::int64_t>());
        }
        throw SettingsParserError("Expecting number", key);
    }

    int parseInteger(const picojson::value& valueDef, const std::string& key, int minValue) {
        double value = parseNumber(valueDef, key);
        if (std::floor(value) != value || value < minValue || value > std::numeric_limits<int>::max()) {
            throw SettingsParserError("Illegal integer value", key);
        }
        return static_cast<int>(value);
    }

    Color parseColor(const std::string& str) {
        namespace qi = boost::spirit::qi;

        std::string::const_iterator it = str.begin();
        std::string::const_iterator end = str.end();
        std::uint32_t value = 0;
        bool result = false;
        if (str.size() == 7) {
            result = qi::parse(it, end, qi::lit('#') >> qi::uint_parser<std::uint32_t, 16, 6, 6>(), value);
            value = (value << 8) | 0xff;
        }
        else if (str.size() == 9) {
            result = qi::parse(it, end, qi::lit('#') >> qi::uint_parser<std::uint32_t, 16, 8, 8>(), value);
        }
        if (!result || it != end) {
            throw std::invalid_argument("Illegal color string '" + str + "'");
        }
        return Color::fromRGBA8((value >> 24) & 0xff, (value >> 16) & 0xff, (value >> 8) & 0xff, value & 0xff);
    }
} }
