#include "AtlasJSON.h"
#include "TextureAtlas.h"
#include "Exceptions.h"

#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

namespace {
    picojson::value writeTexCoords(const terra::globe::TextureAtlas::TexCoords& texCoords) {
        picojson::array texCoordsDef;
        for (const cglib::vec2<float>& texCoord : texCoords) {
            texCoordsDef.emplace_back(picojson::array { picojson::value(static_cast<double>(texCoord(0))), picojson::value(static_cast<double>(texCoord(1))) });
        }
        return picojson::value(texCoordsDef);
    }

    picojson::value writePlacement(const terra::globe::Rectangle& placement) {
        return picojson::value(picojson::array {
            picojson::value(static_cast<std::int64_t>(placement.left)), picojson::value(static_cast<std::int64_t>(placement.top)),
            picojson::value(static_cast<std::int64_t>(placement.right)), picojson::value(static_cast<std::int64_t>(placement.bottom))
        });
    }
}

namespace terra { namespace globe {
    std::shared_ptr<const Bitmap> readAtlasImage(const picojson::value& imageDef, const TextureAtlasSettings& settings) {
        if (!imageDef.is<picojson::object>()) {
            throw SettingsParserError("Expecting object", "images");
        }
        if (!imageDef.get("size").is<picojson::array>()) {
            throw SettingsParserError("Expecting array", "size");
        }
        const picojson::array& sizeDef = imageDef.get("size").get<picojson::array>();
        if (sizeDef.size() != 2) {
            throw SettingsParserError("Image size must contain width and height", "size");
        }
        int width = parseInteger(sizeDef[0], "size", 1);
        int height = parseInteger(sizeDef[1], "size", 1);
        if (width > settings.width || height > settings.height) {
            throw AtlasOverflowError(width, height);
        }

        Color color(1, 1, 1, 1);
        if (imageDef.contains("color")) {
            if (!imageDef.get("color").is<std::string>()) {
                throw SettingsParserError("Expecting color string", "color");
            }
            try {
                color = parseColor(imageDef.get("color").get<std::string>());
            }
            catch (const std::invalid_argument& ex) {
                throw SettingsParserError(ex.what(), "color");
            }
        }
        return std::make_shared<Bitmap>(width, height, std::vector<std::uint32_t>(static_cast<std::size_t>(width) * height, color.pixel()));
    }

    picojson::value packAtlasJSON(const picojson::value& inputDef, std::shared_ptr<Logger> logger) {
        if (!inputDef.is<picojson::object>()) {
            throw SettingsParserError("Expecting object", "input");
        }

        TextureAtlasSettings settings;
        if (inputDef.contains("atlas")) {
            settings = TextureAtlasSettings::parse(inputDef.get("atlas"));
        }
        if (!inputDef.get("images").is<picojson::array>()) {
            throw SettingsParserError("Expecting array", "images");
        }

        TextureAtlas atlas(settings, std::move(logger));
        for (const picojson::value& imageDef : inputDef.get("images").get<picojson::array>()) {
            atlas.addImage(readAtlasImage(imageDef, settings));
        }

        picojson::array imagesDef;
        for (std::size_t i = 0; i < atlas.getImageCount(); i++) {
            picojson::object imageDef;
            imageDef["placement"] = writePlacement(atlas.getPlacement(i));
            imageDef["texcoords"] = writeTexCoords(atlas.getTexCoords(i));
            imagesDef.emplace_back(imageDef);
        }

        picojson::object outputDef;
        outputDef["width"] = picojson::value(static_cast<std::int64_t>(settings.width));
        outputDef["height"] = picojson::value(static_cast<std::int64_t>(settings.height));
        outputDef["border"] = picojson::value(static_cast<std::int64_t>(settings.borderSize));
        outputDef["images"] = picojson::value(imagesDef);
        return picojson::value(outputDef);
    }
} }
