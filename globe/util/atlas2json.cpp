#include "globe/AtlasJSON.h"
#include "globe/Exceptions.h"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <iostream>

#include <picojson/picojson.h>

class Logger : public terra::globe::Logger {
public:
    virtual void write(Severity severity, const std::string& msg) override {
        std::cerr << msg << std::endl;
    }
};

static std::string loadFile(const std::string& filePath) {
    std::FILE* fpRaw = std::fopen(filePath.c_str(), "rb");
    if (fpRaw == NULL) {
        throw std::runtime_error("Failed to open input file " + filePath);
    }
    std::shared_ptr<std::FILE> fp(fpRaw, std::fclose);
    std::fseek(fpRaw, 0, SEEK_END);
    long size = std::ftell(fpRaw);
    if (size < 0) {
        throw std::runtime_error("Failed to load " + filePath);
    }
    std::fseek(fpRaw, 0, SEEK_SET);
    std::string fileData(size, 0);
    if (std::fread(&fileData[0], sizeof(char), fileData.size(), fpRaw) != fileData.size()) {
        throw std::runtime_error("Failed to read " + filePath);
    }
    return fileData;
}

static void saveFile(const std::string& filePath, const std::string& fileData) {
    std::FILE* fpRaw = std::fopen(filePath.c_str(), "wb");
    if (fpRaw == NULL) {
        throw std::runtime_error("Failed to open output file " + filePath);
    }
    std::shared_ptr<std::FILE> fp(fpRaw, std::fclose);
    if (std::fwrite(fileData.data(), sizeof(char), fileData.size(), fpRaw) != fileData.size()) {
        throw std::runtime_error("Failed to write " + filePath);
    }
}

void packAtlas(const std::string& inputFile, const std::string& outputFile) {
    picojson::value inputDef;
    std::string err = picojson::parse(inputDef, loadFile(inputFile));
    if (!err.empty()) {
        throw std::runtime_error("Failed to parse " + inputFile + ": " + err);
    }

    auto logger = std::make_shared<Logger>();
    picojson::value outputDef = terra::globe::packAtlasJSON(inputDef, logger);
    saveFile(outputFile, outputDef.serialize(true));
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: atlas2json input-file output-file" << std::endl;
        return -1;
    }

    try {
        std::string inputFile = argv[1];
        std::string outputFile = argv[2];
        packAtlas(inputFile, outputFile);
    } catch (const terra::globe::AtlasOverflowError& ex) {
        std::cerr << "Atlas overflow: " << ex.what() << std::endl;
        return -2;
    } catch (const terra::globe::SettingsParserError& ex) {
        std::cerr << "Invalid input: " << ex.what() << std::endl;
        return -1;
    } catch (const std::exception& ex) {
        std::cerr << "Exception while packing: " << ex.what() << std::endl;
        return -1;
    }
    return 0;
}
