// attrdump, utility to check a JSON value against a JSON type description and print its canonical JSON form.
#include "attrmap/Context.hpp"
#include "attrmap/Path.hpp"
#include "attrmap/reflect/Convert.hpp"
#include "attrmap/types/Object.hpp"
#include "attrmap/wire/ValueJSON.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

DEFINE_string(typeFile, "", "Path to the JSON type description.");
DEFINE_string(valueFile, "", "Path to the JSON value to check. If empty, dumps the canonical type and exits.");
DEFINE_bool(pretty, false, "Pretty-print the dumped JSON.");
DEFINE_bool(verbose, false, "Log each conversion step.");

bool readFile(const std::string& path, std::string& contents) {
    fs::path filePath(path);
    if (!fs::exists(filePath)) {
        SPDLOG_ERROR("File: '{}' not found", path);
        return false;
    }

    contents.resize(fs::file_size(filePath));
    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", path);
        return false;
    }
    inFile.read(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' read error", path);
        return false;
    }

    return true;
}

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    spdlog::default_logger()->set_level(FLAGS_verbose ? spdlog::level::trace : spdlog::level::warn);

    if (FLAGS_typeFile.empty()) {
        std::cerr << "usage: attrdump --typeFile=type.json [--valueFile=value.json] [flags]\n";
        return -1;
    }

    std::string typeJSON;
    if (!readFile(FLAGS_typeFile, typeJSON)) {
        return -1;
    }
    attrmap::wire::Type wireType;
    std::string error;
    if (!attrmap::wire::parseTypeJSON(typeJSON, wireType, error)) {
        SPDLOG_ERROR("Type file '{}': {}", FLAGS_typeFile, error);
        return -1;
    }

    attrmap::wire::ValueDumpJSON dump;
    if (FLAGS_valueFile.empty()) {
        if (!dump.dumpType(wireType, FLAGS_pretty)) {
            SPDLOG_ERROR("Type file '{}': {}", FLAGS_typeFile, dump.error());
            return -1;
        }
        std::cout << dump.json() << std::endl;
        return 0;
    }

    std::string valueJSON;
    if (!readFile(FLAGS_valueFile, valueJSON)) {
        return -1;
    }
    attrmap::wire::Value wireValue;
    if (!attrmap::wire::parseValueJSON(valueJSON, wireType, wireValue, error)) {
        SPDLOG_ERROR("Value file '{}': {}", FLAGS_valueFile, error);
        return -1;
    }

    attrmap::Context context;
    auto schemaType = attrmap::types::typeFromWireType(wireType);
    attrmap::attr::ValuePtr value;
    auto diagnostics = attrmap::reflect::buildAttrValue(&context, *schemaType, wireValue, attrmap::Path(), value);
    for (const auto& diagnostic : diagnostics) {
        std::cerr << diagnostic.toString() << std::endl;
    }
    if (diagnostics.hasError()) {
        return -1;
    }

    attrmap::wire::Value canonical;
    if (!value->toWireValue(&context, canonical, error)) {
        SPDLOG_ERROR("Value file '{}': {}", FLAGS_valueFile, error);
        return -1;
    }
    if (!dump.dump(canonical, FLAGS_pretty)) {
        SPDLOG_ERROR("Value file '{}': {}", FLAGS_valueFile, dump.error());
        return -1;
    }
    std::cout << dump.json() << std::endl;

    return 0;
}
