/**
 * @file json_file.cpp
 * @brief JSON document input/output
 */

#include "json_file.h"
#include "exceptions.h"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fiscid {
namespace importer {

namespace {

Json::Value parseStream(std::istream& stream, const std::string& source) {
    Json::CharReaderBuilder readerBuilder;
    Json::Value root;
    std::string errors;

    if (!Json::parseFromStream(readerBuilder, stream, &root, &errors)) {
        throw common::ParsingException("invalid JSON in " + source + ": " + errors);
    }
    return root;
}

} // namespace

Json::Value parseJson(const std::string& text) {
    std::istringstream stream(text);
    return parseStream(stream, "input");
}

Json::Value readJsonFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw common::ParsingException("cannot open " + path);
    }

    spdlog::debug("Reading {}", path);
    return parseStream(file, path);
}

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "  ";
    writerBuilder["emitUTF8"] = true;
    return Json::writeString(writerBuilder, value);
}

void writeJsonFile(const std::string& path, const Json::Value& value) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw common::FiscidException("cannot write " + path);
    }

    file << toJsonString(value) << '\n';
    if (!file) {
        throw common::FiscidException("error while writing " + path);
    }
}

} // namespace importer
} // namespace fiscid
