//
// Project: ProtoBank
// File: ConfigUtils.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "util/ConfigUtils.hpp"

#include <fstream>
#include <stdexcept>


namespace fs = std::filesystem;


Json readJsonFile(const fs::path& filename)
{
    std::ifstream file(filename);
    if (!file)
        throw std::runtime_error("Unable to open " + filename.string());

    try {
        return Json::parse(file);
    }
    catch (const Json::parse_error& e) {
        throw std::runtime_error("Unable to parse " + filename.string() + ": " + e.what());
    }
}

void writeJsonFile(const Json& json, const fs::path& filename, int indent)
{
    std::ofstream file(filename);
    if (!file)
        throw std::runtime_error("Unable to open " + filename.string() + " for writing");
    file << json.dump(indent);
}
