//
// Project: ProtoBank
// File: ConfigUtils.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include "util/Types.hpp"

#include <cstdio>
#include <filesystem>
#include <string>


Json readJsonFile(const std::filesystem::path& filename);
// indent < 0 writes the compact representation
void writeJsonFile(const Json& json, const std::filesystem::path& filename, int indent = 4);

// Read config[key] into value. Missing key leaves value untouched and prints a warning.
// Returns true if the key was found.
template <typename T>
bool readConfigValue(const Json& config, const std::string& key, T& value)
{
    if (!config.contains(key)) {
        printf("WARNING: No %s specified in the config, using the default\n", key.c_str());
        return false;
    }
    value = config[key].get<T>();
    return true;
}
