//
// Project: ProtoBank
// File: Checkpoint.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <torch/torch.h>

#include <filesystem>
#include <string>
#include <vector>


namespace ml {

// Outcome of a parameter load, keys are dotted parameter / buffer names
struct LoadResult {
    std::vector<std::string>    missingKeys;    // in the module, not in the archive
    std::vector<std::string>    unexpectedKeys; // in the archive, not in the module
    std::vector<std::string>    mismatchedKeys; // in both, but with different shapes

    bool clean() const noexcept;
};

// Load parameters and buffers from an archive written by torch::nn::Module::save.
// In strict mode any missing, unexpected or mismatched key throws std::runtime_error and
// no parameter is modified. Otherwise everything that matches is loaded and the rest is logged.
LoadResult loadParameters(torch::nn::Module& module, torch::serialize::InputArchive& archive,
    bool strict = true);
LoadResult loadParameters(torch::nn::Module& module, const std::filesystem::path& filename,
    bool strict = true);

void saveParameters(const torch::nn::Module& module, const std::filesystem::path& filename);

} // namespace ml
