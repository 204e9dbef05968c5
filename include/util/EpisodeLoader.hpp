//
// Project: ProtoBank
// File: EpisodeLoader.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include "ml/Episode.hpp"

#include <torch/torch.h>

#include <filesystem>
#include <string>
#include <vector>


// Read an image as a [3, imageSize, imageSize] RGB float tensor scaled to [-1, 1].
// Throws std::runtime_error if the file can't be decoded.
torch::Tensor loadImage(const std::filesystem::path& filename, int64_t imageSize);

// Read an episode from <dir>/<class name>/<image files> directory trees.
// Class indices follow the sorted class directory names of supportDir, the names are
// written to classNames if given. Query classes must also be present in the support set.
ml::Episode loadEpisode(
    const std::filesystem::path& supportDir,
    const std::filesystem::path& queryDir,
    int64_t imageSize,
    std::vector<std::string>* classNames = nullptr);
