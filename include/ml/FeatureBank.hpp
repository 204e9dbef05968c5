//
// Project: ProtoBank
// File: FeatureBank.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>


namespace ml {

// Row-aligned export of an episode: L2-normalized feature rows and their banded labels.
// Row order is support, query, classifier weight rows (if any), prototypes.
struct FeatureBank {
    std::vector<float>      features; // row-major, nRows * nCols
    std::vector<int64_t>    labels;
    int64_t                 nRows   {0};
    int64_t                 nCols   {0};

    const float* row(int64_t i) const;
};

// Group a feature bank row belongs to, recoverable from its label
enum class LabelGroup : int {
    Support             = 0,    // [0, C)
    Query               = 2,    // [2C, 3C)
    ClassifierWeight    = 3,    // [3C, 4C)
    Prototype           = 4     // [4C, 5C)
};

// Returns (group, class index). Throws std::out_of_range for labels outside the bands.
std::pair<LabelGroup, int64_t> decodeLabel(int64_t label, int64_t numClasses);

// Concatenates the four feature groups, assigns the banded labels and L2-normalizes every row.
// classWeights is [numClasses, D] or an undefined tensor when there is no classifier.
FeatureBank aggregateFeatures(
    const torch::Tensor& supportFeatures,
    const torch::Tensor& supportLabels,
    const torch::Tensor& queryFeatures,
    const torch::Tensor& queryLabels,
    const torch::Tensor& classWeights,
    int64_t numClasses);

void saveFeatureBank(const FeatureBank& bank, int64_t numClasses, const std::filesystem::path& filename);
FeatureBank loadFeatureBank(const std::filesystem::path& filename);

} // namespace ml
