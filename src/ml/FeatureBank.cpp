//
// Project: ProtoBank
// File: FeatureBank.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/FeatureBank.hpp"
#include "ml/Prototypes.hpp"
#include "util/TensorUtils.hpp"
#include "util/ConfigUtils.hpp"

#include <stdexcept>
#include <string>


using namespace ml;
namespace fs = std::filesystem;


const float* FeatureBank::row(int64_t i) const
{
    if (i < 0 || i >= nRows)
        throw std::out_of_range("FeatureBank::row: index " + std::to_string(i) + " out of range");
    return features.data() + i*nCols;
}

std::pair<LabelGroup, int64_t> ml::decodeLabel(int64_t label, int64_t numClasses)
{
    if (numClasses <= 0)
        throw std::invalid_argument("decodeLabel: numClasses must be positive");

    int64_t band = label >= 0 ? label / numClasses : -1;
    int64_t index = label - band*numClasses;
    switch (band) {
        case 0: return {LabelGroup::Support, index};
        case 2: return {LabelGroup::Query, index};
        case 3: return {LabelGroup::ClassifierWeight, index};
        case 4: return {LabelGroup::Prototype, index};
        default:
            throw std::out_of_range("decodeLabel: label " + std::to_string(label) +
                " is not in any band for " + std::to_string(numClasses) + " classes");
    }
}

FeatureBank ml::aggregateFeatures(
    const torch::Tensor& supportFeatures,
    const torch::Tensor& supportLabels,
    const torch::Tensor& queryFeatures,
    const torch::Tensor& queryLabels,
    const torch::Tensor& classWeights,
    int64_t numClasses)
{
    if (supportFeatures.dim() != 2 || queryFeatures.dim() != 2)
        throw std::invalid_argument("aggregateFeatures: feature tensors must be 2D");
    if (supportLabels.numel() != supportFeatures.size(0))
        throw std::invalid_argument("aggregateFeatures: support label count does not match support features");
    if (queryLabels.numel() != queryFeatures.size(0))
        throw std::invalid_argument("aggregateFeatures: query label count does not match query features");

    auto device = supportFeatures.device();
    auto labelOptions = torch::TensorOptions().dtype(torch::kInt64).device(device);

    TensorVector features;
    TensorVector labels;

    // Support: labels as-is
    features.push_back(supportFeatures);
    labels.push_back(supportLabels.reshape({-1}).to(device, torch::kInt64));

    // Query: shifted by 2*C
    features.push_back(queryFeatures.to(device));
    labels.push_back(queryLabels.reshape({-1}).to(device, torch::kInt64) + 2*numClasses);

    // Classifier weight rows: 3*C + class index
    if (classWeights.defined()) {
        if (classWeights.dim() != 2 || classWeights.size(0) != numClasses)
            throw std::invalid_argument("aggregateFeatures: classifier weights must have one row per class");
        features.push_back(classWeights.to(device, supportFeatures.scalar_type()));
        labels.push_back(torch::arange(numClasses, labelOptions) + 3*numClasses);
    }

    // Prototypes: 4*C + class index
    features.push_back(computePrototypes(supportFeatures, supportLabels, numClasses));
    labels.push_back(torch::arange(numClasses, labelOptions) + 4*numClasses);

    torch::Tensor featureMatrix = normalizeRows(torch::cat(features, 0)).to(torch::kFloat32);
    torch::Tensor labelVector = torch::cat(labels, 0);

    FeatureBank bank;
    bank.nRows = featureMatrix.size(0);
    bank.nCols = featureMatrix.size(1);
    copyFromTensor(featureMatrix, bank.features);
    copyFromTensor(labelVector, bank.labels);

    return bank;
}

void ml::saveFeatureBank(const FeatureBank& bank, int64_t numClasses, const fs::path& filename)
{
    Json json;
    json["n_rows"] = bank.nRows;
    json["n_cols"] = bank.nCols;
    json["num_classes"] = numClasses;
    json["labels"] = bank.labels;
    json["features"] = bank.features;

    writeJsonFile(json, filename, -1);
}

FeatureBank ml::loadFeatureBank(const fs::path& filename)
{
    auto json = readJsonFile(filename);

    FeatureBank bank;
    bank.nRows = json.at("n_rows").get<int64_t>();
    bank.nCols = json.at("n_cols").get<int64_t>();
    bank.labels = json.at("labels").get<std::vector<int64_t>>();
    bank.features = json.at("features").get<std::vector<float>>();

    if ((int64_t)bank.labels.size() != bank.nRows || (int64_t)bank.features.size() != bank.nRows*bank.nCols)
        throw std::runtime_error("Malformed feature bank file " + filename.string());

    return bank;
}
