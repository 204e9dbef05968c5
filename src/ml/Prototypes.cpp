//
// Project: ProtoBank
// File: Prototypes.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/Prototypes.hpp"

#include <stdexcept>
#include <string>
#include <vector>


torch::Tensor ml::computePrototypes(const torch::Tensor& embeddings, const torch::Tensor& labels,
    int64_t numClasses)
{
    if (numClasses <= 0)
        throw std::invalid_argument("computePrototypes: numClasses must be positive");
    if (embeddings.dim() != 2)
        throw std::invalid_argument("computePrototypes: embeddings must be a 2D tensor");
    if (labels.numel() != embeddings.size(0))
        throw std::invalid_argument("computePrototypes: number of labels does not match number of embeddings");

    torch::Tensor l = labels.reshape({-1}).to(embeddings.device(), torch::kInt64);
    std::vector<torch::Tensor> prototypes;
    prototypes.reserve(numClasses);
    for (int64_t c=0; c<numClasses; ++c) {
        torch::Tensor classEmbeddings = embeddings.index({l == c});
        if (classEmbeddings.size(0) == 0)
            throw std::runtime_error("computePrototypes: no samples for class " + std::to_string(c));
        prototypes.push_back(classEmbeddings.mean(0));
    }

    return torch::stack(prototypes);
}
