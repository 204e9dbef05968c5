//
// Project: ProtoBank
// File: Prototypes.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <torch/torch.h>


namespace ml {

// Per-class mean of the embeddings: [N, D] embeddings and [N] labels -> [numClasses, D].
// Every class in [0, numClasses) must have at least one sample, std::runtime_error otherwise.
torch::Tensor computePrototypes(const torch::Tensor& embeddings, const torch::Tensor& labels,
    int64_t numClasses);

} // namespace ml
