//
// Project: ProtoBank
// File: CosineClassifier.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <torch/torch.h>


namespace ml {

// Scaled cosine similarity between the input embeddings and learned per-class
// reference vectors. Weight is stored as [inputFeatures, numClasses] (one column per class).
class CosineClassifierImpl : public torch::nn::Module {
public:
    CosineClassifierImpl(int64_t inputFeatures, int64_t numClasses, double initialScale = 10.0);

    // x: [N, inputFeatures] -> [N, numClasses]
    torch::Tensor forward(const torch::Tensor& x);

    // Reference vectors as rows, [numClasses, inputFeatures]
    torch::Tensor classWeights() const;

    torch::Tensor   weight;
    torch::Tensor   scale;

private:
    int64_t         _numClasses;
};
TORCH_MODULE(CosineClassifier);

} // namespace ml
