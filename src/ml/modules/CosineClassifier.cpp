//
// Project: ProtoBank
// File: CosineClassifier.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/modules/CosineClassifier.hpp"

#include <cmath>


using namespace ml;
using namespace torch;
namespace tf = torch::nn::functional;


CosineClassifierImpl::CosineClassifierImpl(int64_t inputFeatures, int64_t numClasses, double initialScale) :
    _numClasses (numClasses)
{
    weight = register_parameter("weight",
        torch::empty({inputFeatures, numClasses}).normal_(0.0, std::sqrt(2.0 / (double)numClasses)));
    scale = register_parameter("scale", torch::tensor(initialScale, torch::kFloat32));
}

torch::Tensor CosineClassifierImpl::forward(const torch::Tensor& x)
{
    torch::Tensor xNorm = tf::normalize(x, tf::NormalizeFuncOptions().p(2).dim(-1).eps(1.0e-12));
    torch::Tensor wNorm = tf::normalize(weight, tf::NormalizeFuncOptions().p(2).dim(0).eps(1.0e-12));
    return scale * torch::matmul(xNorm, wNorm);
}

torch::Tensor CosineClassifierImpl::classWeights() const
{
    return weight.t();
}
