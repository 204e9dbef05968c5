//
// Project: ProtoBank
// File: TensorUtils.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "util/TensorUtils.hpp"


torch::Tensor normalizeRows(const torch::Tensor& x, double eps)
{
    namespace tf = torch::nn::functional;
    return tf::normalize(x, tf::NormalizeFuncOptions().p(2).dim(-1).eps(eps));
}
