//
// Project: ProtoBank
// File: Types.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <vector>

#include <nlohmann/json.hpp>
#include <torch/torch.h>


using TensorVector = std::vector<torch::Tensor>;
using Json = nlohmann::json;
