//
// Project: ProtoBank
// File: Episode.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <torch/torch.h>


namespace ml {

// Support / query split of a few-shot task.
// Images are [N, 3, H, W] float tensors, labels are [N] integer class indices.
struct Episode {
    torch::Tensor   supportImages;
    torch::Tensor   supportLabels;
    torch::Tensor   queryImages;
    torch::Tensor   queryLabels;
};

} // namespace ml
