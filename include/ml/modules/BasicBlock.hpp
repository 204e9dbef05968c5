//
// Project: ProtoBank
// File: BasicBlock.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <torch/torch.h>


namespace ml {

// Two 3x3 convolutions with batch norm and an identity (or 1x1 projection) shortcut
class BasicBlockImpl : public torch::nn::Module {
public:
    static constexpr int expansion = 1;

    explicit BasicBlockImpl(
        int inputChannels,
        int outputChannels,
        int stride = 1
    );

    torch::Tensor forward(torch::Tensor x);

    // true if the block carries the 1x1 projection shortcut
    bool hasDownsample() const noexcept;

private:
    torch::nn::Conv2d           _conv1;
    torch::nn::BatchNorm2d      _bn1;
    torch::nn::Conv2d           _conv2;
    torch::nn::BatchNorm2d      _bn2;
    torch::nn::Sequential       _downsample; // conv1x1 + bn, null when the shapes match
};
TORCH_MODULE(BasicBlock);

} // namespace ml
