//
// Project: ProtoBank
// File: BasicBlock.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/modules/BasicBlock.hpp"


using namespace ml;
using namespace torch;


BasicBlockImpl::BasicBlockImpl(
    int inputChannels,
    int outputChannels,
    int stride
) :
    _conv1      (nn::Conv2dOptions(inputChannels, outputChannels, {3, 3})
                 .stride(stride).padding(1).bias(false)),
    _bn1        (nn::BatchNorm2dOptions(outputChannels)),
    _conv2      (nn::Conv2dOptions(outputChannels, outputChannels, {3, 3})
                 .stride(1).padding(1).bias(false)),
    _bn2        (nn::BatchNorm2dOptions(outputChannels)),
    _downsample (nullptr)
{
    register_module("conv1", _conv1);
    register_module("bn1", _bn1);
    register_module("conv2", _conv2);
    register_module("bn2", _bn2);

    if (stride != 1 || inputChannels != outputChannels*expansion) {
        _downsample = nn::Sequential(
            nn::Conv2d(nn::Conv2dOptions(inputChannels, outputChannels*expansion, {1, 1})
                .stride(stride).bias(false)),
            nn::BatchNorm2d(nn::BatchNorm2dOptions(outputChannels*expansion))
        );
        register_module("downsample", _downsample);
    }
}

torch::Tensor BasicBlockImpl::forward(torch::Tensor x)
{
    torch::Tensor y = _conv1(x);
    y = relu(_bn1(y));
    y = _conv2(y);
    y = _bn2(y);

    // Skip connection
    if (!_downsample.is_empty())
        x = _downsample->forward(x);

    return relu(x + y);
}

bool BasicBlockImpl::hasDownsample() const noexcept
{
    return !_downsample.is_empty();
}
