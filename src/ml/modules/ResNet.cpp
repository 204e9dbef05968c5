//
// Project: ProtoBank
// File: ResNet.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/modules/ResNet.hpp"
#include "Constants.hpp"

#include <stdexcept>


using namespace ml;
using namespace torch;


ClassifierType ml::classifierTypeFromString(const std::string& name)
{
    if (name == "linear")
        return ClassifierType::Linear;
    if (name == "cosine")
        return ClassifierType::Cosine;
    return ClassifierType::None;
}

const char* ml::classifierTypeToString(ClassifierType type) noexcept
{
    switch (type) {
        case ClassifierType::Linear:    return "linear";
        case ClassifierType::Cosine:    return "cosine";
        default:                        return "none";
    }
}

ResNetImpl::ResNetImpl(
    const std::vector<int>& layers,
    ClassifierType classifierType,
    int64_t numClasses,
    double dropout,
    bool initialPool
) :
    _inplanes       (64),
    _outplanes      (protobank::embeddingLength),
    _numClasses     (numClasses),
    _initialPool    (initialPool),
    _classifierType (classifierType),
    _conv1          (nn::Conv2dOptions(3, _inplanes, {5, 5}).stride(2).padding(1).bias(false)),
    _bn1            (nn::BatchNorm2dOptions(_inplanes)),
    _maxPool        (nn::MaxPool2dOptions({3, 3}).stride(2).padding(1)),
    _layer1         (nullptr),
    _layer2         (nullptr),
    _layer3         (nullptr),
    _layer4         (nullptr),
    _avgPool        (nn::AdaptiveAvgPool2dOptions({1, 1})),
    _dropout        (nn::DropoutOptions(dropout)),
    _linear         (nullptr),
    _cosine         (nullptr)
{
    if (layers.size() != 4)
        throw std::invalid_argument("ResNet requires block counts for exactly 4 stages");
    for (auto n : layers) {
        if (n < 1)
            throw std::invalid_argument("ResNet stages need at least one block each");
    }
    if (_classifierType != ClassifierType::None && _numClasses <= 0)
        throw std::invalid_argument("Classifier requires a positive number of classes");

    int planes = _inplanes;
    register_module("conv1", _conv1);
    register_module("bn1", _bn1);
    register_module("maxpool", _maxPool);
    _layer1 = register_module("layer1", makeLayer(planes, layers[0]));
    _layer2 = register_module("layer2", makeLayer(planes*2, layers[1], 2));
    _layer3 = register_module("layer3", makeLayer(planes*4, layers[2], 2));
    _layer4 = register_module("layer4", makeLayer(planes*8, layers[3], 2));
    register_module("avgpool", _avgPool);
    register_module("dropout", _dropout);

    // Both heads are stored under the same name so that checkpoints stay interchangeable
    switch (_classifierType) {
        case ClassifierType::Linear:
            _linear = register_module("cls_fn", nn::Linear(_outplanes, _numClasses));
            break;
        case ClassifierType::Cosine:
            _cosine = register_module("cls_fn", CosineClassifier(_outplanes, _numClasses));
            break;
        default:
            break;
    }

    for (auto& m : modules(/*include_self=*/false)) {
        if (auto* conv = m->as<nn::Conv2d>()) {
            nn::init::kaiming_normal_(conv->weight, 0.0, torch::kFanOut, torch::kReLU);
        }
        else if (auto* bn = m->as<nn::BatchNorm2d>()) {
            nn::init::constant_(bn->weight, 1.0);
            nn::init::constant_(bn->bias, 0.0);
        }
    }
}

torch::Tensor ResNetImpl::forward(torch::Tensor x)
{
    return classify(embed(x));
}

torch::Tensor ResNetImpl::classify(torch::Tensor x)
{
    x = _dropout(x);

    switch (_classifierType) {
        case ClassifierType::Linear:    return _linear(x);
        case ClassifierType::Cosine:    return _cosine(x);
        default:                        return x;
    }
}

torch::Tensor ResNetImpl::embed(torch::Tensor x)
{
    x = _conv1(x);
    x = relu(_bn1(x));
    if (_initialPool)
        x = _maxPool(x);

    x = _layer1->forward(x);
    x = _layer2->forward(x);
    x = _layer3->forward(x);
    x = _layer4->forward(x);

    x = _avgPool(x);
    return x.flatten(1); // keep the batch dimension also for single images
}

FeatureBank ResNetImpl::getFinalFeatures(const Episode& episode)
{
    torch::NoGradGuard noGrad;
    auto device = _conv1->weight.device();

    torch::Tensor supportFeatures = embed(episode.supportImages.to(device));
    torch::Tensor queryFeatures = embed(episode.queryImages.to(device));

    return aggregateFeatures(supportFeatures, episode.supportLabels, queryFeatures, episode.queryLabels,
        classWeights(), _numClasses);
}

torch::OrderedDict<std::string, torch::Tensor> ResNetImpl::getStateDict() const
{
    torch::OrderedDict<std::string, torch::Tensor> stateDict;
    for (const auto& p : named_parameters())
        stateDict.insert(p.key(), p.value());
    for (const auto& b : named_buffers())
        stateDict.insert(b.key(), b.value());
    return stateDict;
}

std::vector<torch::Tensor> ResNetImpl::getParameters() const
{
    return parameters();
}

torch::Tensor ResNetImpl::classWeights() const
{
    switch (_classifierType) {
        case ClassifierType::Linear:    return _linear->weight;
        case ClassifierType::Cosine:    return _cosine->classWeights();
        default:                        return {};
    }
}

ClassifierType ResNetImpl::classifierType() const noexcept
{
    return _classifierType;
}

int64_t ResNetImpl::numClasses() const noexcept
{
    return _numClasses;
}

int64_t ResNetImpl::outputChannels() const noexcept
{
    return _outplanes;
}

torch::nn::Sequential ResNetImpl::makeLayer(int planes, int blocks, int stride)
{
    nn::Sequential layer;
    layer->push_back(BasicBlock(_inplanes, planes, stride));
    _inplanes = planes * BasicBlockImpl::expansion;
    for (int i=1; i<blocks; ++i)
        layer->push_back(BasicBlock(_inplanes, planes));
    return layer;
}
