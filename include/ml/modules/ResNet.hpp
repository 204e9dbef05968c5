//
// Project: ProtoBank
// File: ResNet.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include "ml/Episode.hpp"
#include "ml/FeatureBank.hpp"
#include "ml/modules/BasicBlock.hpp"
#include "ml/modules/CosineClassifier.hpp"
#include "Constants.hpp"

#include <torch/torch.h>

#include <string>
#include <vector>


namespace ml {

enum class ClassifierType {
    None,       // embedding-only
    Linear,
    Cosine
};

// "linear" and "cosine" map to their types, anything else to ClassifierType::None
ClassifierType classifierTypeFromString(const std::string& name);
const char* classifierTypeToString(ClassifierType type) noexcept;


// Residual network built from BasicBlocks: 5x5 stem, four stages (64, 128, 256, 512 channels)
// and global average pooling, with an optional classifier head on top of the embedding.
class ResNetImpl : public torch::nn::Module {
public:
    // layers: number of blocks in each of the four stages ({2,2,2,2} for ResNet-18)
    explicit ResNetImpl(
        const std::vector<int>& layers,
        ClassifierType classifierType = ClassifierType::None,
        int64_t numClasses = protobank::defaultNumClasses,
        double dropout = 0.0,
        bool initialPool = false
    );

    // [N, 3, H, W] -> class scores [N, numClasses], or the embeddings when there's no classifier
    torch::Tensor forward(torch::Tensor x);

    // [N, 3, H, W] -> [N, 512]
    torch::Tensor embed(torch::Tensor x);

    // Dropout and the classifier head applied to embeddings [N, 512]
    torch::Tensor classify(torch::Tensor embeddings);

    // Embeds the episode and exports support, query, classifier weight rows and prototypes
    // as one labeled, row-normalized feature bank
    FeatureBank getFinalFeatures(const Episode& episode);

    // Parameters and buffers by their dotted names
    torch::OrderedDict<std::string, torch::Tensor> getStateDict() const;
    std::vector<torch::Tensor> getParameters() const;

    // Classifier reference vectors as rows [numClasses, 512], undefined tensor if there's no classifier
    torch::Tensor classWeights() const;

    ClassifierType classifierType() const noexcept;
    int64_t numClasses() const noexcept;
    int64_t outputChannels() const noexcept;

private:
    int                         _inplanes;
    int64_t                     _outplanes;
    int64_t                     _numClasses;
    bool                        _initialPool;
    ClassifierType              _classifierType;

    torch::nn::Conv2d           _conv1;
    torch::nn::BatchNorm2d      _bn1;
    torch::nn::MaxPool2d        _maxPool;
    torch::nn::Sequential       _layer1;
    torch::nn::Sequential       _layer2;
    torch::nn::Sequential       _layer3;
    torch::nn::Sequential       _layer4;
    torch::nn::AdaptiveAvgPool2d _avgPool;
    torch::nn::Dropout          _dropout;
    torch::nn::Linear           _linear;
    CosineClassifier            _cosine;

    torch::nn::Sequential makeLayer(int planes, int blocks, int stride = 1);
};
TORCH_MODULE(ResNet);

} // namespace ml
