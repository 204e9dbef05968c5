//
// Project: ProtoBank
// File: ResNet18.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include "ml/modules/ResNet.hpp"
#include "Constants.hpp"

#include <filesystem>


namespace ml {

// Constructs a ResNet-18 ({2,2,2,2} basic blocks). With pretrained set, the parameters found in
// pretrainedModelPath are loaded non-strictly (missing / extra keys only produce warnings).
ResNet resnet18(
    ClassifierType classifierType = ClassifierType::None,
    int64_t numClasses = protobank::defaultNumClasses,
    double dropout = 0.0,
    bool initialPool = false,
    bool pretrained = false,
    const std::filesystem::path& pretrainedModelPath = {}
);

} // namespace ml
