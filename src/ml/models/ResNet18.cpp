//
// Project: ProtoBank
// File: ResNet18.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/models/ResNet18.hpp"
#include "ml/Checkpoint.hpp"

#include <cstdio>


ml::ResNet ml::resnet18(
    ClassifierType classifierType,
    int64_t numClasses,
    double dropout,
    bool initialPool,
    bool pretrained,
    const std::filesystem::path& pretrainedModelPath)
{
    ResNet model(std::vector<int>{2, 2, 2, 2}, classifierType, numClasses, dropout, initialPool);
    if (pretrained) {
        loadParameters(*model, pretrainedModelPath, /*strict=*/false);
        printf("INFO: Loaded shared weights from %s\n", pretrainedModelPath.c_str());
    }
    return model;
}
