//
// Project: ProtoBank
// File: FeatureExtractorModel.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/models/FeatureExtractorModel.hpp"
#include "ml/models/ResNet18.hpp"
#include "ml/Checkpoint.hpp"
#include "util/ConfigUtils.hpp"
#include "Constants.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>


using namespace ml;
namespace fs = std::filesystem;


Json FeatureExtractorModel::getDefaultModelConfig()
{
    Json modelConfig;

    modelConfig["classifier"] = "linear";
    modelConfig["num_classes"] = protobank::defaultNumClasses;
    modelConfig["dropout"] = 0.0;
    modelConfig["initial_pool"] = false;
    modelConfig["pretrained"] = false;
    modelConfig["pretrained_model_path"] = "";
    modelConfig["image_size"] = protobank::defaultImageSize;
    modelConfig["device"] = "cpu";

    return modelConfig;
}

FeatureExtractorModel::FeatureExtractorModel() :
    _classifierType     (ClassifierType::Linear),
    _numClasses         (protobank::defaultNumClasses),
    _dropout            (0.0),
    _initialPool        (false),
    _pretrained         (false),
    _imageSize          (protobank::defaultImageSize),
    _device             (torch::kCPU),
    _resNet             (nullptr)
{
}

void FeatureExtractorModel::init(const Json& modelConfig)
{
    std::string classifierName = classifierTypeToString(_classifierType);
    std::string deviceName = "cpu";
    std::string pretrainedModelPath = _pretrainedModelPath.string();

    readConfigValue(modelConfig, "classifier", classifierName);
    readConfigValue(modelConfig, "num_classes", _numClasses);
    readConfigValue(modelConfig, "dropout", _dropout);
    readConfigValue(modelConfig, "initial_pool", _initialPool);
    readConfigValue(modelConfig, "pretrained", _pretrained);
    readConfigValue(modelConfig, "pretrained_model_path", pretrainedModelPath);
    readConfigValue(modelConfig, "image_size", _imageSize);
    readConfigValue(modelConfig, "device", deviceName);

    _classifierType = classifierTypeFromString(classifierName);
    if (_classifierType == ClassifierType::None && classifierName != "none")
        printf("WARNING: Unknown classifier \"%s\", using the embedding only\n", classifierName.c_str());

    if (_numClasses <= 0)
        throw std::invalid_argument("num_classes must be positive, got " + std::to_string(_numClasses));
    if (_imageSize <= 0)
        throw std::invalid_argument("image_size must be positive, got " + std::to_string(_imageSize));

    _pretrainedModelPath = pretrainedModelPath;

    if (deviceName == "cuda") {
        if (torch::cuda::is_available())
            _device = torch::kCUDA;
        else {
            printf("WARNING: CUDA requested but not available, running on CPU\n");
            _device = torch::kCPU;
        }
    }
    else
        _device = torch::kCPU;

    printf("INFO: Initializing ResNet-18 with %s classifier, %ld classes\n",
        classifierTypeToString(_classifierType), (long)_numClasses);
    _resNet = resnet18(_classifierType, _numClasses, _dropout, _initialPool, _pretrained, _pretrainedModelPath);
    _resNet->to(_device);
}

void FeatureExtractorModel::save(const fs::path& filename)
{
    if (_resNet.is_empty())
        throw std::runtime_error("FeatureExtractorModel::save called before init");

    saveParameters(*_resNet, filename);
}

void FeatureExtractorModel::infer(const TensorVector& input, TensorVector& output)
{
    if (_resNet.is_empty())
        throw std::runtime_error("FeatureExtractorModel::infer called before init");

    torch::NoGradGuard noGrad;
    _resNet->train(false);

    torch::Tensor embeddings = _resNet->embed(input.at(0).to(_device));

    output.clear();
    output.push_back(embeddings);
    if (_resNet->classifierType() != ClassifierType::None)
        output.push_back(_resNet->classify(embeddings));
}

FeatureBank FeatureExtractorModel::getFinalFeatures(const Episode& episode)
{
    if (_resNet.is_empty())
        throw std::runtime_error("FeatureExtractorModel::getFinalFeatures called before init");

    // The label bands assume the episode spans exactly the configured classes
    torch::Tensor supportLabels = episode.supportLabels.reshape({-1}).to(torch::kCPU, torch::kInt64);
    if (supportLabels.numel() == 0 ||
        supportLabels.min().item<int64_t>() < 0 ||
        supportLabels.max().item<int64_t>() >= _numClasses)
        throw std::runtime_error("Episode support labels are outside the " +
            std::to_string(_numClasses) + " classes the model is configured for");
    int64_t nCovered = (torch::bincount(supportLabels, {}, _numClasses) > 0).sum().item<int64_t>();
    if (nCovered != _numClasses)
        throw std::runtime_error("Episode covers " + std::to_string(nCovered) + " of the " +
            std::to_string(_numClasses) + " classes the model is configured for (num_classes)");

    _resNet->train(false);
    return _resNet->getFinalFeatures(episode);
}

ResNet& FeatureExtractorModel::network() noexcept
{
    return _resNet;
}

int64_t FeatureExtractorModel::numClasses() const noexcept
{
    return _numClasses;
}

int64_t FeatureExtractorModel::imageSize() const noexcept
{
    return _imageSize;
}

const torch::Device& FeatureExtractorModel::device() const noexcept
{
    return _device;
}
