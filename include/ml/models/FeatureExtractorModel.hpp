//
// Project: ProtoBank
// File: FeatureExtractorModel.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include "ml/Model.hpp"
#include "ml/modules/ResNet.hpp"
#include "util/Types.hpp"

#include <filesystem>


namespace ml {

// ResNet-18 feature extractor configured from JSON, used for few-shot evaluation
class FeatureExtractorModel final : public Model {
public:
    static Json getDefaultModelConfig();

    FeatureExtractorModel();
    FeatureExtractorModel(const FeatureExtractorModel&) = delete;
    FeatureExtractorModel(FeatureExtractorModel&&) = delete;
    FeatureExtractorModel& operator=(const FeatureExtractorModel&) = delete;
    FeatureExtractorModel& operator=(FeatureExtractorModel&&) = delete;

    void init(const Json& modelConfig) override;
    void save(const std::filesystem::path& filename) override;

    // input[0]: images [N, 3, H, W]
    // output[0]: embeddings [N, 512], output[1]: class scores [N, C] (only with a classifier)
    void infer(const TensorVector& input, TensorVector& output) override;

    // Feature bank of an episode, computed in evaluation mode
    FeatureBank getFinalFeatures(const Episode& episode);

    ResNet& network() noexcept;
    int64_t numClasses() const noexcept;
    int64_t imageSize() const noexcept;
    const torch::Device& device() const noexcept;

private:
    // Configuration variables
    ClassifierType          _classifierType;
    int64_t                 _numClasses;
    double                  _dropout;
    bool                    _initialPool;
    bool                    _pretrained;
    std::filesystem::path   _pretrainedModelPath;
    int64_t                 _imageSize;
    torch::Device           _device;

    ResNet                  _resNet;
};

} // namespace ml
