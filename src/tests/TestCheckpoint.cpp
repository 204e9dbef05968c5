//
// Project: ProtoBank
// File: TestCheckpoint.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include <gtest/gtest.h>

#include "ml/Checkpoint.hpp"
#include "ml/models/ResNet18.hpp"

#include <algorithm>
#include <filesystem>


using namespace ml;
namespace fs = std::filesystem;


namespace {

    bool containsKey(const std::vector<std::string>& keys, const std::string& key)
    {
        return std::find(keys.begin(), keys.end(), key) != keys.end();
    }

    // Removes the file when the test scope ends
    struct TempFile {
        fs::path path;

        explicit TempFile(const std::string& name) :
            path(fs::temp_directory_path() / name)
        {}
        ~TempFile()
        {
            std::error_code ec;
            fs::remove(path, ec);
        }
    };

} // namespace


TEST(TestCheckpoint, TestStrictRoundTrip)
{
    torch::manual_seed(31);
    TempFile checkpoint("protobank_test_round_trip.pt");

    auto model1 = resnet18(ClassifierType::Cosine, 5);
    {   // update the batch norm running statistics so that the buffers differ from the defaults
        torch::NoGradGuard noGrad;
        model1->train(true);
        model1->forward(torch::randn({4, 3, 32, 32}));
    }
    model1->train(false);
    saveParameters(*model1, checkpoint.path);
    ASSERT_TRUE(fs::exists(checkpoint.path));

    auto model2 = resnet18(ClassifierType::Cosine, 5);
    model2->train(false);

    torch::NoGradGuard noGrad;
    auto x = torch::randn({3, 3, 32, 32});
    ASSERT_FALSE(torch::allclose(model1->forward(x), model2->forward(x)));

    auto result = loadParameters(*model2, checkpoint.path, /*strict=*/true);
    ASSERT_TRUE(result.clean());

    ASSERT_TRUE(torch::equal(model1->embed(x), model2->embed(x)));
    ASSERT_TRUE(torch::equal(model1->forward(x), model2->forward(x)));

    auto stateDict1 = model1->getStateDict();
    auto stateDict2 = model2->getStateDict();
    ASSERT_EQ(stateDict1.size(), stateDict2.size());
    for (const auto& item : stateDict1)
        ASSERT_TRUE(torch::equal(item.value(), stateDict2[item.key()])) << item.key();
}

TEST(TestCheckpoint, TestNonStrictClassifierSwap)
{
    torch::manual_seed(32);
    TempFile checkpoint("protobank_test_classifier_swap.pt");

    auto linearModel = resnet18(ClassifierType::Linear, 8);
    linearModel->train(false);
    saveParameters(*linearModel, checkpoint.path);

    // Strict loading refuses the differing head and leaves the model untouched
    auto cosineModel = resnet18(ClassifierType::Cosine, 8);
    cosineModel->train(false);
    auto conv1Before = cosineModel->getStateDict()["conv1.weight"].clone();
    ASSERT_THROW(loadParameters(*cosineModel, checkpoint.path, /*strict=*/true), std::runtime_error);
    ASSERT_TRUE(torch::equal(conv1Before, cosineModel->getStateDict()["conv1.weight"]));

    // Non-strict loading takes the backbone and reports the head
    testing::internal::CaptureStdout();
    auto result = loadParameters(*cosineModel, checkpoint.path, /*strict=*/false);
    std::string log = testing::internal::GetCapturedStdout();
    ASSERT_NE(log.find("WARNING: Size mismatch for cls_fn.weight"), std::string::npos);
    ASSERT_NE(log.find("WARNING: Unexpected key in checkpoint: cls_fn.bias"), std::string::npos);
    ASSERT_NE(log.find("WARNING: Missing key in checkpoint: cls_fn.scale"), std::string::npos);
    ASSERT_FALSE(result.clean());
    ASSERT_TRUE(containsKey(result.mismatchedKeys, "cls_fn.weight")); // [8, 512] vs [512, 8]
    ASSERT_TRUE(containsKey(result.unexpectedKeys, "cls_fn.bias"));
    ASSERT_TRUE(containsKey(result.missingKeys, "cls_fn.scale"));
    ASSERT_FALSE(containsKey(result.missingKeys, "conv1.weight"));

    torch::NoGradGuard noGrad;
    auto x = torch::randn({2, 3, 32, 32});
    ASSERT_TRUE(torch::allclose(linearModel->embed(x), cosineModel->embed(x)));
}

TEST(TestCheckpoint, TestNonStrictMissingHead)
{
    torch::manual_seed(33);
    TempFile checkpoint("protobank_test_missing_head.pt");

    auto backbone = resnet18(ClassifierType::None);
    saveParameters(*backbone, checkpoint.path);

    auto model = resnet18(ClassifierType::Linear, 3);
    auto weightBefore = model->classWeights().clone();
    auto result = loadParameters(*model, checkpoint.path, /*strict=*/false);

    ASSERT_TRUE(containsKey(result.missingKeys, "cls_fn.weight"));
    ASSERT_TRUE(containsKey(result.missingKeys, "cls_fn.bias"));
    ASSERT_TRUE(result.unexpectedKeys.empty());
    ASSERT_TRUE(result.mismatchedKeys.empty());
    ASSERT_TRUE(torch::equal(weightBefore, model->classWeights()));

    // The other way around only the head is superfluous
    TempFile checkpoint2("protobank_test_extra_head.pt");
    saveParameters(*model, checkpoint2.path);
    auto result2 = loadParameters(*backbone, checkpoint2.path, /*strict=*/false);
    ASSERT_TRUE(result2.missingKeys.empty());
    ASSERT_TRUE(containsKey(result2.unexpectedKeys, "cls_fn"));
}

TEST(TestCheckpoint, TestPretrained)
{
    torch::manual_seed(34);
    TempFile checkpoint("protobank_test_pretrained.pt");

    auto model1 = resnet18(ClassifierType::Linear, 4);
    model1->train(false);
    saveParameters(*model1, checkpoint.path);

    auto model2 = resnet18(ClassifierType::Linear, 4, 0.0, false, true, checkpoint.path);
    model2->train(false);

    torch::NoGradGuard noGrad;
    auto x = torch::randn({2, 3, 32, 32});
    ASSERT_TRUE(torch::equal(model1->forward(x), model2->forward(x)));

    ASSERT_THROW(resnet18(ClassifierType::Linear, 4, 0.0, false, true,
        fs::temp_directory_path() / "protobank_no_such_checkpoint.pt"), std::runtime_error);
}
