//
// Project: ProtoBank
// File: TestEpisodeLoader.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include <gtest/gtest.h>

#include "util/EpisodeLoader.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>


namespace fs = std::filesystem;


namespace {

    // Creates <root>/<split>/<class>/<image> trees with solid color images
    class EpisodeDirectory {
    public:
        EpisodeDirectory() :
            _root(fs::temp_directory_path() / "protobank_test_episode")
        {
            fs::remove_all(_root);
            fs::create_directories(_root);
        }
        ~EpisodeDirectory()
        {
            std::error_code ec;
            fs::remove_all(_root, ec);
        }

        void addImage(const std::string& split, const std::string& className, const std::string& name,
            const cv::Scalar& bgr, int size = 24)
        {
            fs::path dir = _root / split / className;
            fs::create_directories(dir);
            cv::Mat image(size, size, CV_8UC3, bgr);
            ASSERT_TRUE(cv::imwrite((dir / name).string(), image));
        }

        fs::path path(const std::string& split) const
        {
            return _root / split;
        }

    private:
        fs::path    _root;
    };

} // namespace


TEST(TestEpisodeLoader, TestLoadImage)
{
    EpisodeDirectory dir;
    dir.addImage("support", "red", "0.png", cv::Scalar(0, 0, 255), 40);

    auto image = loadImage(dir.path("support") / "red" / "0.png", 16);
    ASSERT_TRUE((image.sizes() == std::vector<int64_t>{3, 16, 16}));
    ASSERT_EQ(image.scalar_type(), torch::kFloat32);

    // RGB channel order, scaled to [-1, 1]
    ASSERT_NEAR(image[0].mean().item<float>(), 1.0f, 1.0e-5f);
    ASSERT_NEAR(image[1].mean().item<float>(), -1.0f, 1.0e-5f);
    ASSERT_NEAR(image[2].mean().item<float>(), -1.0f, 1.0e-5f);

    ASSERT_THROW(loadImage(dir.path("support") / "red" / "missing.png", 16), std::runtime_error);
}

TEST(TestEpisodeLoader, TestLoadEpisode)
{
    EpisodeDirectory dir;
    dir.addImage("support", "dog", "0.png", cv::Scalar(255, 0, 0));
    dir.addImage("support", "cat", "0.png", cv::Scalar(0, 255, 0));
    dir.addImage("support", "cat", "1.png", cv::Scalar(0, 128, 0));
    dir.addImage("query", "dog", "0.png", cv::Scalar(200, 0, 0));
    dir.addImage("query", "cat", "0.png", cv::Scalar(0, 200, 0));
    dir.addImage("query", "dog", "1.png", cv::Scalar(100, 0, 0));

    // Files that aren't images are skipped
    {
        std::ofstream notes(dir.path("support") / "cat" / "notes.txt");
        notes << "not an image";
    }

    std::vector<std::string> classNames;
    auto episode = loadEpisode(dir.path("support"), dir.path("query"), 12, &classNames);

    ASSERT_EQ(classNames, (std::vector<std::string>{"cat", "dog"}));
    ASSERT_TRUE((episode.supportImages.sizes() == std::vector<int64_t>{3, 3, 12, 12}));
    ASSERT_TRUE((episode.queryImages.sizes() == std::vector<int64_t>{3, 3, 12, 12}));

    std::vector<int64_t> supportLabels(episode.supportLabels.data_ptr<int64_t>(),
        episode.supportLabels.data_ptr<int64_t>() + episode.supportLabels.numel());
    std::vector<int64_t> queryLabels(episode.queryLabels.data_ptr<int64_t>(),
        episode.queryLabels.data_ptr<int64_t>() + episode.queryLabels.numel());
    ASSERT_EQ(supportLabels, (std::vector<int64_t>{0, 0, 1}));
    ASSERT_EQ(queryLabels, (std::vector<int64_t>{0, 1, 1}));

    ASSERT_LE(episode.supportImages.max().item<float>(), 1.0f);
    ASSERT_GE(episode.supportImages.min().item<float>(), -1.0f);
}

TEST(TestEpisodeLoader, TestUnknownQueryClass)
{
    EpisodeDirectory dir;
    dir.addImage("support", "cat", "0.png", cv::Scalar(0, 255, 0));
    dir.addImage("query", "bird", "0.png", cv::Scalar(0, 0, 255));

    ASSERT_THROW(loadEpisode(dir.path("support"), dir.path("query"), 12), std::runtime_error);
    ASSERT_THROW(loadEpisode(dir.path("nothing"), dir.path("query"), 12), std::runtime_error);
}

TEST(TestEpisodeLoader, TestEmptySupportClass)
{
    EpisodeDirectory dir;
    dir.addImage("support", "cat", "0.png", cv::Scalar(0, 255, 0));
    dir.addImage("query", "cat", "0.png", cv::Scalar(0, 200, 0));
    fs::create_directories(dir.path("support") / "dog");
    {
        std::ofstream notes(dir.path("support") / "dog" / "notes.txt");
        notes << "not an image";
    }

    try {
        loadEpisode(dir.path("support"), dir.path("query"), 12);
        FAIL() << "Expected std::runtime_error";
    }
    catch (const std::runtime_error& e) {
        ASSERT_NE(std::string(e.what()).find("dog"), std::string::npos);
    }
}
