//
// Project: ProtoBank
// File: EpisodeLoader.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "util/EpisodeLoader.hpp"
#include "util/TensorUtils.hpp"
#include "util/Types.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <map>
#include <stdexcept>
#include <utility>


namespace fs = std::filesystem;


namespace {

    std::vector<fs::path> sortedEntries(const fs::path& dir, bool directories)
    {
        std::vector<fs::path> entries;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (directories ? entry.is_directory() : entry.is_regular_file())
                entries.push_back(entry.path());
        }
        std::sort(entries.begin(), entries.end());
        return entries;
    }

    // Loads all images of one split, returns the image batch and writes the labels
    torch::Tensor loadSplit(
        const fs::path& dir,
        const std::map<std::string, int64_t>& classIndices,
        int64_t imageSize,
        std::vector<int64_t>& labels)
    {
        if (!fs::is_directory(dir))
            throw std::runtime_error(dir.string() + " is not a directory");

        TensorVector images;
        for (const auto& classDir : sortedEntries(dir, true)) {
            auto className = classDir.filename().string();
            auto it = classIndices.find(className);
            if (it == classIndices.end())
                throw std::runtime_error("Class \"" + className + "\" in " + dir.string() +
                    " has no support images");

            for (const auto& imageFilename : sortedEntries(classDir, false)) {
                try {
                    images.push_back(loadImage(imageFilename, imageSize));
                    labels.push_back(it->second);
                }
                catch (const std::runtime_error& e) {
                    printf("WARNING: Skipping %s: %s\n", imageFilename.c_str(), e.what());
                }
            }
        }

        if (images.empty())
            throw std::runtime_error("No images found in " + dir.string());

        return torch::stack(images);
    }

    torch::Tensor labelTensor(const std::vector<int64_t>& labels)
    {
        torch::Tensor tensor = torch::empty({(int64_t)labels.size()}, torch::kInt64);
        copyToTensor(labels, tensor);
        return tensor;
    }

} // namespace


torch::Tensor loadImage(const fs::path& filename, int64_t imageSize)
{
    cv::Mat image = cv::imread(filename.string(), cv::IMREAD_COLOR);
    if (image.empty())
        throw std::runtime_error("Unable to read image " + filename.string());

    cv::cvtColor(image, image, cv::COLOR_BGR2RGB);
    cv::Mat resized;
    cv::resize(image, resized, cv::Size((int)imageSize, (int)imageSize), 0.0, 0.0, cv::INTER_AREA);
    if (!resized.isContinuous())
        resized = resized.clone();

    torch::Tensor tensor = torch::empty({imageSize, imageSize, 3}, torch::kUInt8);
    copyToTensor(resized.data, resized.total()*resized.channels(), tensor);

    // HWC uint8 -> CHW float in [-1, 1]
    return tensor.permute({2, 0, 1}).to(torch::kFloat32) / 255.0 * 2.0 - 1.0;
}

ml::Episode loadEpisode(
    const fs::path& supportDir,
    const fs::path& queryDir,
    int64_t imageSize,
    std::vector<std::string>* classNames)
{
    if (!fs::is_directory(supportDir))
        throw std::runtime_error(supportDir.string() + " is not a directory");

    std::map<std::string, int64_t> classIndices;
    std::vector<std::string> names;
    for (const auto& classDir : sortedEntries(supportDir, true)) {
        names.push_back(classDir.filename().string());
        classIndices[names.back()] = (int64_t)names.size()-1;
    }
    if (names.empty())
        throw std::runtime_error("No class directories in " + supportDir.string());

    std::vector<int64_t> supportLabels;
    std::vector<int64_t> queryLabels;

    ml::Episode episode;
    episode.supportImages = loadSplit(supportDir, classIndices, imageSize, supportLabels);
    episode.supportLabels = labelTensor(supportLabels);

    // every class needs a support image for its prototype
    for (int64_t c=0; c<(int64_t)names.size(); ++c) {
        if (std::find(supportLabels.begin(), supportLabels.end(), c) == supportLabels.end())
            throw std::runtime_error("Support class directory " + (supportDir / names[c]).string() +
                " contains no readable images");
    }

    episode.queryImages = loadSplit(queryDir, classIndices, imageSize, queryLabels);
    episode.queryLabels = labelTensor(queryLabels);

    printf("INFO: Loaded episode with %ld classes, %ld support and %ld query images\n",
        (long)names.size(), (long)supportLabels.size(), (long)queryLabels.size());

    if (classNames != nullptr)
        *classNames = std::move(names);

    return episode;
}
