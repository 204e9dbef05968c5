#include "ml/models/FeatureExtractorModel.hpp"
#include "ml/FeatureBank.hpp"
#include "util/ConfigUtils.hpp"
#include "util/EpisodeLoader.hpp"

#include "CLI/CLI.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>


int main(int argc, char** argv)
{
    CLI::App cliApp{"ProtoBank few-shot feature extractor"};
    std::string cliConfig;
    std::string cliSupportDir;
    std::string cliQueryDir;
    std::string cliOutput{"features.json"};
    std::string cliSaveCheckpoint;

    cliApp.add_option("--config,-c", cliConfig, "Model config JSON, defaults are used if omitted");
    cliApp.add_option("--support,-s", cliSupportDir, "Support set directory (<dir>/<class>/<images>)")->required();
    cliApp.add_option("--query,-q", cliQueryDir, "Query set directory (<dir>/<class>/<images>)")->required();
    cliApp.add_option("--output,-o", cliOutput, "Output file for the feature bank");
    cliApp.add_option("--save-checkpoint", cliSaveCheckpoint, "Save the model parameters to this file");

    CLI11_PARSE(cliApp, argc, argv);

    try {
        Json modelConfig = ml::FeatureExtractorModel::getDefaultModelConfig();
        if (!cliConfig.empty())
            modelConfig.update(readJsonFile(cliConfig));

        ml::FeatureExtractorModel model;
        model.init(modelConfig);

        std::vector<std::string> classNames;
        auto episode = loadEpisode(cliSupportDir, cliQueryDir, model.imageSize(), &classNames);
        if ((int64_t)classNames.size() != model.numClasses()) {
            throw std::runtime_error("Support set has " + std::to_string(classNames.size()) +
                " class directories but the model is configured for " +
                std::to_string(model.numClasses()) + " classes (num_classes)");
        }

        auto bank = model.getFinalFeatures(episode);

        printf("INFO: Writing %ld x %ld feature bank to %s\n",
            (long)bank.nRows, (long)bank.nCols, cliOutput.c_str());
        ml::saveFeatureBank(bank, model.numClasses(), cliOutput);

        if (!cliSaveCheckpoint.empty())
            model.save(cliSaveCheckpoint);
    }
    catch (const std::exception& e) {
        fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }

    return 0;
}
