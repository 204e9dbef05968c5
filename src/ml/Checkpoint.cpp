//
// Project: ProtoBank
// File: Checkpoint.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/Checkpoint.hpp"

#include <cstdio>
#include <set>
#include <stdexcept>
#include <utility>


using namespace ml;
namespace fs = std::filesystem;


namespace {

    using TensorLoad = std::pair<torch::Tensor, torch::Tensor>; // (destination, source)

    // Walks the module tree and the archive tree side by side, collecting the tensors to copy
    void matchArchive(
        torch::nn::Module& module,
        torch::serialize::InputArchive& archive,
        const std::string& prefix,
        std::vector<TensorLoad>& loads,
        LoadResult& result)
    {
        std::set<std::string> knownKeys {"training"}; // attribute added by the archive itself

        auto matchTensor = [&](const std::string& key, torch::Tensor& tensor, bool isBuffer) {
            knownKeys.insert(key);
            torch::Tensor source;
            if (!archive.try_read(key, source, isBuffer)) {
                result.missingKeys.push_back(prefix + key);
                return;
            }
            if (!tensor.defined() || source.sizes() != tensor.sizes()) {
                result.mismatchedKeys.push_back(prefix + key);
                return;
            }
            loads.emplace_back(tensor, source);
        };

        for (auto& parameter : module.named_parameters(/*recurse=*/false))
            matchTensor(parameter.key(), parameter.value(), false);
        for (auto& buffer : module.named_buffers(/*recurse=*/false))
            matchTensor(buffer.key(), buffer.value(), true);

        for (auto& child : module.named_children()) {
            if (!child.value()->is_serializable())
                continue;
            knownKeys.insert(child.key());

            torch::serialize::InputArchive childArchive;
            if (archive.try_read(child.key(), childArchive)) {
                matchArchive(*child.value(), childArchive, prefix + child.key() + ".", loads, result);
            }
            else {
                // the whole submodule is missing
                for (auto& parameter : child.value()->named_parameters())
                    result.missingKeys.push_back(prefix + child.key() + "." + parameter.key());
                for (auto& buffer : child.value()->named_buffers())
                    result.missingKeys.push_back(prefix + child.key() + "." + buffer.key());
            }
        }

        for (auto& key : archive.keys()) {
            if (knownKeys.count(key) == 0)
                result.unexpectedKeys.push_back(prefix + key);
        }
    }

    std::string joinKeys(const std::vector<std::string>& keys)
    {
        std::string joined;
        for (const auto& key : keys) {
            if (!joined.empty())
                joined += ", ";
            joined += key;
        }
        return joined;
    }

} // namespace


bool LoadResult::clean() const noexcept
{
    return missingKeys.empty() && unexpectedKeys.empty() && mismatchedKeys.empty();
}

LoadResult ml::loadParameters(torch::nn::Module& module, torch::serialize::InputArchive& archive, bool strict)
{
    LoadResult result;
    std::vector<TensorLoad> loads;
    matchArchive(module, archive, "", loads, result);

    if (strict && !result.clean()) {
        std::string message = "Error loading parameters:";
        if (!result.missingKeys.empty())
            message += " missing keys [" + joinKeys(result.missingKeys) + "]";
        if (!result.unexpectedKeys.empty())
            message += " unexpected keys [" + joinKeys(result.unexpectedKeys) + "]";
        if (!result.mismatchedKeys.empty())
            message += " size mismatch [" + joinKeys(result.mismatchedKeys) + "]";
        throw std::runtime_error(message);
    }

    {
        torch::NoGradGuard noGrad;
        for (auto& [destination, source] : loads)
            destination.copy_(source);
    }

    for (const auto& key : result.missingKeys)
        printf("WARNING: Missing key in checkpoint: %s\n", key.c_str());
    for (const auto& key : result.unexpectedKeys)
        printf("WARNING: Unexpected key in checkpoint: %s\n", key.c_str());
    for (const auto& key : result.mismatchedKeys)
        printf("WARNING: Size mismatch for %s, keeping the initial values\n", key.c_str());

    return result;
}

LoadResult ml::loadParameters(torch::nn::Module& module, const fs::path& filename, bool strict)
{
    if (!fs::exists(filename))
        throw std::runtime_error("Checkpoint " + filename.string() + " does not exist");

    torch::serialize::InputArchive archive;
    archive.load_from(filename.string());
    return loadParameters(module, archive, strict);
}

void ml::saveParameters(const torch::nn::Module& module, const fs::path& filename)
{
    printf("INFO: Saving model parameters to %s\n", filename.c_str());
    torch::serialize::OutputArchive outputArchive;
    module.save(outputArchive);
    outputArchive.save_to(filename.string());
}
