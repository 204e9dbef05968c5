//
// Project: ProtoBank
// File: Model.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include "util/Types.hpp"

#include <filesystem>


namespace ml {

// Interface class for models.
// Implement pure virtual functions init() and infer() in the derived class.
// Optionally, the default functionality of save() can be overridden.
class Model {
public:
    Model() = default;
    virtual ~Model() = default;

    // Initialize the model using a model config
    virtual void init(const Json& modelConfig) = 0;

    // Save the model
    virtual void save(const std::filesystem::path& filename);

    virtual void infer(const TensorVector& input, TensorVector& output) = 0;
};

} // namespace ml
