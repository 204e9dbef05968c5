//
// Project: ProtoBank
// File: Model.cpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#include "ml/Model.hpp"


using namespace ml;


void Model::save(const std::filesystem::path& filename)
{
}
