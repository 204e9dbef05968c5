//
// Project: ProtoBank
// File: TensorUtils.hpp
//
// Copyright (c) 2023 Miika 'Lehdari' Lehtimäki
//

#pragma once

#include <cstring>
#include <stdexcept>
#include <vector>
#include <torch/torch.h>


// template utility for scalar type -> torch type enum conversion
template <typename T_ScalarType>
struct ToTorchType {};
template <> struct ToTorchType<float> { static constexpr auto Type = torch::kFloat32; };
template <> struct ToTorchType<double> { static constexpr auto Type = torch::kFloat64; };
template <> struct ToTorchType<int32_t> { static constexpr auto Type = torch::kInt32; };
template <> struct ToTorchType<int64_t> { static constexpr auto Type = torch::kInt64; };
template <> struct ToTorchType<uint8_t> { static constexpr auto Type = torch::kUInt8; };


// Utility functions for copying data from torch tensors to data structures in main memory

// Raw buffer
template<typename T_Data>
inline void copyFromTensor(const torch::Tensor& tensor, T_Data* data, std::size_t size)
{
    if (!tensor.dtype().Match<T_Data>())
        throw std::runtime_error("Tensor and buffer data types do not match");

    if ((std::size_t)tensor.numel() != size) // sizes need to exactly match to avoid confusion
        throw std::runtime_error("Unequal number of elements in buffer and tensor");

    // make a contiguous CPU copy in case the tensor is on a device or strided
    auto tensorCPU = tensor.to(torch::kCPU).contiguous();
    memcpy(data, tensorCPU.data_ptr<T_Data>(), size*sizeof(T_Data));
}

// Vector
template<typename T_Data>
inline void copyFromTensor(const torch::Tensor& tensor, std::vector<T_Data>& vector)
{
    vector.resize(tensor.numel()); // here we actually have the luxury of setting the vector size
    copyFromTensor(tensor, vector.data(), vector.size());
}


// Utility functions for copying data from data structures in main memory to torch tensors

// Raw buffer
template<typename T_Data>
inline void copyToTensor(const T_Data* data, std::size_t size, torch::Tensor& tensor)
{
    if (!tensor.dtype().Match<T_Data>())
        throw std::runtime_error("Tensor and buffer data types do not match");

    if ((std::size_t)tensor.numel() != size)
        throw std::runtime_error("Unequal number of elements in buffer and tensor");

    const auto device = tensor.device();
    if (device != torch::kCPU || !tensor.is_contiguous()) {
        // reinitialize the tensor in case it's on a device
        tensor = torch::empty(tensor.sizes(), torch::TensorOptions()
            .dtype(ToTorchType<T_Data>::Type)
            .device(torch::kCPU));
        memcpy(tensor.data_ptr<T_Data>(), data, size*sizeof(T_Data));
        // and then move it back to where it belongs
        tensor = tensor.to(device);
    }
    else {
        memcpy(tensor.data_ptr<T_Data>(), data, size*sizeof(T_Data));
    }
}

// Vector
template<typename T_Data>
inline void copyToTensor(const std::vector<T_Data>& vector, torch::Tensor& tensor)
{
    copyToTensor(vector.data(), vector.size(), tensor);
}


// L2-normalize the rows of x (last dimension), dividing by max(norm, eps)
torch::Tensor normalizeRows(const torch::Tensor& x, double eps = 1.0e-12);
