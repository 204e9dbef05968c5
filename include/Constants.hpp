#pragma once

#include <cstdint>


namespace protobank
{
constexpr int64_t embeddingLength = 512;
constexpr int64_t defaultNumClasses = 64;
constexpr int64_t defaultImageSize = 84;

}
