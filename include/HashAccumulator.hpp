#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "CatalogConfig.hpp"

// Streaming digest. Feed chunks with Update, then call FinalizeHex once.
class HashAccumulator
{
public:
    virtual ~HashAccumulator() = default;

    virtual void Update(const uint8_t* Data, size_t Length) = 0;
    virtual std::string FinalizeHex() = 0;

    static std::unique_ptr<HashAccumulator> Create(HashAlgorithm Algorithm);
};

std::string ToHex(const uint8_t* Data, size_t Length);
