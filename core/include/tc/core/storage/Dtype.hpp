#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tc
{

enum class Dtype { UInt8, UInt16, Float32, Unknown };

std::string dtypeToString(Dtype dtype);
Dtype dtypeFromString(const std::string& s);
std::size_t dtypeSize(Dtype dtype);

// Opaque reference to an allocation made by a StorageBackend; 0 means none
using StorageHandle = std::uint64_t;
inline constexpr StorageHandle kNoStorage = 0;

}  // namespace tc
