#pragma once

#include "common/Config.hpp"

#include <bit>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>

namespace Pancake {
// Big endian accessors for the column page wire format.
struct ByteUtil {
  template <typename T> static T LoadBigEndian(const Byte *src) {
    static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>);
    T value{};
    std::memcpy(&value, src, sizeof(T));
    if constexpr (std::endian::native == std::endian::little &&
                  sizeof(T) > 1) {
      value = ByteSwap(value);
    }
    return value;
  }

  template <typename T> static void AppendBigEndian(std::string &dst, T value) {
    static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>);
    if constexpr (std::endian::native == std::endian::little &&
                  sizeof(T) > 1) {
      value = ByteSwap(value);
    }
    dst.append(reinterpret_cast<const char *>(&value), sizeof(T));
  }

  static int64_t GetInt64(const Byte *src) {
    return std::bit_cast<int64_t>(LoadBigEndian<uint64_t>(src));
  }

  static float GetFloat32(const Byte *src) {
    return std::bit_cast<float>(LoadBigEndian<uint32_t>(src));
  }

  static double GetFloat64(const Byte *src) {
    return std::bit_cast<double>(LoadBigEndian<uint64_t>(src));
  }

private:
  template <typename T> static T ByteSwap(T value) {
    T res{};
    for (size_t i = 0; i < sizeof(T); i++) {
      res = static_cast<T>((res << 8) | (value & 0xFF));
      value = static_cast<T>(value >> 8);
    }
    return res;
  }
};
} // namespace Pancake
