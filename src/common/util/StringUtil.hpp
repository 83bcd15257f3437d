#pragma once

#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>

namespace Pancake {
struct StringUtil {
  // table, column and partition names
  static bool ValidName(const std::string &str) {
    static const std::regex pattern("^[a-zA-Z0-9_]+$");
    return std::regex_match(str, pattern);
  }

  static bool IsValidUtf8(const uint8_t *data, size_t size) {
    size_t i = 0;
    while (i < size) {
      uint8_t c = data[i];
      size_t extra;
      uint32_t code_point;
      if (c < 0x80) {
        i++;
        continue;
      } else if ((c & 0xE0) == 0xC0) {
        extra = 1;
        code_point = c & 0x1F;
      } else if ((c & 0xF0) == 0xE0) {
        extra = 2;
        code_point = c & 0x0F;
      } else if ((c & 0xF8) == 0xF0) {
        extra = 3;
        code_point = c & 0x07;
      } else {
        return false;
      }
      if (i + extra >= size) {
        return false;
      }
      for (size_t j = 1; j <= extra; j++) {
        uint8_t cc = data[i + j];
        if ((cc & 0xC0) != 0x80) {
          return false;
        }
        code_point = (code_point << 6) | (cc & 0x3F);
      }
      // overlong forms, surrogates and out of range code points
      if ((extra == 1 && code_point < 0x80) ||
          (extra == 2 && code_point < 0x800) ||
          (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
          (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return false;
      }
      i += extra + 1;
    }
    return true;
  }
};

} // namespace Pancake
