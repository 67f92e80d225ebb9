#include "utils/text.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <locale>

namespace pwv {
namespace utils {

namespace {

bool is_continuation(uint8_t byte) {
  return (byte & 0xC0) == 0x80;
}

bool validate_utf8(const uint8_t* data, size_t length) {
  size_t i = 0;
  while (i < length) {
    uint8_t lead = data[i];

    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint32_t code_point = 0;
    uint32_t min_value = 0;

    if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      code_point = lead & 0x1F;
      min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      code_point = lead & 0x0F;
      min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      code_point = lead & 0x07;
      min_value = 0x10000;
    } else {
      return false;
    }

    // Truncated sequence at end of input
    if (i + extra >= length) {
      return false;
    }

    for (size_t k = 1; k <= extra; ++k) {
      if (!is_continuation(data[i + k])) {
        return false;
      }
      code_point = (code_point << 6) | (data[i + k] & 0x3F);
    }

    // Overlong forms, UTF-16 surrogates and values past the Unicode range
    if (code_point < min_value || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }

    i += extra + 1;
  }
  return true;
}

// Byte length of the White_Space code point starting at data, 0 if there is none.
// Single-byte forms are the ASCII set; the rest are U+0085, U+00A0, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
size_t whitespace_length(const uint8_t* data, size_t available) {
  if (available >= 1 && boost::algorithm::is_space(std::locale::classic())(static_cast<char>(data[0]))) {
    return 1;
  }
  if (available >= 2 && data[0] == 0xC2 && (data[1] == 0x85 || data[1] == 0xA0)) {
    return 2;
  }
  if (available < 3) {
    return 0;
  }
  uint8_t b0 = data[0], b1 = data[1], b2 = data[2];
  if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) {
    return 3;
  }
  if (b0 == 0xE2 && b1 == 0x80 &&
      ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
    return 3;
  }
  if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) {
    return 3;
  }
  if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) {
    return 3;
  }
  return 0;
}

} // namespace

std::string trim(const std::string& s) {
  const auto* data = reinterpret_cast<const uint8_t*>(s.data());
  size_t begin = 0;
  size_t end = s.size();

  while (begin < end) {
    size_t n = whitespace_length(data + begin, end - begin);
    if (n == 0) {
      break;
    }
    begin += n;
  }

  while (end > begin) {
    size_t n = 0;
    for (size_t width = 1; width <= 3 && width <= end - begin; ++width) {
      if (whitespace_length(data + end - width, width) == width) {
        n = width;
        break;
      }
    }
    if (n == 0) {
      break;
    }
    end -= n;
  }

  return s.substr(begin, end - begin);
}

bool is_valid_utf8(const std::string& s) {
  return validate_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
  return validate_utf8(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace pwv
