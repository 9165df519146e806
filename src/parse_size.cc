#include "dupidx/parse_size.hh"

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace dupidx {

inline namespace detail_v1_0_0 {

namespace {

constexpr std::array<char, 8> unit_dict{'K', 'M', 'G', 'T', 'P', 'E', 'Z', 'Y'};

constexpr bool is_num(const char c) noexcept { return c >= '0' && c <= '9'; }

// multiply with overflow check
uint64_t mul_checked(const uint64_t lhs, const uint64_t rhs,
                     std::string_view size_str) {
  if (rhs != 0 && lhs > std::numeric_limits<uint64_t>::max() / rhs) {
    throw std::out_of_range("size out of range: " + std::string(size_str));
  }
  return lhs * rhs;
}

[[noreturn]] void invalid(std::string_view size_str) {
  throw std::invalid_argument("invalid size string: " + std::string(size_str));
}

}  // namespace

uint64_t parse_size(std::string_view size_str) {
  const auto size_len = size_str.size();
  std::size_t i = 0;

  // number part
  uint64_t size_num = 0;
  for (; i < size_len && is_num(size_str[i]); ++i) {
    size_num = mul_checked(size_num, 10, size_str);
    const auto digit = (uint64_t)(size_str[i] - '0');
    if (size_num > std::numeric_limits<uint64_t>::max() - digit) {
      throw std::out_of_range("size out of range: " + std::string(size_str));
    }
    size_num += digit;
  }
  if (i == 0) {
    invalid(size_str);
  }

  // unit part, [KMGTPEZY][i][B|b]
  std::size_t scale = 0;
  bool as_bibyte = false;
  bool as_bit = false;
  if (i < size_len) {
    for (std::size_t j = 0; j < unit_dict.size(); ++j) {
      if (size_str[i] == unit_dict[j] || size_str[i] == unit_dict[j] + 32) {
        scale = j + 1;
        ++i;
        break;
      }
    }
  }
  if (scale != 0 && i < size_len && size_str[i] == 'i') {
    as_bibyte = true;
    ++i;
  }
  if (i < size_len) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      invalid(size_str);
    }
    ++i;
  }
  if (i != size_len) {
    invalid(size_str);
  }

  const uint64_t base = as_bibyte ? 1024 : 1000;
  for (std::size_t s = 0; s < scale; ++s) {
    size_num = mul_checked(size_num, base, size_str);
  }
  return as_bit ? size_num / 8 : size_num;
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
