#include "util/CppUtil.hpp"

namespace util {

constexpr uint64_t int_pow(uint64_t base, int exponent) {
  uint64_t result = 1;
  for (int i = 0; i < exponent; ++i) {
    result *= base;
  }
  return result;
}

}  // namespace util
