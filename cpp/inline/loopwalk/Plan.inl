#include "loopwalk/Plan.hpp"

namespace loopwalk {

inline bool Plan::has_period(int period) const {
  int n = length();
  for (int i = period; i < n; ++i) {
    if (moves_[i] != moves_[i - period]) return false;
  }
  return true;
}

inline int Plan::primitive_period() const {
  // The smallest period dividing the length is automatically primitive: a shorter period of that
  // prefix would also divide the length, and would have been found first.
  int n = length();
  for (int d = 1; d < n; ++d) {
    if (n % d == 0 && has_period(d)) return d;
  }
  return n;
}

inline std::strong_ordering Plan::operator<=>(const Plan& other) const {
  if (auto cmp = moves_.size() <=> other.moves_.size(); cmp != 0) return cmp;
  return moves_ <=> other.moves_;
}

}  // namespace loopwalk
