#include "loopwalk/Plan.hpp"

#include "loopwalk/Exceptions.hpp"

namespace loopwalk {

Plan Plan::from_string(const std::string& str) {
  if (str.empty()) {
    throw InvalidArgument("Plan string must contain at least one move");
  }
  move_vec_t moves;
  moves.reserve(str.size());
  for (char c : str) {
    moves.push_back(direction_from_char(c));
  }
  return Plan(std::move(moves));
}

std::string Plan::to_string() const {
  std::string str;
  str.reserve(moves_.size());
  for (Direction d : moves_) {
    str.push_back(to_char(d));
  }
  return str;
}

Plan Plan::transformed(group::element_t sym) const {
  move_vec_t moves;
  moves.reserve(moves_.size());
  for (Direction d : moves_) {
    moves.push_back(apply(d, sym));
  }
  return Plan(std::move(moves));
}

Plan Plan::shifted(int offset) const {
  int n = length();
  if (n == 0) return *this;
  int start = ((offset % n) + n) % n;
  move_vec_t moves;
  moves.reserve(n);
  for (int i = 0; i < n; ++i) {
    moves.push_back(moves_[(i + start) % n]);
  }
  return Plan(std::move(moves));
}

Plan Plan::primitive() const {
  int period = primitive_period();
  return Plan(move_vec_t(moves_.begin(), moves_.begin() + period));
}

void Plan::validate() const {
  if (moves_.empty()) {
    throw InvalidArgument("Plan must contain at least one move");
  }
}

}  // namespace loopwalk
