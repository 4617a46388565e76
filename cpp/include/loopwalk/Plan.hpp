#pragma once

#include "loopwalk/Direction.hpp"
#include "util/FiniteGroups.hpp"

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace loopwalk {

/*
 * A Plan is a finite sequence of moves that is executed cyclically: the move for global step t is
 * plan[t mod length()].
 *
 * Plans are totally ordered: shorter plans come first, and plans of equal length are compared
 * lexicographically using the Direction order (North < East < South < West). The canonical
 * representative of a symmetry orbit is the minimum under this order.
 *
 * An empty Plan can be constructed, but every operation that consumes a plan (canonicalization,
 * simulation) rejects it with InvalidArgument.
 */
class Plan {
 public:
  using move_vec_t = std::vector<Direction>;

  Plan() = default;
  explicit Plan(move_vec_t moves) : moves_(std::move(moves)) {}
  Plan(std::initializer_list<Direction> moves) : moves_(moves) {}

  // "NESW" -> {kNorth, kEast, kSouth, kWest}. Throws InvalidArgument on an empty string or an
  // unknown character.
  static Plan from_string(const std::string& str);
  std::string to_string() const;

  int length() const { return moves_.size(); }
  bool empty() const { return moves_.empty(); }
  const move_vec_t& moves() const { return moves_; }
  Direction operator[](int index) const { return moves_[index]; }

  // The move executed at the given global step, i.e. moves()[step mod length()].
  Direction at_step(int64_t step) const { return moves_[step % moves_.size()]; }

  // Applies a D4 element to every move.
  Plan transformed(group::element_t sym) const;

  // The plan that starts offset moves later: shifted(1) of NES is ESN.
  Plan shifted(int offset) const;

  // True if the plan is a repetition of its length-period prefix. period must divide length().
  bool has_period(int period) const;

  // Length of the shortest prefix whose repetition reconstructs the plan.
  int primitive_period() const;
  bool is_reducible() const { return primitive_period() < length(); }
  Plan primitive() const;

  // Throws InvalidArgument if the plan is empty.
  void validate() const;

  std::strong_ordering operator<=>(const Plan& other) const;
  bool operator==(const Plan& other) const = default;

 private:
  move_vec_t moves_;
};

using PlanSet = std::set<Plan>;

}  // namespace loopwalk

#include "inline/loopwalk/Plan.inl"
