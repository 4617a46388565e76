#pragma once

#include "loopwalk/Direction.hpp"
#include "loopwalk/Plan.hpp"
#include "util/FiniteGroups.hpp"

#include <vector>

namespace loopwalk {

/*
 * The Canonicalizer maps every plan to the canonical representative of its orbit under:
 *
 * - the 8 elements of D4 acting on every move (4 rotations x 2 reflection choices),
 * - the L cyclic shifts of the start position (if Params::phase_shift), and
 * - reduction of a repeated cycle to its primitive period (if Params::cycle_reduction).
 *
 * The group is small, so it applies every element, compares the images, and keeps the minimum.
 * Plan's operator<=> (shorter first, then lexicographic) makes the minimum unique.
 *
 * All methods are const and touch no shared state, so a single Canonicalizer can be used from
 * several threads at once.
 */
class Canonicalizer {
 public:
  struct Params {
    bool phase_shift = true;
    bool cycle_reduction = true;
    int num_threads = 1;

    auto make_options_description();
  };

  Canonicalizer();
  explicit Canonicalizer(const Params& params);

  const Params& params() const { return params_; }

  Plan canonicalize(const Plan& plan) const;

  // Equivalent to canonicalize(plan) == plan, but compares the images in place instead of
  // materializing them.
  bool is_canonical(const Plan& plan) const;

  // Every image of the (reduced, if cycle_reduction) plan, in (group element, shift) order.
  // Duplicates are kept: the result always has 8 * L entries, or 8 without phase shifts.
  std::vector<Plan> orbit(const Plan& plan) const;

  // Every plan of exactly the given length that is its own canonical representative. Iterates
  // all 4^length plans, so callers must keep length small.
  PlanSet enumerate_canonical(int length) const;

 private:
  int num_shifts(const Plan& plan) const { return params_.phase_shift ? plan.length() : 1; }

  // True if the image of plan under (sym, shift) compares less than plan.
  static bool image_less(const Plan& plan, group::element_t sym, int shift);

  // Appends to out every canonical plan of the given length whose first moves match one of the
  // prefixes with index congruent to shard mod num_shards.
  void enumerate_shard(int length, int shard, int num_shards, std::vector<Plan>& out) const;

  const Params params_;
};

}  // namespace loopwalk

#include "inline/loopwalk/Canonicalizer.inl"
