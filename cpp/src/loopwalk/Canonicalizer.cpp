#include "loopwalk/Canonicalizer.hpp"

#include "loopwalk/Constants.hpp"
#include "loopwalk/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <thread>

namespace loopwalk {

namespace {

void join_all(std::vector<std::thread>& threads) {
  for (auto& thread : threads) {
    if (thread.joinable()) thread.join();
  }
}

}  // namespace

Canonicalizer::Canonicalizer() : Canonicalizer(Params{}) {}

Canonicalizer::Canonicalizer(const Params& params) : params_(params) {}

Plan Canonicalizer::canonicalize(const Plan& plan) const {
  plan.validate();

  Plan base = params_.cycle_reduction ? plan.primitive() : plan;
  Plan best = base;

  int n = num_shifts(base);
  for (group::element_t sym = 0; sym < DirectionGroup::kOrder; ++sym) {
    Plan transformed = base.transformed(sym);
    for (int shift = 0; shift < n; ++shift) {
      Plan candidate = transformed.shifted(shift);
      if (candidate < best) {
        best = std::move(candidate);
      }
    }
  }

  LOG_TRACE("canonicalize({}) = {}", plan.to_string(), best.to_string());
  return best;
}

bool Canonicalizer::is_canonical(const Plan& plan) const {
  plan.validate();

  if (params_.cycle_reduction && plan.is_reducible()) return false;

  int n = num_shifts(plan);
  for (group::element_t sym = 0; sym < DirectionGroup::kOrder; ++sym) {
    for (int shift = 0; shift < n; ++shift) {
      if (image_less(plan, sym, shift)) return false;
    }
  }
  return true;
}

std::vector<Plan> Canonicalizer::orbit(const Plan& plan) const {
  plan.validate();

  Plan base = params_.cycle_reduction ? plan.primitive() : plan;
  int n = num_shifts(base);

  std::vector<Plan> images;
  images.reserve(DirectionGroup::kOrder * n);
  for (group::element_t sym = 0; sym < DirectionGroup::kOrder; ++sym) {
    Plan transformed = base.transformed(sym);
    for (int shift = 0; shift < n; ++shift) {
      images.push_back(transformed.shifted(shift));
    }
  }
  return images;
}

PlanSet Canonicalizer::enumerate_canonical(int length) const {
  if (length <= 0) {
    throw InvalidArgument("Plan length must be positive (got {})", length);
  }
  if (params_.num_threads <= 0) {
    throw InvalidArgument("Thread count must be positive (got {})", params_.num_threads);
  }

  int prefix_length = std::min(length, kShardPrefixLength);
  int num_prefixes = util::int_pow(kNumDirections, prefix_length);
  int num_shards = std::min(params_.num_threads, num_prefixes);

  std::vector<std::vector<Plan>> shard_results(num_shards);
  if (num_shards == 1) {
    enumerate_shard(length, 0, 1, shard_results[0]);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(num_shards);
    try {
      for (int shard = 0; shard < num_shards; ++shard) {
        threads.emplace_back([this, length, shard, num_shards, &shard_results]() {
          enumerate_shard(length, shard, num_shards, shard_results[shard]);
        });
      }
    } catch (const std::system_error& e) {
      // The shards already running write into shard_results, so they must finish first.
      LOG_ERROR("Failed to start enumeration thread {} of {}: {}", threads.size(), num_shards,
                e.what());
      join_all(threads);
      throw;
    }
    join_all(threads);
  }

  PlanSet plans;
  for (auto& shard_plans : shard_results) {
    plans.insert(std::make_move_iterator(shard_plans.begin()),
                 std::make_move_iterator(shard_plans.end()));
  }

  LOG_DEBUG("Enumerated {} canonical plans of length {} using {} shard(s)", plans.size(), length,
            num_shards);
  return plans;
}

bool Canonicalizer::image_less(const Plan& plan, group::element_t sym, int shift) {
  int n = plan.length();
  for (int i = 0; i < n; ++i) {
    Direction a = apply(plan[(i + shift) % n], sym);
    Direction b = plan[i];
    if (a != b) return a < b;
  }
  return false;
}

void Canonicalizer::enumerate_shard(int length, int shard, int num_shards,
                                    std::vector<Plan>& out) const {
  int prefix_length = std::min(length, kShardPrefixLength);
  int num_prefixes = util::int_pow(kNumDirections, prefix_length);
  RELEASE_ASSERT(shard < num_shards && num_shards <= num_prefixes, "bad shard {}/{} (prefixes={})",
                 shard, num_shards, num_prefixes);

  Plan::move_vec_t moves(length, kNorth);
  for (int prefix = shard; prefix < num_prefixes; prefix += num_shards) {
    int code = prefix;
    for (int i = prefix_length - 1; i >= 0; --i) {
      moves[i] = Direction(code % kNumDirections);
      code /= kNumDirections;
    }
    std::fill(moves.begin() + prefix_length, moves.end(), kNorth);

    // Odometer over the moves after the prefix
    while (true) {
      Plan plan(moves);
      if (is_canonical(plan)) {
        out.push_back(std::move(plan));
      }

      int i = length - 1;
      while (i >= prefix_length && moves[i] == kWest) {
        moves[i] = kNorth;
        --i;
      }
      if (i < prefix_length) break;
      moves[i] = Direction(moves[i] + 1);
    }
  }
}

}  // namespace loopwalk
