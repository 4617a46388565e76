#pragma once

#include "loopwalk/Board.hpp"
#include "loopwalk/Constants.hpp"
#include "loopwalk/Plan.hpp"
#include "util/FiniteGroups.hpp"

#include <cstdint>
#include <vector>

namespace loopwalk {

enum Verdict : int8_t { kSolved, kUnsolved, kStuck };

// Positions of every agent, indexed like Board::agent_starts().
using Frame = std::vector<Coord>;

/*
 * frames[0] holds the start positions; frames[k] holds the positions recorded after step k-1.
 */
struct Trace {
  const Frame& initial() const { return frames.front(); }
  const Frame& last() const { return frames.back(); }
  int num_steps() const { return frames.size() - 1; }

  std::vector<Frame> frames;
};

struct SimulationResult {
  Trace trace;
  Verdict verdict;
  int num_steps;  // plan steps executed before the verdict was reached
};

/*
 * Executes a cyclic Plan against every agent of a Board, in lockstep, one plan move per step.
 *
 * Per agent, per step t:
 *
 * 1. An agent with a pending rotation (it arrived on, or starts on, a Rotator) does not move. Its
 *    heading turns a quarter (clockwise for Right, counter-clockwise for Left), which turns every
 *    later move it reads from the plan. If its next move, plan[t+1] under the new heading, would
 *    hit a wall or the edge, the rotation stays pending for the next step; once more than
 *    max_rotations consecutive rotations leave it blocked the run is Stuck.
 * 2. Otherwise the agent reads plan[t mod L] under its heading. A move into a wall or off the board
 *    is a no-op, but the step still counts.
 * 3. Entering Ice keeps the agent sliding in the same direction, without consuming plan steps,
 *    until it reaches a non-Ice cell or the next cell is blocked.
 * 4. Ending on a Rotator makes a rotation pending.
 *
 * The board is Solved at the first step after which every agent stands on a Finish tile.
 *
 * simulate() is const and keeps all per-run state on the stack, so runs are independent.
 */
class Simulator {
 public:
  struct Params {
    int max_steps = kDefaultMaxSteps;
    int max_rotations = kDefaultMaxRotations;

    auto make_options_description();
  };

  Simulator();
  explicit Simulator(const Params& params);

  const Params& params() const { return params_; }

  // Throws InvalidBoard / InvalidArgument before any step runs.
  SimulationResult simulate(const Board& board, const Plan& plan, int max_steps) const;
  SimulationResult simulate(const Board& board, const Plan& plan) const;

 private:
  struct AgentState {
    Coord position;
    group::element_t heading = groups::C4::kIdentity;
    bool rotation_pending = false;
    int rotation_count = 0;
  };

  enum StepOutcome : int8_t { kAdvanced, kRotationLimitExceeded };

  // Advances one agent by one step. The caller records the resulting position.
  StepOutcome step(const Board& board, const Plan& plan, int64_t t, AgentState& agent) const;

  // Slides along Ice from agent.position in direction d.
  static void slide(const Board& board, Direction d, AgentState& agent);

  // Sets rotation_pending if the agent stands on a Rotator.
  static void arrive(const Board& board, AgentState& agent);

  static bool all_on_finish(const Board& board, const Frame& frame);

  const Params params_;
};

}  // namespace loopwalk

#include "inline/loopwalk/Simulator.inl"
