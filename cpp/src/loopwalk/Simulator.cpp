#include "loopwalk/Simulator.hpp"

#include "loopwalk/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace loopwalk {

Simulator::Simulator() : Simulator(Params{}) {}

Simulator::Simulator(const Params& params) : params_(params) {}

SimulationResult Simulator::simulate(const Board& board, const Plan& plan) const {
  return simulate(board, plan, params_.max_steps);
}

SimulationResult Simulator::simulate(const Board& board, const Plan& plan, int max_steps) const {
  board.validate();
  plan.validate();
  if (max_steps <= 0) {
    throw InvalidArgument("max_steps must be positive (got {})", max_steps);
  }
  if (params_.max_rotations <= 0) {
    throw InvalidArgument("max_rotations must be positive (got {})", params_.max_rotations);
  }

  int num_agents = board.num_agents();
  std::vector<AgentState> agents;
  agents.reserve(num_agents);
  Frame frame;
  frame.reserve(num_agents);
  for (const Coord& start : board.agent_starts()) {
    AgentState agent{start};
    arrive(board, agent);
    agents.push_back(agent);
    frame.push_back(start);
  }

  SimulationResult result{Trace{}, kUnsolved, max_steps};
  result.trace.frames.push_back(frame);

  for (int t = 0; t < max_steps; ++t) {
    bool stuck = false;
    for (int a = 0; a < num_agents; ++a) {
      if (step(board, plan, t, agents[a]) == kRotationLimitExceeded) {
        stuck = true;
      }
      frame[a] = agents[a].position;
    }
    result.trace.frames.push_back(frame);

    if (stuck) {
      result.verdict = kStuck;
      result.num_steps = t + 1;
      LOG_DEBUG("Plan {} stuck on a rotator at step {}", plan.to_string(), t);
      return result;
    }
    if (all_on_finish(board, frame)) {
      result.verdict = kSolved;
      result.num_steps = t + 1;
      LOG_DEBUG("Plan {} solved the board in {} steps", plan.to_string(), t + 1);
      return result;
    }
  }

  LOG_DEBUG("Plan {} did not solve the board within {} steps", plan.to_string(), max_steps);
  return result;
}

Simulator::StepOutcome Simulator::step(const Board& board, const Plan& plan, int64_t t,
                                       AgentState& agent) const {
  if (agent.rotation_pending) {
    const Tile& tile = board.at(agent.position);
    DEBUG_ASSERT(tile.kind == kRotator, "rotation pending off a rotator at ({}, {})",
                 agent.position.row, agent.position.col);

    agent.heading = groups::C4::compose(tile.rotation(), agent.heading);
    ++agent.rotation_count;

    Direction next = apply(plan.at_step(t + 1), agent.heading);
    if (!board.is_blocked(agent.position.step(next))) {
      agent.rotation_pending = false;
      agent.rotation_count = 0;
    } else if (agent.rotation_count > params_.max_rotations) {
      return kRotationLimitExceeded;
    }
    return kAdvanced;
  }

  Direction d = apply(plan.at_step(t), agent.heading);
  Coord target = agent.position.step(d);
  if (!board.in_bounds(target)) return kAdvanced;

  switch (board.at(target).kind) {
    case kWall:
      return kAdvanced;
    case kIce:
      agent.position = target;
      slide(board, d, agent);
      break;
    case kEmpty:
    case kRotator:
    case kFinish:
      agent.position = target;
      break;
  }

  arrive(board, agent);
  return kAdvanced;
}

void Simulator::slide(const Board& board, Direction d, AgentState& agent) {
  while (board.at(agent.position).kind == kIce) {
    Coord next = agent.position.step(d);
    if (board.is_blocked(next)) break;
    agent.position = next;
  }
}

void Simulator::arrive(const Board& board, AgentState& agent) {
  switch (board.at(agent.position).kind) {
    case kRotator:
      agent.rotation_pending = true;
      agent.rotation_count = 0;
      break;
    case kEmpty:
    case kWall:
    case kIce:
    case kFinish:
      break;
  }
}

bool Simulator::all_on_finish(const Board& board, const Frame& frame) {
  for (const Coord& c : frame) {
    if (!board.is_finish(c)) return false;
  }
  return true;
}

}  // namespace loopwalk
