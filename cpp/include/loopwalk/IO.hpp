#pragma once

#include "loopwalk/Board.hpp"
#include "loopwalk/Simulator.hpp"
#include "loopwalk/Tile.hpp"

#include <ostream>
#include <string>

namespace loopwalk {

/*
 * Human-readable rendering of simulation state, used by the loopwalk tool and in log lines.
 */
struct IO {
  // "Solved", "Unsolved", "Stuck"
  static std::string verdict_to_str(Verdict verdict);

  // "Empty", "Wall", "Ice", "Rotator", "Finish"
  static std::string tile_kind_to_str(TileKind kind);

  // Prints the board with every agent of frame drawn over its tile. Agents 0-9 are drawn as their
  // index, later agents as '@'.
  static void print_frame(std::ostream& ss, const Board& board, const Frame& frame);

  // One line per frame: "step k: (r0, c0) (r1, c1) ..."
  static std::string trace_to_str(const Trace& trace);

 private:
  template <typename E>
  static std::string enum_to_str(E value);
};

}  // namespace loopwalk

#include "inline/loopwalk/IO.inl"
