#pragma once

#include "loopwalk/Direction.hpp"
#include "loopwalk/Tile.hpp"

#include <compare>
#include <string>
#include <vector>

namespace loopwalk {

struct Coord {
  auto operator<=>(const Coord& other) const = default;
  Coord step(Direction d) const;

  int row;
  int col;
};

/*
 * A rectangular grid of tiles plus the start coordinates of the agents. Row 0 is the top row
 * (North), column 0 the left column (West). Cells are stored row-major.
 *
 * The constructor stores whatever it is given; validate() checks consistency. Simulator::simulate()
 * validates before running, so a malformed Board surfaces as InvalidBoard there.
 *
 * Text encoding (see loopwalk/Constants.hpp):
 *
 *   ####
 *   #A~.
 *   #.RF
 *
 * '.' Empty, '#' Wall, '~' Ice, 'L'/'R' Rotator(Left/Right), 'F' Finish, 'A' agent on Empty,
 * '*' agent on Finish. Agents are numbered in row-major order.
 */
class Board {
 public:
  using tile_vec_t = std::vector<Tile>;
  using coord_vec_t = std::vector<Coord>;

  Board(int num_rows, int num_cols, tile_vec_t cells, coord_vec_t agent_starts);

  // Parses and validates. Throws InvalidBoard on ragged rows, unknown characters, or any failure
  // of validate().
  static Board from_text(const std::string& text);
  std::string to_text() const;

  int num_rows() const { return num_rows_; }
  int num_cols() const { return num_cols_; }
  int num_agents() const { return agent_starts_.size(); }
  const coord_vec_t& agent_starts() const { return agent_starts_; }
  const tile_vec_t& cells() const { return cells_; }

  bool in_bounds(const Coord& c) const;

  // Precondition: in_bounds(c)
  const Tile& at(const Coord& c) const { return cells_[c.row * num_cols_ + c.col]; }

  // True if c is out of bounds or a Wall.
  bool is_blocked(const Coord& c) const;

  bool is_finish(const Coord& c) const { return in_bounds(c) && at(c).kind == kFinish; }

  // Throws InvalidBoard if the board is structurally inconsistent.
  void validate() const;

 private:
  int num_rows_;
  int num_cols_;
  tile_vec_t cells_;
  coord_vec_t agent_starts_;
};

}  // namespace loopwalk

#include "inline/loopwalk/Board.inl"
