#include "loopwalk/Board.hpp"

namespace loopwalk {

inline Coord Coord::step(Direction d) const {
  Offset o = offset(d);
  return Coord{row + o.d_row, col + o.d_col};
}

inline bool Board::in_bounds(const Coord& c) const {
  return c.row >= 0 && c.row < num_rows_ && c.col >= 0 && c.col < num_cols_;
}

inline bool Board::is_blocked(const Coord& c) const {
  return !in_bounds(c) || at(c).kind == kWall;
}

}  // namespace loopwalk
