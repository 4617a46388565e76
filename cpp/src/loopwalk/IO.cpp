#include "loopwalk/IO.hpp"

#include <fmt/format.h>

#include <vector>

namespace loopwalk {

void IO::print_frame(std::ostream& ss, const Board& board, const Frame& frame) {
  std::vector<std::string> rows(board.num_rows());
  for (int r = 0; r < board.num_rows(); ++r) {
    for (int c = 0; c < board.num_cols(); ++c) {
      rows[r].push_back(board.at(Coord{r, c}).to_char());
    }
  }

  for (int a = 0; a < int(frame.size()); ++a) {
    const Coord& pos = frame[a];
    if (!board.in_bounds(pos)) continue;
    rows[pos.row][pos.col] = a < 10 ? char('0' + a) : '@';
  }

  for (const std::string& row : rows) {
    ss << row << '\n';
  }
  ss.flush();
}

std::string IO::trace_to_str(const Trace& trace) {
  std::string str;
  for (int k = 0; k < int(trace.frames.size()); ++k) {
    str += fmt::format("step {}:", k);
    for (const Coord& pos : trace.frames[k]) {
      str += fmt::format(" ({}, {})", pos.row, pos.col);
    }
    str += '\n';
  }
  return str;
}

}  // namespace loopwalk
