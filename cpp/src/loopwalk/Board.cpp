#include "loopwalk/Board.hpp"

#include "loopwalk/Constants.hpp"
#include "loopwalk/Exceptions.hpp"
#include "util/StringUtil.hpp"

#include <utility>

namespace loopwalk {

Board::Board(int num_rows, int num_cols, tile_vec_t cells, coord_vec_t agent_starts)
    : num_rows_(num_rows),
      num_cols_(num_cols),
      cells_(std::move(cells)),
      agent_starts_(std::move(agent_starts)) {}

Board Board::from_text(const std::string& text) {
  std::vector<std::string> rows;
  for (const std::string& line : util::splitlines(text)) {
    rows.push_back(util::rstrip(line));
  }
  while (!rows.empty() && rows.back().empty()) rows.pop_back();
  size_t first = 0;
  while (first < rows.size() && rows[first].empty()) ++first;
  rows.erase(rows.begin(), rows.begin() + first);

  if (rows.empty()) {
    throw InvalidBoard("Board text contains no rows");
  }

  int num_rows = rows.size();
  int num_cols = rows[0].size();
  tile_vec_t cells;
  coord_vec_t agent_starts;
  cells.reserve(num_rows * num_cols);

  for (int r = 0; r < num_rows; ++r) {
    const std::string& row = rows[r];
    if (int(row.size()) != num_cols) {
      throw InvalidBoard("Row {} has {} cells, expected {}", r, row.size(), num_cols);
    }
    for (int c = 0; c < num_cols; ++c) {
      switch (row[c]) {
        case kEmptyChar:
          cells.push_back(Tile::empty());
          break;
        case kWallChar:
          cells.push_back(Tile::wall());
          break;
        case kIceChar:
          cells.push_back(Tile::ice());
          break;
        case kRotatorLeftChar:
          cells.push_back(Tile::rotator(kTurnLeft));
          break;
        case kRotatorRightChar:
          cells.push_back(Tile::rotator(kTurnRight));
          break;
        case kFinishChar:
          cells.push_back(Tile::finish());
          break;
        case kAgentOnEmptyChar:
          cells.push_back(Tile::empty());
          agent_starts.push_back(Coord{r, c});
          break;
        case kAgentOnFinishChar:
          cells.push_back(Tile::finish());
          agent_starts.push_back(Coord{r, c});
          break;
        default:
          throw InvalidBoard("Unknown tile character '{}' at ({}, {})", row[c], r, c);
      }
    }
  }

  Board board(num_rows, num_cols, std::move(cells), std::move(agent_starts));
  board.validate();
  return board;
}

std::string Board::to_text() const {
  validate();

  std::vector<std::string> rows(num_rows_);
  for (int r = 0; r < num_rows_; ++r) {
    for (int c = 0; c < num_cols_; ++c) {
      rows[r].push_back(at(Coord{r, c}).to_char());
    }
  }

  for (int a = 0; a < num_agents(); ++a) {
    const Coord& start = agent_starts_[a];
    char& cell = rows[start.row][start.col];
    switch (at(start).kind) {
      case kEmpty:
        cell = kAgentOnEmptyChar;
        break;
      case kFinish:
        cell = kAgentOnFinishChar;
        break;
      case kWall:
      case kIce:
      case kRotator:
        throw InvalidBoard("Agent {} starts on a '{}' tile, which the text encoding cannot express",
                           a, cell);
    }
  }

  std::string text;
  for (const std::string& row : rows) {
    text += row;
    text += '\n';
  }
  return text;
}

void Board::validate() const {
  if (num_rows_ <= 0 || num_cols_ <= 0) {
    throw InvalidBoard("Board dimensions must be positive (got {}x{})", num_rows_, num_cols_);
  }
  size_t expected_cells = size_t(num_rows_) * size_t(num_cols_);
  if (cells_.size() != expected_cells) {
    throw InvalidBoard("Board has {} cells, expected {}x{}={}", cells_.size(), num_rows_,
                       num_cols_, expected_cells);
  }
  for (size_t i = 0; i < cells_.size(); ++i) {
    if (!cells_[i].is_defined()) {
      throw InvalidBoard("Cell ({}, {}) holds an undefined tile (kind={})", i / num_cols_,
                         i % num_cols_, int(cells_[i].kind));
    }
  }

  if (agent_starts_.empty()) {
    throw InvalidBoard("Board has no agents");
  }
  for (int a = 0; a < num_agents(); ++a) {
    const Coord& start = agent_starts_[a];
    if (!in_bounds(start)) {
      throw InvalidBoard("Agent {} starts at ({}, {}), outside the {}x{} grid", a, start.row,
                         start.col, num_rows_, num_cols_);
    }
    if (at(start).kind == kWall) {
      throw InvalidBoard("Agent {} starts on a wall at ({}, {})", a, start.row, start.col);
    }
  }
}

}  // namespace loopwalk
