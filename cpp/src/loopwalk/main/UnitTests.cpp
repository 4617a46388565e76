#include "loopwalk/Board.hpp"
#include "loopwalk/Canonicalizer.hpp"
#include "loopwalk/Direction.hpp"
#include "loopwalk/Exceptions.hpp"
#include "loopwalk/IO.hpp"
#include "loopwalk/Plan.hpp"
#include "loopwalk/Simulator.hpp"
#include "loopwalk/Tile.hpp"
#include "util/FiniteGroups.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace loopwalk;

namespace {

Plan P(const char* str) { return Plan::from_string(str); }

std::vector<std::string> to_strings(const PlanSet& plans) {
  std::vector<std::string> strs;
  for (const Plan& plan : plans) {
    strs.push_back(plan.to_string());
  }
  return strs;
}

Canonicalizer make_canonicalizer(bool phase_shift, bool cycle_reduction, int num_threads = 1) {
  Canonicalizer::Params params;
  params.phase_shift = phase_shift;
  params.cycle_reduction = cycle_reduction;
  params.num_threads = num_threads;
  return Canonicalizer(params);
}

// 3x3 box of walls with the given center tile, and one agent starting on the center.
Board make_walled_cell(Tile center) {
  Board::tile_vec_t cells(9, Tile::wall());
  cells[4] = center;
  return Board(3, 3, cells, {Coord{1, 1}});
}

}  // namespace

TEST(Direction, group_action) {
  using G = DirectionGroup;
  for (int d = 0; d < kNumDirections; ++d) {
    Direction dir = Direction(d);
    EXPECT_EQ(apply(dir, G::kIdentity), dir);
    for (group::element_t x = 0; x < G::kOrder; ++x) {
      EXPECT_EQ(apply(apply(dir, x), G::inverse(x)), dir);
      for (group::element_t y = 0; y < G::kOrder; ++y) {
        EXPECT_EQ(apply(apply(dir, y), x), apply(dir, G::compose(x, y)))
          << "d=" << d << " x=" << x << " y=" << y;
      }
    }
  }

  EXPECT_EQ(apply(kNorth, G::kRot90), kEast);
  EXPECT_EQ(apply(kNorth, G::kFlipVertical), kSouth);
  EXPECT_EQ(apply(kEast, G::kFlipVertical), kEast);
  EXPECT_EQ(apply(kEast, G::kMirrorHorizontal), kWest);
  EXPECT_EQ(apply(kNorth, G::kMirrorHorizontal), kNorth);
}

TEST(Direction, rotate_and_offset) {
  EXPECT_EQ(rotate(kNorth, 1), kEast);
  EXPECT_EQ(rotate(kNorth, -1), kWest);
  EXPECT_EQ(rotate(kWest, 6), kEast);

  EXPECT_EQ(offset(kNorth).d_row, -1);
  EXPECT_EQ(offset(kEast).d_col, 1);
  EXPECT_EQ(offset(kSouth).d_row, 1);
  EXPECT_EQ(offset(kWest).d_col, -1);

  EXPECT_EQ(direction_from_char('S'), kSouth);
  EXPECT_EQ(to_char(kWest), 'W');
  EXPECT_THROW(direction_from_char('x'), InvalidArgument);
}

TEST(Plan, parse) {
  Plan plan = P("NESW");
  EXPECT_EQ(plan.length(), 4);
  EXPECT_EQ(plan[1], kEast);
  EXPECT_EQ(plan.to_string(), "NESW");
  EXPECT_EQ(plan, (Plan{kNorth, kEast, kSouth, kWest}));

  EXPECT_THROW(P(""), InvalidArgument);
  EXPECT_THROW(P("NEX"), InvalidArgument);
  EXPECT_THROW(P("ne"), InvalidArgument);
  EXPECT_THROW(Plan().validate(), InvalidArgument);
}

TEST(Plan, at_step) {
  Plan plan = P("NES");
  EXPECT_EQ(plan.at_step(0), kNorth);
  EXPECT_EQ(plan.at_step(4), kEast);
  EXPECT_EQ(plan.at_step(3000000002), kSouth);
}

TEST(Plan, shift_and_transform) {
  EXPECT_EQ(P("NES").shifted(1), P("ESN"));
  EXPECT_EQ(P("NES").shifted(3), P("NES"));
  EXPECT_EQ(P("NES").shifted(-1), P("SNE"));
  EXPECT_EQ(P("NES").transformed(DirectionGroup::kRot90), P("ESW"));
  EXPECT_EQ(P("NES").transformed(DirectionGroup::kMirrorHorizontal), P("NWS"));
}

TEST(Plan, periods) {
  EXPECT_EQ(P("NENE").primitive_period(), 2);
  EXPECT_EQ(P("NNN").primitive_period(), 1);
  EXPECT_EQ(P("NES").primitive_period(), 3);
  EXPECT_EQ(P("NENENE").primitive(), P("NE"));
  EXPECT_TRUE(P("SS").is_reducible());
  EXPECT_FALSE(P("NNE").is_reducible());
  EXPECT_TRUE(P("NENE").has_period(2));
  EXPECT_FALSE(P("NENS").has_period(2));
}

TEST(Plan, ordering) {
  EXPECT_LT(P("W"), P("NN"));
  EXPECT_LT(P("NE"), P("NS"));
  EXPECT_LT(P("NS"), P("EN"));
}

TEST(Canonicalizer, known_representatives) {
  Canonicalizer canonicalizer;
  EXPECT_EQ(canonicalizer.canonicalize(P("S")), P("N"));
  EXPECT_EQ(canonicalizer.canonicalize(P("WE")), P("NS"));
  EXPECT_EQ(canonicalizer.canonicalize(P("EN")), P("NE"));
  EXPECT_EQ(canonicalizer.canonicalize(P("SSWW")), P("NNEE"));
  EXPECT_EQ(canonicalizer.canonicalize(P("ENWS")), P("NESW"));
  EXPECT_EQ(canonicalizer.canonicalize(P("ESWN")), P("NESW"));
}

TEST(Canonicalizer, orbit_closure) {
  Canonicalizer canonicalizer;
  for (const char* str : {"NNES", "NEEWS", "SWWNE", "NSEW", "EEEN"}) {
    Plan plan = P(str);
    Plan canonical = canonicalizer.canonicalize(plan);
    for (group::element_t sym = 0; sym < DirectionGroup::kOrder; ++sym) {
      for (int shift = 0; shift < plan.length(); ++shift) {
        Plan image = plan.transformed(sym).shifted(shift);
        EXPECT_EQ(canonicalizer.canonicalize(image), canonical)
          << str << " sym=" << sym << " shift=" << shift;
      }
    }
    for (const Plan& image : canonicalizer.orbit(plan)) {
      EXPECT_LE(canonical, image);
      EXPECT_EQ(canonicalizer.canonicalize(image), canonical);
    }
  }
}

TEST(Canonicalizer, idempotence) {
  Canonicalizer canonicalizer;
  for (const char* str : {"W", "SE", "WWSE", "NENE", "SWNEE", "ESESES"}) {
    Plan canonical = canonicalizer.canonicalize(P(str));
    EXPECT_EQ(canonicalizer.canonicalize(canonical), canonical) << str;
    EXPECT_TRUE(canonicalizer.is_canonical(canonical)) << str;
  }
}

TEST(Canonicalizer, cycle_reduction) {
  Canonicalizer canonicalizer;
  EXPECT_EQ(canonicalizer.canonicalize(P("NN")), canonicalizer.canonicalize(P("N")));
  EXPECT_EQ(canonicalizer.canonicalize(P("WWW")), P("N"));
  EXPECT_EQ(canonicalizer.canonicalize(P("NENE")), P("NE"));
  EXPECT_FALSE(canonicalizer.is_canonical(P("NN")));

  Canonicalizer no_reduction = make_canonicalizer(true, false);
  EXPECT_EQ(no_reduction.canonicalize(P("SS")), P("NN"));
  EXPECT_TRUE(no_reduction.is_canonical(P("NN")));
}

TEST(Canonicalizer, phase_shift) {
  Canonicalizer no_shift = make_canonicalizer(false, true);
  EXPECT_EQ(no_shift.canonicalize(P("EN")), P("NE"));
  EXPECT_EQ(no_shift.canonicalize(P("NEN")), P("NEN"));
  EXPECT_EQ(no_shift.canonicalize(P("ENN")), P("NEE"));
  EXPECT_NE(no_shift.canonicalize(P("NNE")), no_shift.canonicalize(P("NEN")));

  Canonicalizer canonicalizer;
  EXPECT_EQ(canonicalizer.canonicalize(P("NNE")), canonicalizer.canonicalize(P("NEN")));
}

TEST(Canonicalizer, is_canonical_matches_canonicalize) {
  for (bool phase_shift : {true, false}) {
    for (bool cycle_reduction : {true, false}) {
      Canonicalizer canonicalizer = make_canonicalizer(phase_shift, cycle_reduction);
      for (int code = 0; code < 256; ++code) {
        Plan::move_vec_t moves;
        for (int i = 0, c = code; i < 4; ++i, c /= 4) {
          moves.push_back(Direction(c % 4));
        }
        Plan plan(moves);
        EXPECT_EQ(canonicalizer.is_canonical(plan), canonicalizer.canonicalize(plan) == plan)
          << plan.to_string() << " phase_shift=" << phase_shift
          << " cycle_reduction=" << cycle_reduction;
      }
    }
  }
}

TEST(Canonicalizer, orbit) {
  Canonicalizer canonicalizer;
  EXPECT_EQ(canonicalizer.orbit(P("NES")).size(), 24u);
  EXPECT_EQ(canonicalizer.orbit(P("NENE")).size(), 16u);

  Canonicalizer no_shift = make_canonicalizer(false, true);
  EXPECT_EQ(no_shift.orbit(P("NES")).size(), 8u);

  std::vector<Plan> images = canonicalizer.orbit(P("N"));
  PlanSet distinct(images.begin(), images.end());
  EXPECT_EQ(to_strings(distinct), (std::vector<std::string>{"N", "E", "S", "W"}));
}

TEST(Canonicalizer, enumerate_small) {
  Canonicalizer canonicalizer;
  EXPECT_EQ(to_strings(canonicalizer.enumerate_canonical(1)), (std::vector<std::string>{"N"}));
  EXPECT_EQ(to_strings(canonicalizer.enumerate_canonical(2)),
            (std::vector<std::string>{"NE", "NS"}));
  EXPECT_EQ(to_strings(canonicalizer.enumerate_canonical(3)),
            (std::vector<std::string>{"NNE", "NNS", "NES"}));
}

TEST(Canonicalizer, enumerate_counts) {
  Canonicalizer canonicalizer;
  std::vector<int> expected = {1, 2, 3, 11, 27, 92};
  for (int length = 1; length <= int(expected.size()); ++length) {
    EXPECT_EQ(int(canonicalizer.enumerate_canonical(length).size()), expected[length - 1])
      << "length=" << length;
  }
}

TEST(Canonicalizer, enumerate_counts_variants) {
  struct Case {
    bool phase_shift;
    bool cycle_reduction;
    std::vector<int> counts;
  };
  std::vector<Case> cases = {
    {false, true, {1, 2, 9, 33, 135}},
    {true, false, {1, 3, 4, 14, 28}},
    {false, false, {1, 3, 10, 36, 136}},
  };

  for (const Case& c : cases) {
    Canonicalizer canonicalizer = make_canonicalizer(c.phase_shift, c.cycle_reduction);
    for (int length = 1; length <= int(c.counts.size()); ++length) {
      EXPECT_EQ(int(canonicalizer.enumerate_canonical(length).size()), c.counts[length - 1])
        << "length=" << length << " phase_shift=" << c.phase_shift
        << " cycle_reduction=" << c.cycle_reduction;
    }
  }
}

TEST(Canonicalizer, enumerate_threaded) {
  PlanSet expected = Canonicalizer().enumerate_canonical(6);
  for (int num_threads : {2, 5, 64, 100}) {
    Canonicalizer canonicalizer = make_canonicalizer(true, true, num_threads);
    EXPECT_EQ(canonicalizer.enumerate_canonical(6), expected) << "num_threads=" << num_threads;
  }
  EXPECT_EQ(make_canonicalizer(true, true, 100).enumerate_canonical(2).size(), 2u);
}

TEST(Canonicalizer, errors) {
  Canonicalizer canonicalizer;
  EXPECT_THROW(canonicalizer.canonicalize(Plan()), InvalidArgument);
  EXPECT_THROW(canonicalizer.is_canonical(Plan()), InvalidArgument);
  EXPECT_THROW(canonicalizer.orbit(Plan()), InvalidArgument);
  EXPECT_THROW(canonicalizer.enumerate_canonical(0), InvalidArgument);
  EXPECT_THROW(canonicalizer.enumerate_canonical(-3), InvalidArgument);
  EXPECT_THROW(make_canonicalizer(true, true, 0).enumerate_canonical(3), InvalidArgument);
}

TEST(Board, from_text) {
  Board board = Board::from_text(
    "\n"
    "#A~.\n"
    "*LRF\n"
    "\n");
  EXPECT_EQ(board.num_rows(), 2);
  EXPECT_EQ(board.num_cols(), 4);
  ASSERT_EQ(board.num_agents(), 2);
  EXPECT_EQ(board.agent_starts()[0], (Coord{0, 1}));
  EXPECT_EQ(board.agent_starts()[1], (Coord{1, 0}));

  EXPECT_EQ(board.at(Coord{0, 0}), Tile::wall());
  EXPECT_EQ(board.at(Coord{0, 1}), Tile::empty());
  EXPECT_EQ(board.at(Coord{0, 2}), Tile::ice());
  EXPECT_EQ(board.at(Coord{1, 0}), Tile::finish());
  EXPECT_EQ(board.at(Coord{1, 1}), Tile::rotator(kTurnLeft));
  EXPECT_EQ(board.at(Coord{1, 2}), Tile::rotator(kTurnRight));

  EXPECT_TRUE(board.is_blocked(Coord{0, 0}));
  EXPECT_TRUE(board.is_blocked(Coord{-1, 2}));
  EXPECT_TRUE(board.is_blocked(Coord{0, 4}));
  EXPECT_FALSE(board.is_blocked(Coord{0, 2}));
  EXPECT_TRUE(board.is_finish(Coord{1, 3}));

  EXPECT_EQ(board.to_text(), "#A~.\n*LRF\n");
}

TEST(Board, from_text_crlf) {
  Board board = Board::from_text("A.\r\n.F\r\n");
  EXPECT_EQ(board.num_cols(), 2);
  EXPECT_EQ(board.to_text(), "A.\n.F\n");
}

TEST(Board, invalid_text) {
  EXPECT_THROW(Board::from_text(""), InvalidBoard);
  EXPECT_THROW(Board::from_text("\n\n"), InvalidBoard);
  EXPECT_THROW(Board::from_text("A..\n.."), InvalidBoard);
  EXPECT_THROW(Board::from_text("A.x"), InvalidBoard);
  EXPECT_THROW(Board::from_text("..F"), InvalidBoard);
}

TEST(Board, validate) {
  Board::tile_vec_t cells(4, Tile::empty());
  EXPECT_NO_THROW(Board(2, 2, cells, {Coord{0, 0}}).validate());

  EXPECT_THROW(Board(2, 2, cells, {}).validate(), InvalidBoard);
  EXPECT_THROW(Board(2, 2, cells, {Coord{2, 0}}).validate(), InvalidBoard);
  EXPECT_THROW(Board(2, 2, cells, {Coord{0, -1}}).validate(), InvalidBoard);
  EXPECT_THROW(Board(3, 2, cells, {Coord{0, 0}}).validate(), InvalidBoard);
  EXPECT_THROW(Board(0, 0, {}, {Coord{0, 0}}).validate(), InvalidBoard);

  Board::tile_vec_t walled = cells;
  walled[0] = Tile::wall();
  EXPECT_THROW(Board(2, 2, walled, {Coord{0, 0}}).validate(), InvalidBoard);

  Board::tile_vec_t undefined = cells;
  undefined[3].kind = TileKind(42);
  EXPECT_THROW(Board(2, 2, undefined, {Coord{0, 0}}).validate(), InvalidBoard);
}

TEST(Board, to_text_agent_on_rotator) {
  Board board = make_walled_cell(Tile::rotator(kTurnLeft));
  EXPECT_THROW(board.to_text(), InvalidBoard);
}

TEST(Simulator, wall_no_op) {
  Simulator simulator;
  Board board = Board::from_text(
    "###\n"
    "#A#\n"
    "###\n");

  SimulationResult result = simulator.simulate(board, P("N"), 10);
  EXPECT_EQ(result.verdict, kUnsolved);
  EXPECT_EQ(result.num_steps, 10);
  ASSERT_EQ(result.trace.frames.size(), 11u);
  EXPECT_EQ(result.trace.num_steps(), 10);
  for (const Frame& frame : result.trace.frames) {
    ASSERT_EQ(frame.size(), 1u);
    EXPECT_EQ(frame[0], (Coord{1, 1}));
  }
}

TEST(Simulator, start_on_finish) {
  Simulator simulator;
  Board board = Board::from_text(
    "###\n"
    "#*#\n"
    "###\n");

  // The board is only checked after a step, so one step always runs.
  SimulationResult result = simulator.simulate(board, P("NESW"), 10);
  EXPECT_EQ(result.verdict, kSolved);
  EXPECT_EQ(result.num_steps, 1);
  EXPECT_EQ(result.trace.last()[0], (Coord{1, 1}));
}

TEST(Simulator, edge_no_op) {
  Simulator simulator;
  Board board = Board::from_text("A.F\n");

  SimulationResult result = simulator.simulate(board, P("NSE"), 20);
  EXPECT_EQ(result.verdict, kSolved);
  // N and S run off the board; each E advances one column.
  EXPECT_EQ(result.num_steps, 6);
  EXPECT_EQ(result.trace.frames[2][0], (Coord{0, 0}));
  EXPECT_EQ(result.trace.frames[3][0], (Coord{0, 1}));
}

TEST(Simulator, ice_run) {
  Simulator simulator;
  Board board = Board::from_text("A~~.F\n");

  SimulationResult result = simulator.simulate(board, P("E"), 10);
  EXPECT_EQ(result.verdict, kSolved);
  EXPECT_EQ(result.num_steps, 2);
  ASSERT_EQ(result.trace.frames.size(), 3u);
  EXPECT_EQ(result.trace.frames[1][0], (Coord{0, 3}));
  EXPECT_EQ(result.trace.frames[2][0], (Coord{0, 4}));
}

TEST(Simulator, ice_stops_at_wall) {
  Simulator simulator;
  Board board = Board::from_text("A~~#\n");

  SimulationResult result = simulator.simulate(board, P("E"), 3);
  EXPECT_EQ(result.verdict, kUnsolved);
  EXPECT_EQ(result.trace.frames[1][0], (Coord{0, 2}));
  EXPECT_EQ(result.trace.last()[0], (Coord{0, 2}));
}

TEST(Simulator, ice_stops_at_edge) {
  Simulator simulator;
  Board board = Board::from_text("A~~\n");

  SimulationResult result = simulator.simulate(board, P("E"), 3);
  EXPECT_EQ(result.verdict, kUnsolved);
  EXPECT_EQ(result.num_steps, 3);
  EXPECT_EQ(result.trace.frames[1][0], (Coord{0, 2}));
  EXPECT_EQ(result.trace.last()[0], (Coord{0, 2}));
}

TEST(Simulator, ice_slide_onto_rotator) {
  Simulator simulator;
  Board board = Board::from_text(
    "A~R.\n"
    "..F.\n");

  // The slide ends on the Rotator, which then turns E into S.
  SimulationResult result = simulator.simulate(board, P("E"), 10);
  EXPECT_EQ(result.verdict, kSolved);
  EXPECT_EQ(result.num_steps, 3);
  EXPECT_EQ(result.trace.frames[1][0], (Coord{0, 2}));
  EXPECT_EQ(result.trace.frames[2][0], (Coord{0, 2}));
  EXPECT_EQ(result.trace.frames[3][0], (Coord{1, 2}));
}

TEST(Simulator, multi_agent_synchrony) {
  Simulator simulator;

  Board together = Board::from_text(
    "A.F\n"
    "A.F\n");
  SimulationResult solved = simulator.simulate(together, P("E"), 10);
  EXPECT_EQ(solved.verdict, kSolved);
  EXPECT_EQ(solved.num_steps, 2);

  // Agent 0 reaches its Finish at step 1 and leaves at step 2, when agent 1 arrives on its own.
  Board staggered = Board::from_text(
    "AF.\n"
    "A.F\n");
  SimulationResult unsolved = simulator.simulate(staggered, P("E"), 10);
  EXPECT_EQ(unsolved.verdict, kUnsolved);
  EXPECT_EQ(unsolved.num_steps, 10);
  EXPECT_EQ(unsolved.trace.frames[1][0], (Coord{0, 1}));
  EXPECT_EQ(unsolved.trace.frames[2][0], (Coord{0, 2}));
  EXPECT_EQ(unsolved.trace.frames[2][1], (Coord{1, 2}));
}

TEST(Simulator, rotator_turns_right) {
  Simulator simulator;
  Board board = Board::from_text(
    "AR.\n"
    ".F.\n");

  SimulationResult result = simulator.simulate(board, P("E"), 10);
  EXPECT_EQ(result.verdict, kSolved);
  EXPECT_EQ(result.num_steps, 3);
  EXPECT_EQ(result.trace.frames[1][0], (Coord{0, 1}));
  EXPECT_EQ(result.trace.frames[2][0], (Coord{0, 1}));  // turning in place
  EXPECT_EQ(result.trace.frames[3][0], (Coord{1, 1}));

  Board plain = Board::from_text(
    "A..\n"
    ".F.\n");
  EXPECT_EQ(simulator.simulate(plain, P("E"), 10).verdict, kUnsolved);
}

TEST(Simulator, rotator_turns_left) {
  Simulator simulator;
  Board board = Board::from_text(
    ".F.\n"
    "AL.\n");

  SimulationResult result = simulator.simulate(board, P("E"), 10);
  EXPECT_EQ(result.verdict, kSolved);
  EXPECT_EQ(result.num_steps, 3);
  EXPECT_EQ(result.trace.last()[0], (Coord{0, 1}));
}

TEST(Simulator, walled_rotator_is_stuck) {
  Board board = make_walled_cell(Tile::rotator(kTurnRight));

  SimulationResult result = Simulator().simulate(board, P("NESW"), 100);
  EXPECT_EQ(result.verdict, kStuck);
  // max_rotations blocked turns are allowed; the one after that is Stuck.
  EXPECT_EQ(result.num_steps, kDefaultMaxRotations + 1);
  EXPECT_EQ(result.trace.last()[0], (Coord{1, 1}));

  Simulator::Params params;
  params.max_rotations = 2;
  SimulationResult quick = Simulator(params).simulate(board, P("N"), 100);
  EXPECT_EQ(quick.verdict, kStuck);
  EXPECT_EQ(quick.num_steps, 3);
}

TEST(Simulator, rotator_retries_after_blocked_turn) {
  Board board = Board::from_text(
    "#.#\n"
    "AR#\n"
    "###\n");

  // E onto the Rotator, a turn to S (blocked), a second turn to W (open), then W twice.
  std::vector<Coord> expected = {{1, 0}, {1, 1}, {1, 1}, {1, 1}, {1, 0}, {1, 0}};

  SimulationResult result = Simulator().simulate(board, P("E"), 5);
  EXPECT_EQ(result.verdict, kUnsolved);
  EXPECT_EQ(result.num_steps, 5);
  ASSERT_EQ(result.trace.frames.size(), expected.size());
  for (int k = 0; k < int(expected.size()); ++k) {
    EXPECT_EQ(result.trace.frames[k][0], expected[k]) << "k=" << k;
  }

  // A single blocked turn is within a limit of 1.
  Simulator::Params params;
  params.max_rotations = 1;
  SimulationResult limited = Simulator(params).simulate(board, P("E"), 5);
  EXPECT_EQ(limited.verdict, kUnsolved);
  EXPECT_EQ(limited.trace.frames, result.trace.frames);
}

TEST(Simulator, default_max_steps) {
  Simulator::Params params;
  params.max_steps = 5;
  Simulator simulator(params);
  Board board = make_walled_cell(Tile::empty());

  SimulationResult result = simulator.simulate(board, P("E"));
  EXPECT_EQ(result.verdict, kUnsolved);
  EXPECT_EQ(result.num_steps, 5);
  EXPECT_EQ(result.trace.num_steps(), 5);
}

TEST(Simulator, deterministic) {
  Simulator simulator;
  Board board = Board::from_text(
    "A~.R.\n"
    ".#~.F\n"
    "A..L.\n");
  Plan plan = P("ESSEN");

  SimulationResult a = simulator.simulate(board, plan, 50);
  SimulationResult b = simulator.simulate(board, plan, 50);
  EXPECT_EQ(a.verdict, b.verdict);
  EXPECT_EQ(a.num_steps, b.num_steps);
  EXPECT_EQ(a.trace.frames, b.trace.frames);
}

TEST(Simulator, errors) {
  Simulator simulator;
  Board board = Board::from_text("A.F\n");

  EXPECT_THROW(simulator.simulate(board, Plan(), 10), InvalidArgument);
  EXPECT_THROW(simulator.simulate(board, P("E"), 0), InvalidArgument);
  EXPECT_THROW(simulator.simulate(board, P("E"), -1), InvalidArgument);

  Board::tile_vec_t cells(3, Tile::empty());
  EXPECT_THROW(simulator.simulate(Board(1, 3, cells, {Coord{0, 3}}), P("E"), 10), InvalidBoard);
  EXPECT_THROW(simulator.simulate(Board(1, 3, cells, {}), P("E"), 10), InvalidBoard);

  Simulator::Params params;
  params.max_rotations = 0;
  EXPECT_THROW(Simulator(params).simulate(board, P("E"), 10), InvalidArgument);
}

TEST(IO, names) {
  EXPECT_EQ(IO::verdict_to_str(kSolved), "Solved");
  EXPECT_EQ(IO::verdict_to_str(kUnsolved), "Unsolved");
  EXPECT_EQ(IO::verdict_to_str(kStuck), "Stuck");
  EXPECT_EQ(IO::tile_kind_to_str(kIce), "Ice");
  EXPECT_EQ(IO::tile_kind_to_str(kRotator), "Rotator");
}

TEST(IO, print_frame) {
  Board board = Board::from_text(
    "A~F\n"
    "A.#\n");

  std::ostringstream ss;
  IO::print_frame(ss, board, Frame{Coord{0, 2}, Coord{1, 1}});
  EXPECT_EQ(ss.str(), ".~0\n.1#\n");
}

TEST(IO, trace_to_str) {
  Trace trace;
  trace.frames = {Frame{Coord{0, 0}}, Frame{Coord{0, 1}}};
  EXPECT_EQ(IO::trace_to_str(trace), "step 0: (0, 0)\nstep 1: (0, 1)\n");
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
