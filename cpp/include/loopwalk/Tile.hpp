#pragma once

#include "util/FiniteGroups.hpp"

#include <compare>
#include <cstdint>

namespace loopwalk {

enum TileKind : int8_t { kEmpty, kWall, kIce, kRotator, kFinish };

// Sense of a Rotator: Left turns every later move a quarter counter-clockwise, Right clockwise.
enum Turn : int8_t { kTurnLeft, kTurnRight };

/*
 * A board cell. This is a closed tagged variant: kind selects the variant, and turn is the payload
 * of the kRotator variant (ignored for every other kind). Code that switches on kind is expected to
 * handle every TileKind.
 */
struct Tile {
  auto operator<=>(const Tile& other) const = default;

  static constexpr Tile empty() { return Tile{kEmpty}; }
  static constexpr Tile wall() { return Tile{kWall}; }
  static constexpr Tile ice() { return Tile{kIce}; }
  static constexpr Tile rotator(Turn turn) { return Tile{kRotator, turn}; }
  static constexpr Tile finish() { return Tile{kFinish}; }

  // The C4 element a Rotator applies to the agent's heading.
  group::element_t rotation() const;

  // Encoding char, see loopwalk/Constants.hpp. Throws InvalidBoard for an undefined tile.
  char to_char() const;

  // False if kind (or a rotator's turn) holds a value outside the enums.
  bool is_defined() const;

  TileKind kind = kEmpty;
  Turn turn = kTurnRight;
};

}  // namespace loopwalk

#include "inline/loopwalk/Tile.inl"
