#pragma once

#include "loopwalk/Constants.hpp"
#include "util/FiniteGroups.hpp"

#include <cstdint>

namespace loopwalk {

/*
 * Directions are numbered clockwise starting at North. The numeric order is also the alphabet
 * order used when comparing plans: North < East < South < West.
 */
enum Direction : int8_t { kNorth = 0, kEast = 1, kSouth = 2, kWest = 3 };

/*
 * Directions are acted on by the dihedral group D4, using the element numbering of groups::D4:
 *
 * kIdentity          d
 * kRot90             d + 1   (clockwise quarter turn)
 * kRot180            d + 2
 * kRot270            d + 3
 * kFlipVertical      2 - d   (N <-> S)
 * kFlipMainDiag      3 - d   (N <-> W, E <-> S)
 * kMirrorHorizontal  -d      (E <-> W)
 * kFlipAntiDiag      1 - d   (N <-> E, S <-> W)
 *
 * (all mod 4). This action respects groups::D4::compose(), i.e.:
 *
 * apply(apply(d, y), x) == apply(d, D4::compose(x, y))
 */
using DirectionGroup = groups::D4;

struct Offset {
  int d_row;
  int d_col;
};

constexpr Direction apply(Direction d, group::element_t sym);

// Rotates d by the given number of clockwise quarter turns (negative for counter-clockwise).
constexpr Direction rotate(Direction d, int quarter_turns);

constexpr Offset offset(Direction d);

char to_char(Direction d);

// Throws InvalidArgument if c is not one of 'N', 'E', 'S', 'W'.
Direction direction_from_char(char c);

}  // namespace loopwalk

#include "inline/loopwalk/Direction.inl"
