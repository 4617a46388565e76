#include "loopwalk/Direction.hpp"

#include "loopwalk/Exceptions.hpp"

namespace loopwalk {

constexpr Direction apply(Direction d, group::element_t sym) {
  constexpr int8_t lookup[] = {
    0, 1, 2, 3,  // kIdentity
    1, 2, 3, 0,  // kRot90
    2, 3, 0, 1,  // kRot180
    3, 0, 1, 2,  // kRot270
    2, 1, 0, 3,  // kFlipVertical
    3, 2, 1, 0,  // kFlipMainDiag
    0, 3, 2, 1,  // kMirrorHorizontal
    1, 0, 3, 2,  // kFlipAntiDiag
  };

  return Direction(lookup[sym * kNumDirections + d]);
}

constexpr Direction rotate(Direction d, int quarter_turns) {
  int k = quarter_turns % kNumDirections;
  if (k < 0) k += kNumDirections;
  return Direction((d + k) % kNumDirections);
}

constexpr Offset offset(Direction d) {
  switch (d) {
    case kNorth:
      return {-1, 0};
    case kEast:
      return {0, 1};
    case kSouth:
      return {1, 0};
    case kWest:
      return {0, -1};
  }
  return {0, 0};
}

inline char to_char(Direction d) {
  constexpr char chars[] = "NESW";
  return chars[d];
}

inline Direction direction_from_char(char c) {
  switch (c) {
    case 'N':
      return kNorth;
    case 'E':
      return kEast;
    case 'S':
      return kSouth;
    case 'W':
      return kWest;
    default:
      throw InvalidArgument("Invalid move character '{}' (expected one of N, E, S, W)", c);
  }
}

}  // namespace loopwalk
