#include "loopwalk/Tile.hpp"

#include "loopwalk/Constants.hpp"
#include "loopwalk/Exceptions.hpp"

namespace loopwalk {

inline group::element_t Tile::rotation() const {
  using C4 = groups::C4;
  return turn == kTurnLeft ? C4::kRot270 : C4::kRot90;
}

inline char Tile::to_char() const {
  switch (kind) {
    case kEmpty:
      return kEmptyChar;
    case kWall:
      return kWallChar;
    case kIce:
      return kIceChar;
    case kRotator:
      switch (turn) {
        case kTurnLeft:
          return kRotatorLeftChar;
        case kTurnRight:
          return kRotatorRightChar;
      }
      break;
    case kFinish:
      return kFinishChar;
  }
  throw InvalidBoard("Undefined tile (kind={}, turn={})", int(kind), int(turn));
}

inline bool Tile::is_defined() const {
  switch (kind) {
    case kEmpty:
    case kWall:
    case kIce:
    case kFinish:
      return true;
    case kRotator:
      return turn == kTurnLeft || turn == kTurnRight;
  }
  return false;
}

}  // namespace loopwalk
