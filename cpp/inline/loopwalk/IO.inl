#include "loopwalk/IO.hpp"

#include <magic_enum/magic_enum.hpp>

namespace loopwalk {

template <typename E>
std::string IO::enum_to_str(E value) {
  // Enumerator names carry a 'k' prefix: kSolved -> Solved
  std::string name(magic_enum::enum_name(value));
  if (name.size() > 1 && name[0] == 'k') name.erase(0, 1);
  return name;
}

inline std::string IO::verdict_to_str(Verdict verdict) { return enum_to_str(verdict); }

inline std::string IO::tile_kind_to_str(TileKind kind) { return enum_to_str(kind); }

}  // namespace loopwalk
