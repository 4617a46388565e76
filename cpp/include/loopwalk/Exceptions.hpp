#pragma once

#include "util/Exception.hpp"

namespace loopwalk {

/*
 * Raised for bad caller-supplied values: an empty plan, a non-positive length or step bound, an
 * unknown move character.
 */
class InvalidArgument : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

/*
 * Raised when a board is structurally inconsistent (agent outside the grid, undefined tile, ragged
 * text rows, ...). Always raised before any simulation step runs.
 */
class InvalidBoard : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace loopwalk
