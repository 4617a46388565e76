#pragma once

#include <cstdint>

namespace loopwalk {

const int kNumDirections = 4;

const int kDefaultMaxSteps = 256;

// Consecutive rotations a Rotator may apply while the agent's next move stays blocked. One more
// blocked rotation declares the run Stuck.
const int kDefaultMaxRotations = 4;

// Enumeration shards plans by their first kShardPrefixLength moves.
const int kShardPrefixLength = 3;

/*
 * Text encoding of boards: one character per cell, one line per row.
 */
const char kEmptyChar = '.';
const char kWallChar = '#';
const char kIceChar = '~';
const char kRotatorLeftChar = 'L';
const char kRotatorRightChar = 'R';
const char kFinishChar = 'F';
const char kAgentOnEmptyChar = 'A';
const char kAgentOnFinishChar = '*';

}  // namespace loopwalk
