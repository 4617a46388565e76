#include "loopwalk/Simulator.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace loopwalk {

inline auto Simulator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Simulator options");

  return desc
    .template add_option<"max-steps">(po::value<int>(&max_steps)->default_value(max_steps),
                                      "number of plan steps to run before declaring Unsolved")
    .template add_option<"max-rotations">(
      po::value<int>(&max_rotations)->default_value(max_rotations),
      "blocked rotations allowed in a row on a Rotator; one more is Stuck");
}

}  // namespace loopwalk
