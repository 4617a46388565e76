#include "loopwalk/Canonicalizer.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace loopwalk {

inline auto Canonicalizer::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Canonicalizer options");

  return desc
    .template add_flag<"phase-shift", "no-phase-shift">(
      &phase_shift, "treat cyclic shifts of a plan as equivalent",
      "distinguish plans that differ only by their starting move")
    .template add_flag<"cycle-reduction", "no-cycle-reduction">(
      &cycle_reduction, "collapse repeated cycles to their primitive period",
      "keep repeated cycles at their full length")
    .template add_option<"canonicalizer-threads">(
      po::value<int>(&num_threads)->default_value(num_threads),
      "number of worker threads used for enumeration");
}

}  // namespace loopwalk
