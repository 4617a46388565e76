/*
 * Command-line front end for the loopwalk library.
 *
 * loopwalk --canonicalize NESW
 * loopwalk --enumerate 4
 * loopwalk --board level.txt --plan NNEE --max-steps 100 --show-trace
 */

#include "loopwalk/Board.hpp"
#include "loopwalk/Canonicalizer.hpp"
#include "loopwalk/IO.hpp"
#include "loopwalk/Plan.hpp"
#include "loopwalk/Simulator.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

namespace {

struct Args {
  std::string canonicalize_str;
  int enumerate_length = 0;
  std::string board_filename;
  std::string plan_str;
  bool show_trace = false;

  auto make_options_description();
};

auto Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");

  return desc
    .template add_option<"canonicalize", 'c'>(po::value<std::string>(&canonicalize_str),
                                              "print the canonical representative of a plan")
    .template add_option<"enumerate", 'e'>(po::value<int>(&enumerate_length),
                                           "print every canonical plan of the given length")
    .template add_option<"board", 'b'>(po::value<std::string>(&board_filename),
                                       "text board file to simulate on (requires --plan)")
    .template add_option<"plan", 'p'>(po::value<std::string>(&plan_str),
                                      "plan to simulate, e.g. NNES")
    .template add_flag<"show-trace", "hide-trace">(&show_trace, "print every simulated frame",
                                                   "print only the verdict");
}

void run_canonicalize(const loopwalk::Canonicalizer& canonicalizer, const std::string& str) {
  loopwalk::Plan plan = loopwalk::Plan::from_string(str);
  loopwalk::Plan canonical = canonicalizer.canonicalize(plan);
  std::cout << canonical.to_string() << std::endl;
}

void run_enumerate(const loopwalk::Canonicalizer& canonicalizer, int length) {
  loopwalk::PlanSet plans = canonicalizer.enumerate_canonical(length);
  for (const loopwalk::Plan& plan : plans) {
    std::cout << plan.to_string() << '\n';
  }
  std::cout << "count: " << plans.size() << std::endl;
}

void run_simulate(const loopwalk::Simulator& simulator, const Args& args) {
  using loopwalk::IO;

  loopwalk::Board board =
    loopwalk::Board::from_text(boost_util::read_str_from_file(args.board_filename));
  loopwalk::Plan plan = loopwalk::Plan::from_string(args.plan_str);

  LOG_INFO("Simulating plan {} on {} ({}x{}, {} agent(s))", plan.to_string(), args.board_filename,
           board.num_rows(), board.num_cols(), board.num_agents());

  loopwalk::SimulationResult result = simulator.simulate(board, plan);

  if (args.show_trace) {
    const auto& frames = result.trace.frames;
    for (int k = 0; k < int(frames.size()); ++k) {
      std::cout << "step " << k << ":\n";
      IO::print_frame(std::cout, board, frames[k]);
      std::cout << '\n';
    }
  }

  std::cout << "verdict: " << IO::verdict_to_str(result.verdict) << '\n';
  std::cout << "steps: " << result.num_steps << std::endl;
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    loopwalk::Canonicalizer::Params canonicalizer_params;
    loopwalk::Simulator::Params simulator_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help")
                  .add(args.make_options_description())
                  .add(canonicalizer_params.make_options_description())
                  .add(simulator_params.make_options_description())
                  .add(log_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool canonicalize = vm.count("canonicalize");
    bool enumerate = vm.count("enumerate");
    bool simulate = vm.count("board") || vm.count("plan");

    if (vm.count("help") || int(canonicalize) + int(enumerate) + int(simulate) == 0) {
      std::cout << desc << std::endl;
      return 0;
    }
    if (int(canonicalize) + int(enumerate) + int(simulate) > 1) {
      throw util::CleanException(
        "Specify exactly one of --canonicalize, --enumerate, or --board/--plan");
    }
    if (simulate && (args.board_filename.empty() || args.plan_str.empty())) {
      throw util::CleanException("--board and --plan must be given together");
    }

    util::Logging::init(log_params);

    if (canonicalize) {
      run_canonicalize(loopwalk::Canonicalizer(canonicalizer_params), args.canonicalize_str);
    } else if (enumerate) {
      run_enumerate(loopwalk::Canonicalizer(canonicalizer_params), args.enumerate_length);
    } else {
      run_simulate(loopwalk::Simulator(simulator_params), args);
    }
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
