#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// In order to display help options for gtest, we need to call testing::InitGoogleTest() with
// "--help" in argv. However, doing so causes the program to exit immediately after displaying the
// help, which doesn't give us a chance to show help for our own options.
//
// On the other hand, if we parse our own options first, we will get an unknown-option error if we
// pass any gtest options.
//
// Therefore, we do a specialized scan for "--help" first. If we find it, we print our help, and
// then call the program-exiting testing::InitGoogleTest() call. InitGoogleTest() strips the
// --gtest_* flags out of argv, so what remains can be parsed as our own options.
int launch_gtest(int argc, char** argv) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  log_params.omit_timestamps = true;

  po2::options_description raw_desc("Options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(log_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
      std::cout << desc << std::endl;
      break;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  po::variables_map vm = po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  return RUN_ALL_TESTS();
}
