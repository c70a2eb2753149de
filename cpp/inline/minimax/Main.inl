#include "minimax/Main.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <optional>
#include <unistd.h>

namespace minimax {

template <core::concepts::Game Game>
int Main<Game>::main(int ac, char* av[], const Params& default_params) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Params params = default_params;
    util::Logging::Params log_params;
    util::Random::Params random_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    LOG_INFO("Starting process {} ({})", getpid(), Game::Constants::kGameName);

    std::unique_ptr<Driver> driver = DriverFactory::create(params);
    driver->play();
    report_result(*driver);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

template <core::concepts::Game Game>
void Main<Game>::report_result(const Driver& driver) {
  Game::IO::print_state(std::cout, driver.current_state());

  std::optional<core::seat_index_t> winner = driver.winner();
  if (winner) {
    std::cout << "Winner: " << Game::IO::player_to_str(*winner) << std::endl;
  } else {
    std::cout << "Draw" << std::endl;
  }
  LOG_INFO("Game over. Final search tree size: {}", driver.num_states());
}

}  // namespace minimax
