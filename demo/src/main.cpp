#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <optional>
#include <string>

#include "config.hpp"
#include "config_parser.hpp"
#include "headless.hpp"

int main(int argc, char** argv) {
  spdlog::set_level(spdlog::level::info);

  argparse::ArgumentParser program("glide_demo");
  program.add_description(
      "Drive a capsule character through a JSON scenario and export its "
      "trajectory as CSV");

  std::string config_path;
  program.add_argument("-c", "--config")
      .help("The scenario config file")
      .required()
      .store_into(config_path);

  std::string out_path = "out.csv";
  program.add_argument("-o", "--output")
      .help("Output CSV path")
      .store_into(out_path);

  int ticks = 0;
  program.add_argument("--ticks")
      .help("Override the tick count of the scenario")
      .store_into(ticks);

  bool is_verbose = false;
  program.add_argument("-v", "--verbose")
      .help("Log every tick and solver trace")
      .flag()
      .store_into(is_verbose);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    spdlog::error("Fail to parse cli args. Reason: {}", err.what());
    return 1;
  }

  if (is_verbose) {
    spdlog::set_level(spdlog::level::debug);
  }

  std::optional<ScenarioConfig> scenario = parse_config(config_path);
  if (!scenario) {
    spdlog::error("Fail to parse config file {}.", config_path);
    return 1;
  }
  spdlog::info("Load config file {}.", config_path);

  if (program.is_used("--ticks")) {
    if (ticks < 1) {
      spdlog::error("Invalid tick count {}. Must be at least 1.", ticks);
      return 1;
    }
    scenario->global.ticks = ticks;
  }

  return headless_run(*scenario, out_path) ? 0 : 1;
}
