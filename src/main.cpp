#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/intake.hpp"
#include "core/runner.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "usage: " << program << " <config.yaml> <intake.csv|-> [output-path]\n";
}

}  // namespace

std::string format_config_settings(const triage::core::ScorerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[scorer] loaded config from " << config_path
         << " | preset=" << config.preset
         << " | population=" << config.population
         << " | clamp_input=" << (config.clamp_input ? "true" : "false")
         << " | batch_workers=" << config.batch_workers
         << " | output=" << triage::core::output_format_name(config.output)
         << " | debug_records=" << (config.debug_records ? "true" : "false");
  return output.str();
}

int main(int argc, char** argv) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 2;
  }

  const std::string config_path = argv[1];
  const std::string intake_path = argv[2];

  triage::core::ScorerConfig config{};
  try {
    config = triage::core::load_scorer_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::vector<triage::core::IntakeRow> rows;
  try {
    rows = intake_path == "-" ? triage::core::read_intake(std::cin) : triage::core::read_intake_file(intake_path);
  } catch (const std::exception& ex) {
    std::cerr << "[intake] " << ex.what() << '\n';
    return 1;
  }
  std::cerr << "[intake] read " << rows.size() << " rows from " << intake_path << '\n';

  std::ofstream output_file;
  if (argc > 3) {
    output_file.open(argv[3]);
    if (!output_file.is_open()) {
      std::cerr << "[scorer] unable to open output file: " << argv[3] << '\n';
      return 1;
    }
  }
  std::ostream& out = output_file.is_open() ? static_cast<std::ostream&>(output_file) : std::cout;

  try {
    triage::core::Runner runner{config};
    const triage::core::RunResult result = runner.run(rows, intake_path, out);
    triage::core::log_run_summary(result);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  return 0;
}
