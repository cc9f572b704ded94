#include "forecast/engine.h"
#include "forecast/export.h"
#include "source/source.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

inline void init_logging(bool debug_en) {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%H-%M-%S}.log", pwd,
                              std::chrono::floor<std::chrono::seconds>(
                                  std::chrono::system_clock::now()));
  auto link_name = pwd + "/logs/output.log";

  std::error_code ec;
  fs::remove(link_name, ec);
  fs::create_symlink(log_name, link_name, ec);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (!fs::create_directories(path))
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

int main(int argc, char* argv[]) {
  ensure_directories_exist({"logs"});

  Config config;
  config.read_args(argc, argv);
  config.update();
  init_logging(config.debug_en);

  if (config.show_consensus_types) {
    std::cout << consensus_types_json() << std::endl;
    return 0;
  }

  std::unique_ptr<DistributionSource> source;
  try {
    source = make_source(config.source);
  } catch (const SourceError& e) {
    spdlog::error("[source] {}", e.what());
    std::cerr << "[source] " << e.what() << std::endl;
    return 1;
  }

  CuratedScenarioLibrary scenarios;
  if (fs::exists(config.scenarios_path) &&
      !scenarios.load(config.scenarios_path))
    std::cerr << "[scenarios] using built-in library, see log\n";

  ForecastEngine engine{*source, config.forecast,
                        DomainClassifier::from_names(config.domains.overrides),
                        std::move(scenarios),
                        config.source.sample_article_limit};

  if (config.list_topics) {
    for (auto& topic : engine.topics_with_categories())
      std::cout << topic << '\n';
    return 0;
  }

  std::optional<std::vector<std::string>> categories;
  if (!config.categories.empty())
    categories = config.categories;

  auto res = engine.generate_forecast(
      config.topic, parse_timeframe(config.timeframe), categories);

  std::cout << to_str(res, config.forecast);

  if (!config.out_path.empty() &&
      !write_forecast_json(res, config.forecast, config.out_path))
    return 1;

  return res.has_data() ? 0 : 2;
}
