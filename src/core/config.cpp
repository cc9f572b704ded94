#include "util/config.h"
#include "util/strings.h"

#include <argparse/argparse.hpp>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>

namespace fs = std::filesystem;

template <typename T>
T read(const char* path) {
  T t{};

  if (!fs::exists(path))
    return t;

  // a half-read file must not leave some fields changed
  T parsed{};
  auto ec = glz::read_file_json(parsed, path, std::string{});
  if (ec)
    std::cerr << std::format("[config] {} error {}, using defaults\n", path,
                             glz::format_error(ec));
  else
    t = std::move(parsed);

  if (T::debug) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer.c_str());
  }

  return t;
}

void Config::update() {
  fs::remove("logs/configs.log");

  forecast = read<ForecastConfig>("private/forecast.json");
  source = read<SourceConfig>("private/source.json");
  domains = read<DomainsConfig>("private/domains.json");

  // command line wins over the files
  if (n_concurrency > 0)
    forecast.n_threads = n_concurrency;
  if (!snapshot_path.empty()) {
    source.kind = "snapshot";
    source.snapshot_path = snapshot_path;
  }
  if (!base_url.empty()) {
    source.kind = "http";
    source.base_url = base_url;
  }
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("consensus");

  program.add_argument("topic")
      .help("Topic to forecast")
      .nargs(argparse::nargs_pattern::optional)
      .default_value(std::string{});

  program.add_argument("-t", "--timeframe")
      .help("Lookback window: 1d, 1w, 1m, 90d, 180d, 365d, <n>d or all")
      .default_value(std::string{"365"});

  program.add_argument("-c", "--categories")
      .help("Comma-separated categories to include")
      .default_value(std::string{});

  program.add_argument("-s", "--snapshot")
      .help("Article snapshot to read distributions from")
      .default_value(std::string{});

  program.add_argument("-u", "--url")
      .help("Base URL of the dashboard analytics service")
      .default_value(std::string{});

  program.add_argument("-o", "--out")
      .help("Write the forecast as JSON to this path")
      .default_value(std::string{});

  program.add_argument("--scenarios")
      .help("Curated scenario library to use instead of the built-in one")
      .default_value(std::string{"private/scenarios.json"});

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("--list-topics")
      .default_value(false)
      .implicit_value(true)
      .help("List topics that have categories and exit");

  program.add_argument("--consensus-types")
      .default_value(false)
      .implicit_value(true)
      .help("Print the consensus type registry and exit");

  program.add_argument("--nthreads")
      .help("Max number of categories processed concurrently (0: config)")
      .default_value(size_t{0})
      .scan<'d', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    std::exit(1);
  }

  debug_en = program.get<bool>("--debug");
  topic = program.get<std::string>("topic");
  timeframe = program.get<std::string>("--timeframe");
  out_path = program.get<std::string>("--out");
  scenarios_path = program.get<std::string>("--scenarios");
  list_topics = program.get<bool>("--list-topics");
  show_consensus_types = program.get<bool>("--consensus-types");

  categories = split(program.get<std::string>("--categories"));
  snapshot_path = program.get<std::string>("--snapshot");
  base_url = program.get<std::string>("--url");
  n_concurrency = program.get<size_t>("--nthreads");

  if (topic.empty() && !list_topics && !show_consensus_types) {
    std::cerr << "a topic is required\n" << program << "\n";
    std::exit(1);
  }
}
