#include "source/source.h"
#include "source/http.h"
#include "source/snapshot.h"

#include <spdlog/spdlog.h>
#include <format>

CategoryDistribution fetch_distribution(const DistributionSource& source,
                                        const std::string& topic,
                                        const Timeframe& timeframe,
                                        const std::string& category) {
  CategoryDistribution dist;
  dist.category = category;
  dist.sentiment =
      source.get_sentiment_distribution(timeframe, category, topic);
  dist.time_to_impact =
      source.get_time_to_impact_distribution(timeframe, category, topic);
  dist.total = histogram_total(dist.sentiment);

  spdlog::debug("[source] ({}) {} sentiment labels, {} impact labels, n={}",
                category, dist.sentiment.size(), dist.time_to_impact.size(),
                dist.total);
  return dist;
}

std::unique_ptr<DistributionSource> make_source(const SourceConfig& cfg) {
  if (cfg.kind == "snapshot") {
    auto reference = today_utc();
    if (!cfg.reference_date.empty()) {
      auto date = parse_date(cfg.reference_date);
      if (!date)
        throw SourceError(
            std::format("invalid reference_date '{}'", cfg.reference_date));
      reference = *date;
    }
    return std::make_unique<SnapshotSource>(
        SnapshotSource::from_file(cfg.snapshot_path, reference));
  }

  if (cfg.kind == "http")
    return std::make_unique<HttpSource>(cfg.base_url, cfg.timeout_ms);

  throw SourceError(std::format("unknown source kind '{}'", cfg.kind));
}
