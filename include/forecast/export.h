#pragma once

#include "forecast/types.h"
#include "util/config.h"

#include <string>

std::string_view status_name(ForecastStatus status);
std::string_view polarity_name(Polarity polarity);

// Chart payload handed to the renderers.
std::string forecast_json(const ForecastResult& res, const ForecastConfig& cfg);
bool write_forecast_json(const ForecastResult& res,
                         const ForecastConfig& cfg,
                         const std::string& path);

std::string consensus_types_json();
