#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "types.h"
#include "settings.h"
#include "analyzer.h"

namespace clipmeter {

// Decide whether a device-day gets a diagnostic dump
bool ShouldEmit(VisualizationFilter filter, double limitWh, const DayAnalysis& a);

// Everything needed to plot a device-day: the samples and their classification,
// the three curves, and the energy figures.
nlohmann::json DiagnosticsToJSON(const DayAnalysis& a, const Series& series, const AnalysisParams& params);

// "<date>_SN<device>.json"
std::string DiagnosticsFilename(const DayAnalysis& a);

// Write DiagnosticsToJSON into dir. Returns false if the file could not be written.
bool WriteDiagnostics(const std::string& dir, const DayAnalysis& a, const Series& series, const AnalysisParams& params);

} // namespace clipmeter
