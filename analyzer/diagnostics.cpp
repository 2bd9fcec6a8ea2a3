#include <stdio.h>
#include <string.h>
#include <errno.h>
#include "diagnostics.h"

using namespace std;

namespace clipmeter {

bool ShouldEmit(VisualizationFilter filter, double limitWh, const DayAnalysis& a) {
	// We can only plot days that made it all the way through curve fitting
	if (!a.Fitted)
		return false;
	int64_t limitWs = (int64_t) (limitWh * 3600.0);
	switch (filter) {
	case VisualizationFilter::All: return true;
	case VisualizationFilter::GoodData: return a.Gate.Passed();
	case VisualizationFilter::NotCloudy: return a.Gate.Passed() && !a.Fit.TooCloudy;
	case VisualizationFilter::Exceedance: return a.Result.HasExceedance && a.Result.ExceedanceWs >= limitWs;
	case VisualizationFilter::Shaved: return a.Result.HasShaved && a.Result.ShavedWs >= limitWs;
	case VisualizationFilter::None: return false;
	}
	return false;
}

static nlohmann::json CurveToJSON(const FitCurve& c, int numPoints, const Series& series, double cloudThreshold) {
	// The cloud limit is what each sample was compared against to decide if it was cloudy
	auto limit = nlohmann::json::array();
	for (const auto& s : series)
		limit.push_back(c(s.Offset) - cloudThreshold);
	return nlohmann::json({
	    {"Coef", {c.Coef[0], c.Coef[1], c.Coef[2]}},
	    {"DomainMin", c.DomainMin},
	    {"DomainMax", c.DomainMax},
	    {"NumPoints", numPoints},
	    {"CloudLimit", limit},
	});
}

static int CountTrue(const vector<bool>& v) {
	int n = 0;
	for (bool b : v)
		n += b ? 1 : 0;
	return n;
}

nlohmann::json DiagnosticsToJSON(const DayAnalysis& a, const Series& series, const AnalysisParams& params) {
	auto classes = ClassifySamples(series, a.Fit.Cloudy2, params);
	auto samples = nlohmann::json::array();
	for (size_t i = 0; i < series.size(); i++) {
		samples.push_back(nlohmann::json({
		    {"Offset", series[i].Offset},
		    {"Watts", series[i].Watts},
		    {"Class", SampleClassToString(classes[i])},
		}));
	}

	nlohmann::json j = {
	    {"Date", a.Day.ToString()},
	    {"Device", a.Device},
	    {"Status", DayStatusToString(a.Status)},
	    {"CeilingW", params.CeilingW},
	    {"FitMinW", params.FitMinW},
	    {"GeneratedWh", (double) a.Result.GeneratedWs / 3600.0},
	    {"Samples", samples},
	    {"TooCloudy", a.Fit.TooCloudy},
	};
	j["ExceedanceWh"] = a.Result.HasExceedance ? nlohmann::json((double) a.Result.ExceedanceWs / 3600.0) : nlohmann::json();
	j["ShavedWh"]     = a.Result.HasShaved ? nlohmann::json((double) a.Result.ShavedWs / 3600.0) : nlohmann::json();

	if (a.Fitted) {
		j["CloudLimit1"]    = CurveToJSON(a.Fit.Pass1, a.Fit.NumPass1, series, params.CloudThresholdW);
		j["CloudLimit2"]    = CurveToJSON(a.Fit.Pass2, a.Fit.NumPass2, series, params.CloudThresholdW);
		j["BestFit"]        = CurveToJSON(a.Fit.Final, a.Fit.NumFinal, series, params.CloudThresholdW);
		j["NumCloudy1"]     = CountTrue(a.Fit.Cloudy1);
		j["NumCloudy2"]     = CountTrue(a.Fit.Cloudy2);
		j["NumCloudyFinal"] = CountTrue(a.Fit.CloudyFinal);
		double peakOffset   = 0;
		double peakWatts    = 0;
		if (a.Fit.Final.Peak(peakOffset, peakWatts)) {
			j["EstPeakTime"]  = SecondsToTime((int) peakOffset);
			j["EstPeakWatts"] = peakWatts;
		}
	}

	// First and last sample at the ceiling
	int first = -1;
	int last  = -1;
	for (const auto& s : series) {
		if (s.Watts >= params.CeilingW) {
			if (first == -1)
				first = s.Offset;
			last = s.Offset;
		}
	}
	if (first != -1) {
		j["FirstExceedance"] = SecondsToTime(first);
		j["LastExceedance"]  = SecondsToTime(last);
		j["ExceedanceHours"] = (double) (last - first) / 3600.0;
	}
	return j;
}

std::string DiagnosticsFilename(const DayAnalysis& a) {
	char buf[64];
	snprintf(buf, sizeof(buf), "_SN%lld.json", (long long) a.Device);
	return a.Day.ToString() + buf;
}

bool WriteDiagnostics(const std::string& dir, const DayAnalysis& a, const Series& series, const AnalysisParams& params) {
	string filename = dir + "/" + DiagnosticsFilename(a);
	string body     = DiagnosticsToJSON(a, series, params).dump(4);
	FILE*  f        = fopen(filename.c_str(), "w");
	if (f == nullptr) {
		fprintf(stderr, "Failed to open %s: %s\n", filename.c_str(), strerror(errno));
		return false;
	}
	bool ok = fwrite(body.data(), 1, body.size(), f) == body.size();
	ok      = fclose(f) == 0 && ok;
	if (!ok) {
		fprintf(stderr, "Failed to write %s\n", filename.c_str());
		return false;
	}
	return true;
}

} // namespace clipmeter
