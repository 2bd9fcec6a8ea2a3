#include <stdio.h>
#include <string.h>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "settings.h"

using namespace std;

namespace clipmeter {

const char* DBModeToString(DBModes v) {
	switch (v) {
	case DBModes::SQLite: return "SQLite";
	case DBModes::Postgres: return "Postgres";
	case DBModes::MySQL: return "MySQL";
	case DBModes::CSV: return "CSV";
	}
	return "INVALID";
}

const char* VisualizationFilterToString(VisualizationFilter v) {
	switch (v) {
	case VisualizationFilter::All: return "All";
	case VisualizationFilter::GoodData: return "GoodData";
	case VisualizationFilter::NotCloudy: return "NotCloudy";
	case VisualizationFilter::Exceedance: return "Exceedance";
	case VisualizationFilter::Shaved: return "Shaved";
	case VisualizationFilter::None: return "None";
	}
	return "INVALID";
}

bool ParseDBMode(const char* s, DBModes& out) {
	const DBModes all[] = {DBModes::SQLite, DBModes::Postgres, DBModes::MySQL, DBModes::CSV};
	for (auto v : all) {
		if (strcmp(s, DBModeToString(v)) == 0) {
			out = v;
			return true;
		}
	}
	return false;
}

bool ParseVisualizationFilter(const char* s, VisualizationFilter& out) {
	const VisualizationFilter all[] = {
	    VisualizationFilter::All,
	    VisualizationFilter::GoodData,
	    VisualizationFilter::NotCloudy,
	    VisualizationFilter::Exceedance,
	    VisualizationFilter::Shaved,
	    VisualizationFilter::None,
	};
	for (auto v : all) {
		if (strcmp(s, VisualizationFilterToString(v)) == 0) {
			out = v;
			return true;
		}
	}
	return false;
}

template <typename T>
static void Read(const nlohmann::json& j, const char* key, T& out) {
	if (j.contains(key))
		out = j.at(key).get<T>();
}

// Enum and date fields are stored as strings, and need their own parser
template <typename T>
static bool ReadParsed(const nlohmann::json& j, const char* key, T& out, bool (*parse)(const char*, T&)) {
	if (!j.contains(key))
		return true;
	string v = j.at(key).get<string>();
	if (!parse(v.c_str(), out)) {
		fprintf(stderr, "Invalid value '%s' for setting %s\n", v.c_str(), key);
		return false;
	}
	return true;
}

bool ApplySettingsJSON(const std::string& json, Settings& s) {
	try {
		auto j = nlohmann::json::parse(json);
		if (!j.is_object()) {
			fprintf(stderr, "Settings must be a JSON object\n");
			return false;
		}
		Read(j, "CeilingW", s.Analysis.CeilingW);
		Read(j, "MaxStartupW", s.Analysis.MaxStartupW);
		Read(j, "MaxShutdownW", s.Analysis.MaxShutdownW);
		Read(j, "MinSamples", s.Analysis.MinSamples);
		Read(j, "MinFitSamples", s.Analysis.MinFitSamples);
		Read(j, "FitMinW", s.Analysis.FitMinW);
		Read(j, "CloudThresholdW", s.Analysis.CloudThresholdW);
		Read(j, "SkipFitWithoutExceedance", s.Analysis.SkipFitWithoutExceedance);
		Read(j, "CadenceSeconds", s.CadenceSeconds);
		Read(j, "Detail", s.Detail);
		Read(j, "Threads", s.Threads);
		Read(j, "VisualizeLimitWh", s.VisualizeLimitWh);
		Read(j, "DiagnosticsDir", s.DiagnosticsDir);
		Read(j, "SQLiteFilename", s.SQLiteFilename);
		Read(j, "CSVFilename", s.CSVFilename);
		Read(j, "PostgresHost", s.PostgresHost);
		Read(j, "PostgresPort", s.PostgresPort);
		Read(j, "PostgresDB", s.PostgresDB);
		Read(j, "PostgresUsername", s.PostgresUsername);
		Read(j, "PostgresPassword", s.PostgresPassword);
		Read(j, "MySQLHost", s.MySQLHost);
		Read(j, "MySQLPort", s.MySQLPort);
		Read(j, "MySQLDB", s.MySQLDB);
		Read(j, "MySQLUsername", s.MySQLUsername);
		Read(j, "MySQLPassword", s.MySQLPassword);
		bool ok = ReadParsed(j, "Strictness", s.Analysis.Mode, ParseStrictness) &&
		          ReadParsed(j, "Visualize", s.Visualize, ParseVisualizationFilter) &&
		          ReadParsed(j, "DBMode", s.DBMode, ParseDBMode) &&
		          ReadParsed(j, "StartDate", s.StartDate, Date::Parse) &&
		          ReadParsed(j, "EndDate", s.EndDate, Date::Parse);
		return ok;
	} catch (nlohmann::json::exception& e) {
		fprintf(stderr, "Invalid settings: %s\n", e.what());
		return false;
	}
}

bool LoadSettingsFile(const std::string& filename, Settings& s) {
	ifstream f(filename);
	if (!f.is_open()) {
		fprintf(stderr, "Failed to open settings file %s\n", filename.c_str());
		return false;
	}
	stringstream buf;
	buf << f.rdbuf();
	if (!ApplySettingsJSON(buf.str(), s)) {
		fprintf(stderr, "Failed to load settings file %s\n", filename.c_str());
		return false;
	}
	fprintf(stderr, "Loaded %s\n", filename.c_str());
	return true;
}

bool ValidateSettings(const Settings& s) {
	const auto& a = s.Analysis;
	if (a.CeilingW < 1 || a.CeilingW > 100000) {
		fprintf(stderr, "Invalid ceiling %d W. Must be between 1 and 100000.\n", a.CeilingW);
		return false;
	}
	if (a.FitMinW < 0 || a.FitMinW >= a.CeilingW) {
		fprintf(stderr, "Invalid minimum fit power %d W. Must be between 0 and the ceiling (%d W).\n", a.FitMinW, a.CeilingW);
		return false;
	}
	if (a.MaxStartupW < 0 || a.MaxShutdownW < 0 || a.CloudThresholdW < 0) {
		fprintf(stderr, "Power thresholds may not be negative\n");
		return false;
	}
	if (a.MinSamples < 0 || a.MinFitSamples < 0) {
		fprintf(stderr, "Minimum sample counts may not be negative\n");
		return false;
	}
	if (s.CadenceSeconds < 1 || s.CadenceSeconds >= SecondsPerDay) {
		fprintf(stderr, "Invalid cadence %d seconds. Must be between 1 and %d.\n", s.CadenceSeconds, SecondsPerDay - 1);
		return false;
	}
	if (s.Threads < 1 || s.Threads > 256) {
		fprintf(stderr, "Invalid thread count %d. Must be between 1 and 256.\n", s.Threads);
		return false;
	}
	if (s.EndDate < s.StartDate) {
		fprintf(stderr, "End date %s is before start date %s\n", s.EndDate.ToString().c_str(), s.StartDate.ToString().c_str());
		return false;
	}
	if (s.VisualizeLimitWh < 0) {
		fprintf(stderr, "Visualization limit may not be negative\n");
		return false;
	}
	return true;
}

} // namespace clipmeter
