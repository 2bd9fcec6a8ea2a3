#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sstream>
#include "analyzer/settings.h"
#include "analyzer/telemetry.h"
#include "analyzer/reconstructor.h"
#include "analyzer/analyzer.h"
#include "analyzer/report.h"
#include "analyzer/diagnostics.h"

using namespace std;
using namespace clipmeter;

static const char* DefaultSettingsFile = "clipmeter.json";

bool equals(const char* a, const char* b) {
	return strcmp(a, b) == 0;
}

vector<string> split(const string& s, char delim) {
	vector<string> elems;
	stringstream   ss(s);
	string         item;
	while (getline(ss, item, delim)) {
		elems.push_back(item);
	}
	return elems;
}

void ShowHelp(const Settings& d) {
	fprintf(stderr, "clipmeter-analyze - Report energy generated, exceedance, and shaved energy of Enphase inverters\n");
	fprintf(stderr, " -f <json>          Settings file. Default %s (if it exists)\n", DefaultSettingsFile);
	fprintf(stderr, " -l <sqlite>        Read from SQLite DB file. Default %s\n", d.SQLiteFilename.c_str());
	fprintf(stderr, " -p <postgres>      Read from Postgres. Connection string separated by colons host:port:db:user:password\n");
	fprintf(stderr, " -y <mysql>         Read from MySQL or MariaDB. Connection string separated by colons host:port:db:user:password\n");
	fprintf(stderr, " -i <csv>           Read readings from CSV file (- for stdin), one 'YYYY-MM-DD HH:MM:SS,serial,watts' per line\n");
	fprintf(stderr, " -m <watts>         Maximum continuous power of the inverters. Default %d\n", d.Analysis.CeilingW);
	fprintf(stderr, " -c <seconds>       Seconds between inverter reports. Default %d\n", d.CadenceSeconds);
	fprintf(stderr, " --start <date>     First day to report (YYYY-MM-DD). Default %s\n", d.StartDate.ToString().c_str());
	fprintf(stderr, " --end <date>       Last day to report (YYYY-MM-DD). Default %s\n", d.EndDate.ToString().c_str());
	fprintf(stderr, " --forced           Analyze days that fail the data quality checks. Default %s\n", StrictnessToString(d.Analysis.Mode));
	fprintf(stderr, " --plot <filter>    Write diagnostic JSON for All, GoodData, NotCloudy, Exceedance, Shaved or None. Default %s\n", VisualizationFilterToString(d.Visualize));
	fprintf(stderr, " --plot-limit <wh>  Minimum energy for the Exceedance and Shaved filters. Default %.2f\n", d.VisualizeLimitWh);
	fprintf(stderr, " --plot-dir <dir>   Directory for diagnostic JSON. Default %s\n", d.DiagnosticsDir.c_str());
	fprintf(stderr, " -d                 Report every inverter day\n");
	fprintf(stderr, " -j <threads>       Number of analysis threads. Default %d\n", d.Threads);
}

int main(int argc, char** argv) {
	Settings s;
	Settings defaults;

	// The settings file must be loaded first, so that command line arguments override it
	string settingsFile;
	for (int i = 1; i + 1 < argc; i++) {
		if (equals(argv[i], "-f"))
			settingsFile = argv[i + 1];
	}
	if (settingsFile != "") {
		if (!LoadSettingsFile(settingsFile, s))
			return 1;
	} else if (access(DefaultSettingsFile, R_OK) == 0) {
		if (!LoadSettingsFile(DefaultSettingsFile, s))
			return 1;
	}

	bool showHelp = false;
	for (int i = 1; i < argc; i++) {
		const char* arg = argv[i];
		if (equals(arg, "-?") || equals(arg, "-h") || equals(arg, "--help")) {
			showHelp = true;
		} else if (equals(arg, "-d")) {
			s.Detail = true;
		} else if (equals(arg, "--forced")) {
			s.Analysis.Mode = Strictness::Forced;
		} else if (i + 1 < argc && equals(arg, "-f")) {
			i++;
		} else if (i + 1 < argc && equals(arg, "-l")) {
			s.SQLiteFilename = argv[i + 1];
			s.DBMode         = DBModes::SQLite;
			i++;
		} else if (i + 1 < argc && equals(arg, "-i")) {
			s.CSVFilename = argv[i + 1];
			s.DBMode      = DBModes::CSV;
			i++;
		} else if (i + 1 < argc && equals(arg, "-p")) {
			auto parts = split(argv[i + 1], ':');
			if (parts.size() != 5) {
				fprintf(stderr, "Invalid Postgres specification. Must be in the form host:port:db:user:password\n");
				return 1;
			}
			s.PostgresHost     = parts[0];
			s.PostgresPort     = parts[1];
			s.PostgresDB       = parts[2];
			s.PostgresUsername = parts[3];
			s.PostgresPassword = parts[4];
			s.DBMode           = DBModes::Postgres;
			i++;
		} else if (i + 1 < argc && equals(arg, "-y")) {
			auto parts = split(argv[i + 1], ':');
			if (parts.size() != 5) {
				fprintf(stderr, "Invalid MySQL specification. Must be in the form host:port:db:user:password\n");
				return 1;
			}
			s.MySQLHost     = parts[0];
			s.MySQLPort     = parts[1];
			s.MySQLDB       = parts[2];
			s.MySQLUsername = parts[3];
			s.MySQLPassword = parts[4];
			s.DBMode        = DBModes::MySQL;
			i++;
		} else if (i + 1 < argc && equals(arg, "-m")) {
			s.Analysis.CeilingW = atoi(argv[i + 1]);
			i++;
		} else if (i + 1 < argc && equals(arg, "-c")) {
			s.CadenceSeconds = atoi(argv[i + 1]);
			i++;
		} else if (i + 1 < argc && equals(arg, "--start")) {
			if (!Date::Parse(argv[i + 1], s.StartDate)) {
				fprintf(stderr, "Invalid date format: %s. Use YYYY-MM-DD.\n", argv[i + 1]);
				return 1;
			}
			i++;
		} else if (i + 1 < argc && equals(arg, "--end")) {
			if (!Date::Parse(argv[i + 1], s.EndDate)) {
				fprintf(stderr, "Invalid date format: %s. Use YYYY-MM-DD.\n", argv[i + 1]);
				return 1;
			}
			i++;
		} else if (i + 1 < argc && equals(arg, "--plot")) {
			if (!ParseVisualizationFilter(argv[i + 1], s.Visualize)) {
				fprintf(stderr, "Invalid plot filter '%s'\n", argv[i + 1]);
				return 1;
			}
			i++;
		} else if (i + 1 < argc && equals(arg, "--plot-limit")) {
			s.VisualizeLimitWh = atof(argv[i + 1]);
			i++;
		} else if (i + 1 < argc && equals(arg, "--plot-dir")) {
			s.DiagnosticsDir = argv[i + 1];
			i++;
		} else if (i + 1 < argc && equals(arg, "-j")) {
			s.Threads = atoi(argv[i + 1]);
			i++;
		} else {
			fprintf(stderr, "Unknown argument '%s'\n", arg);
			showHelp = true;
		}
	}

	if (showHelp) {
		ShowHelp(defaults);
		return 1;
	}
	if (!ValidateSettings(s))
		return 1;

	auto cursor = OpenTelemetry(s);
	if (cursor == nullptr)
		return 1;
	fprintf(stderr, "Reading %s telemetry from %s to %s, ceiling %d W, %s\n", DBModeToString(s.DBMode),
	        s.StartDate.ToString().c_str(), s.EndDate.ToString().c_str(), s.Analysis.CeilingW, StrictnessToString(s.Analysis.Mode));

	Reconstructor reconstructor(cursor.get());
	reconstructor.CadenceSeconds = s.CadenceSeconds;

	Report   report;
	DayBatch batch;
	bool     ok = true;
	while (ok && reconstructor.NextDay(batch)) {
		// The DB query already filters by date, but a CSV file may hold anything
		if (batch.Day < s.StartDate || batch.Day > s.EndDate)
			continue;
		report.BeginDay();
		auto results = AnalyzeBatch(batch, s.Analysis, s.CadenceSeconds, s.Threads);
		for (const auto& a : results) {
			report.Add(a);
			if (s.Detail)
				printf("%s\n", Report::FormatDetail(a).c_str());
			if (ShouldEmit(s.Visualize, s.VisualizeLimitWh, a)) {
				if (!WriteDiagnostics(s.DiagnosticsDir, a, batch.Devices[a.Device], s.Analysis)) {
					ok = false;
					break;
				}
			}
		}
	}

	if (reconstructor.Status() != StoreResponse::OK) {
		fprintf(stderr, "Telemetry error: %s\n", DescribeStoreResponse(reconstructor.Status()).c_str());
		ok = false;
	}
	if (reconstructor.NumDropped() != 0)
		fprintf(stderr, "Dropped %d out of order readings\n", reconstructor.NumDropped());

	report.PrintSummary(stdout);
	return ok ? 0 : 1;
}
