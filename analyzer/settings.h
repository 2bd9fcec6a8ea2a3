#pragma once

#include <string>

#include "types.h"
#include "timeUtils.h"

namespace clipmeter {

enum class DBModes {
	SQLite,
	Postgres,
	MySQL, // Also MariaDB
	CSV,
};

// Which device-days get a diagnostic dump. This only affects the diagnostic output,
// never the analysis itself (see Strictness for that).
enum class VisualizationFilter {
	All,        // Every day that reached curve fitting
	GoodData,   // Days that passed the startup/sample count/shutdown checks
	NotCloudy,  // GoodData, and enough normal samples left after cloud rejection
	Exceedance, // Exceedance at or above VisualizeLimitWh
	Shaved,     // Shaved energy at or above VisualizeLimitWh
	None,       // Never
};

const char* DBModeToString(DBModes v);
const char* VisualizationFilterToString(VisualizationFilter v);
bool        ParseDBMode(const char* s, DBModes& out);
bool        ParseVisualizationFilter(const char* s, VisualizationFilter& out);

struct Settings {
	AnalysisParams      Analysis;
	int                 CadenceSeconds   = 331;                       // Expected seconds between telemetry updates from one inverter
	Date                StartDate        = Date(2006, 1, 1);          // First day to analyze
	Date                EndDate          = Date(9999, 12, 31);        // Last day to analyze (inclusive)
	bool                Detail           = false;                     // Print one line per device-day
	int                 Threads          = 1;                         // Number of worker threads that analyze the devices of a day
	VisualizationFilter Visualize        = VisualizationFilter::None; // Which days to dump diagnostics for
	double              VisualizeLimitWh = 0;                         // Threshold for VisualizationFilter::Exceedance and Shaved
	std::string         DiagnosticsDir   = ".";                       // Directory that receives the diagnostic JSON files

	DBModes DBMode = DBModes::SQLite; // Where to read telemetry from

	std::string SQLiteFilename = "enphase.sqlite"; // When DBMode is SQLite, the DB file
	std::string CSVFilename    = "-";              // When DBMode is CSV, the file to read ("-" for stdin)

	std::string PostgresHost     = "localhost"; // When DBMode is Postgres, hostname
	std::string PostgresPort     = "5432";      // When DBMode is Postgres, port
	std::string PostgresDB       = "enphase";   // When DBMode is Postgres, db name
	std::string PostgresUsername = "postgres";  // When DBMode is Postgres, username
	std::string PostgresPassword = "";          // When DBMode is Postgres, password

	std::string MySQLHost     = "localhost"; // When DBMode is MySQL, hostname
	std::string MySQLPort     = "3306";      // When DBMode is MySQL, port
	std::string MySQLDB       = "enphase";   // When DBMode is MySQL, db name
	std::string MySQLUsername = "root";      // When DBMode is MySQL, username
	std::string MySQLPassword = "";          // When DBMode is MySQL, password
};

// Apply the values of a JSON object (keys are the Settings field names) on top of s.
// Prints the reason to stderr and returns false if the JSON is invalid.
bool ApplySettingsJSON(const std::string& json, Settings& s);

// Load a JSON settings file on top of s
bool LoadSettingsFile(const std::string& filename, Settings& s);

// Check ranges. Prints the first problem to stderr and returns false.
bool ValidateSettings(const Settings& s);

} // namespace clipmeter
