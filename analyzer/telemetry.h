#pragma once

#include <stdio.h>
#include <stdint.h>
#include <string>
#include <memory>

#include "timeUtils.h"
#include "settings.h"

namespace clipmeter {

// SYNC-STORE-RESPONSE-CODES
enum class StoreResponse {
	OK        = 0,
	FailOpen  = 1, // Could not open the file or launch the DB client
	FailQuery = 2, // DB client exited with an error
	BadRow    = 3, // A row could not be parsed
};

std::string DescribeStoreResponse(StoreResponse r);

// One row of the telemetry store. The store only records a row when the
// inverter's output changes, so consecutive rows for one device may be
// many reporting intervals apart.
struct Reading {
	Timestamp Time;
	int64_t   Device = 0; // Inverter serial number
	int       Watts  = 0;
};

// Parse a "YYYY-MM-DD HH:MM:SS,<device>,<watts>" row. The fields may also be separated
// by tabs (the mysql client's batch output). Trailing whitespace is ignored.
bool ParseReading(const char* line, Reading& out);

// Format a reading in the same form that ParseReading accepts
std::string FormatReading(const Reading& r);

// TelemetryCursor produces readings ordered by time, and by device within time
class TelemetryCursor {
public:
	virtual ~TelemetryCursor() {}

	// Returns false at the end of the stream, or on error. Check Status() to tell the two apart.
	virtual bool Next(Reading& r) = 0;

	StoreResponse Status() const { return LastStatus; }

protected:
	StoreResponse LastStatus = StoreResponse::OK;
};

// StreamCursor reads rows from a CSV file, stdin, or the output of a DB client command
class StreamCursor : public TelemetryCursor {
public:
	~StreamCursor() override;

	bool OpenFile(const std::string& filename); // "-" for stdin
	bool OpenCommand(const std::string& command, const std::string& description);
	void Close();
	bool Next(Reading& r) override;

private:
	FILE*       Stream      = nullptr;
	bool        IsPipe      = false;
	bool        OwnsStream  = false;
	int         LineNumber  = 0;
	std::string Description = ""; // Used in error messages. Never contains the password.
};

// SQL that fetches the readings between start and end (inclusive)
std::string BuildQuerySQL(const Date& start, const Date& end);

// Shell command that runs BuildQuerySQL with the sqlite3, psql or mysql client, and prints one row per line
std::string BuildQueryCommand(const Settings& s);

// Open the telemetry source selected by s.DBMode
std::unique_ptr<TelemetryCursor> OpenTelemetry(const Settings& s);

} // namespace clipmeter
