#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <sys/wait.h>
#include "telemetry.h"

using namespace std;

namespace clipmeter {

std::string DescribeStoreResponse(StoreResponse r) {
	switch (r) {
	case StoreResponse::OK: return "OK";
	case StoreResponse::FailOpen: return "Failed to open telemetry source";
	case StoreResponse::FailQuery: return "Telemetry query failed";
	case StoreResponse::BadRow: return "Failed to parse telemetry row";
	}
	return "Unknown error";
}

static bool ParseInt64(const char*& s, int64_t& out) {
	if (!isdigit((unsigned char) *s) && *s != '-')
		return false;
	errno       = 0;
	char* end   = nullptr;
	long long v = strtoll(s, &end, 10);
	if (errno != 0 || end == s)
		return false;
	s   = end;
	out = v;
	return true;
}

bool ParseReading(const char* line, Reading& out) {
	Reading r;
	int     n = Timestamp::Parse(line, r.Time);
	if (n == 0)
		return false;
	const char* p   = line + n;
	char        sep = *p++;
	if (sep != ',' && sep != '\t')
		return false;
	if (!ParseInt64(p, r.Device))
		return false;
	if (*p++ != sep)
		return false;
	int64_t watts = 0;
	if (!ParseInt64(p, watts))
		return false;
	if (watts < 0 || watts > INT_MAX)
		return false;
	r.Watts = (int) watts;
	while (*p == ' ' || *p == '\t' || *p == '\r' || *p == '\n')
		p++;
	if (*p != 0)
		return false;
	out = r;
	return true;
}

std::string FormatReading(const Reading& r) {
	char buf[64];
	snprintf(buf, sizeof(buf), ",%lld,%d", (long long) r.Device, r.Watts);
	return r.Time.ToString() + buf;
}

// Read one line, without the newline. Returns false at end of file.
static bool ReadLine(FILE* f, string& line) {
	line.clear();
	char buf[256];
	while (fgets(buf, sizeof(buf), f)) {
		line += buf;
		if (line.size() != 0 && line[line.size() - 1] == '\n') {
			line.erase(line.end() - 1, line.end());
			return true;
		}
	}
	return line.size() != 0;
}

StreamCursor::~StreamCursor() {
	Close();
}

bool StreamCursor::OpenFile(const std::string& filename) {
	Close();
	LastStatus  = StoreResponse::OK;
	LineNumber  = 0;
	Description = filename == "-" ? "stdin" : filename;
	if (filename == "-") {
		Stream     = stdin;
		OwnsStream = false;
	} else {
		Stream     = fopen(filename.c_str(), "r");
		OwnsStream = true;
	}
	IsPipe = false;
	if (Stream == nullptr) {
		fprintf(stderr, "Failed to open %s: %s\n", filename.c_str(), strerror(errno));
		LastStatus = StoreResponse::FailOpen;
		return false;
	}
	return true;
}

bool StreamCursor::OpenCommand(const std::string& command, const std::string& description) {
	Close();
	LastStatus  = StoreResponse::OK;
	LineNumber  = 0;
	Description = description;
	Stream      = popen(command.c_str(), "r");
	OwnsStream  = true;
	IsPipe      = true;
	if (Stream == nullptr) {
		fprintf(stderr, "Failed to launch %s: %s\n", description.c_str(), strerror(errno));
		LastStatus = StoreResponse::FailOpen;
		return false;
	}
	return true;
}

void StreamCursor::Close() {
	if (Stream == nullptr)
		return;
	if (IsPipe) {
		int status = pclose(Stream);
		if (status != 0 && LastStatus == StoreResponse::OK) {
			int code = WIFEXITED(status) ? WEXITSTATUS(status) : status;
			fprintf(stderr, "%s failed with exit status %d\n", Description.c_str(), code);
			LastStatus = StoreResponse::FailQuery;
		}
	} else if (OwnsStream) {
		fclose(Stream);
	}
	Stream = nullptr;
	IsPipe = false;
}

bool StreamCursor::Next(Reading& r) {
	if (Stream == nullptr || LastStatus != StoreResponse::OK)
		return false;
	string line;
	while (ReadLine(Stream, line)) {
		LineNumber++;
		size_t i = 0;
		while (i < line.size() && isspace((unsigned char) line[i]))
			i++;
		if (i == line.size() || line[i] == '#')
			continue;
		if (!ParseReading(line.c_str() + i, r)) {
			fprintf(stderr, "%s line %d: can't parse reading [%s]\n", Description.c_str(), LineNumber, line.c_str());
			LastStatus = StoreResponse::BadRow;
			return false;
		}
		return true;
	}
	if (ferror(Stream)) {
		fprintf(stderr, "Error reading %s\n", Description.c_str());
		LastStatus = IsPipe ? StoreResponse::FailQuery : StoreResponse::FailOpen;
	}
	// Closing the pipe is what tells us whether the DB client succeeded
	Close();
	return false;
}

// This must match the table created by the capture program:
// APIV1ProductionInverters(LastReportDate TIMESTAMP, SerialNumber BIGINT, Watts SMALLINT)
std::string BuildQuerySQL(const Date& start, const Date& end) {
	string sql;
	sql += "SELECT LastReportDate, SerialNumber, Watts ";
	sql += "FROM APIV1ProductionInverters ";
	sql += "WHERE LastReportDate BETWEEN '" + start.ToString() + " 00:00:00' AND '" + end.ToString() + " 23:59:59' ";
	sql += "ORDER BY LastReportDate, SerialNumber";
	return sql;
}

std::string BuildQueryCommand(const Settings& s) {
	string sql = BuildQuerySQL(s.StartDate, s.EndDate);
	if (s.DBMode == DBModes::Postgres) {
		return "PGPASSWORD=" + s.PostgresPassword +
		       " psql" +
		       " --no-align --tuples-only --field-separator=," +
		       " --host " + s.PostgresHost +
		       " --username " + s.PostgresUsername +
		       " --dbname " + s.PostgresDB +
		       " --port " + s.PostgresPort +
		       " --command \"" + sql + "\"";
	}
	if (s.DBMode == DBModes::MySQL) {
		// mysql separates columns with tabs in batch mode, which ParseReading accepts
		return "MYSQL_PWD=" + s.MySQLPassword +
		       " mysql --batch --skip-column-names" +
		       " --host " + s.MySQLHost +
		       " --port " + s.MySQLPort +
		       " --user " + s.MySQLUsername +
		       " --database " + s.MySQLDB +
		       " --execute \"" + sql + "\"";
	}
	return "sqlite3 -readonly -batch -list -separator , \"" + s.SQLiteFilename + "\" \"" + sql + "\"";
}

std::unique_ptr<TelemetryCursor> OpenTelemetry(const Settings& s) {
	unique_ptr<StreamCursor> cursor(new StreamCursor());
	bool                     ok = false;
	switch (s.DBMode) {
	case DBModes::MySQL:
		ok = cursor->OpenCommand(BuildQueryCommand(s), "mysql " + s.MySQLUsername + "@" + s.MySQLHost + ":" + s.MySQLPort + "/" + s.MySQLDB);
		break;
	case DBModes::CSV:
		ok = cursor->OpenFile(s.CSVFilename);
		break;
	case DBModes::SQLite:
		ok = cursor->OpenCommand(BuildQueryCommand(s), "sqlite3 " + s.SQLiteFilename);
		break;
	case DBModes::Postgres:
		ok = cursor->OpenCommand(BuildQueryCommand(s), "psql " + s.PostgresUsername + "@" + s.PostgresHost + ":" + s.PostgresPort + "/" + s.PostgresDB);
		break;
	}
	if (!ok)
		return nullptr;
	return std::move(cursor);
}

} // namespace clipmeter
