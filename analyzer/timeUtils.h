#pragma once

#include <stdint.h>
#include <string>

namespace clipmeter {

template <typename T>
T Clamp(T v, T vmin, T vmax) {
	if (v < vmin)
		return vmin;
	if (v > vmax)
		return vmax;
	return v;
}

const int SecondsPerDay = 24 * 3600;

bool IsLeapYear(int year);
int  DaysInMonth(int year, int month);

// Calendar date in local time. There is no timezone attached, because the telemetry
// store records local wall-clock time, and the analysis is per local day.
struct Date {
	int Year  = 1;
	int Month = 1;
	int Day   = 1;
	Date(int year = 1, int month = 1, int day = 1) : Year(year), Month(month), Day(day) {}
	bool operator<(const Date& b) const {
		return Key() < b.Key();
	}
	bool operator<=(const Date& b) const {
		return Key() <= b.Key();
	}
	bool operator>(const Date& b) const {
		return Key() > b.Key();
	}
	bool operator>=(const Date& b) const {
		return Key() >= b.Key();
	}
	bool operator==(const Date& b) const {
		return Key() == b.Key();
	}
	bool operator!=(const Date& b) const {
		return !(*this == b);
	}

	// Sortable integer, eg 20240601
	int Key() const {
		return Year * 10000 + Month * 100 + Day;
	}

	bool        IsValid() const;
	std::string ToString() const; // YYYY-MM-DD

	// Parse YYYY-MM-DD. Trailing characters are not allowed.
	static bool Parse(const char* s, Date& out);
};

// A local date plus the seconds past midnight
struct Timestamp {
	clipmeter::Date Day;
	int             Seconds = 0; // 0 .. 86399

	Timestamp() {}
	Timestamp(const clipmeter::Date& day, int seconds) : Day(day), Seconds(seconds) {}

	bool operator==(const Timestamp& b) const {
		return Day == b.Day && Seconds == b.Seconds;
	}
	bool operator!=(const Timestamp& b) const {
		return !(*this == b);
	}
	bool operator<(const Timestamp& b) const {
		return Day < b.Day || (Day == b.Day && Seconds < b.Seconds);
	}

	std::string ToString() const; // YYYY-MM-DD HH:MM:SS

	// Parse "YYYY-MM-DD HH:MM:SS" (a 'T' separator is also accepted, and fractional
	// seconds are truncated). Returns the number of characters consumed, or 0 on failure.
	static int Parse(const char* s, Timestamp& out);
};

// Format seconds past midnight as HH:MM:SS
std::string SecondsToTime(int secs);

} // namespace clipmeter
