#include <stdio.h>
#include <ctype.h>
#include "timeUtils.h"

using namespace std;

namespace clipmeter {

bool IsLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
	static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12)
		return 0;
	if (month == 2 && IsLeapYear(year))
		return 29;
	return days[month - 1];
}

bool Date::IsValid() const {
	return Year >= 1 && Year <= 9999 && Month >= 1 && Month <= 12 && Day >= 1 && Day <= DaysInMonth(Year, Month);
}

string Date::ToString() const {
	char buf[32];
	snprintf(buf, sizeof(buf), "%04d-%02d-%02d", Year, Month, Day);
	return buf;
}

// Reads exactly n digits
static bool ReadDigits(const char*& s, int n, int& out) {
	out = 0;
	for (int i = 0; i < n; i++) {
		if (!isdigit((unsigned char) s[i]))
			return false;
		out = out * 10 + (s[i] - '0');
	}
	s += n;
	return true;
}

static bool ReadDate(const char*& s, Date& out) {
	Date d;
	if (!ReadDigits(s, 4, d.Year) || *s++ != '-')
		return false;
	if (!ReadDigits(s, 2, d.Month) || *s++ != '-')
		return false;
	if (!ReadDigits(s, 2, d.Day))
		return false;
	if (!d.IsValid())
		return false;
	out = d;
	return true;
}

bool Date::Parse(const char* s, Date& out) {
	const char* p = s;
	if (!ReadDate(p, out))
		return false;
	return *p == 0;
}

string Timestamp::ToString() const {
	return Day.ToString() + " " + SecondsToTime(Seconds);
}

int Timestamp::Parse(const char* s, Timestamp& out) {
	const char* p = s;
	Date        day;
	if (!ReadDate(p, day))
		return 0;
	if (*p != ' ' && *p != 'T')
		return 0;
	p++;
	int hour, minute, second;
	if (!ReadDigits(p, 2, hour) || *p++ != ':')
		return 0;
	if (!ReadDigits(p, 2, minute) || *p++ != ':')
		return 0;
	if (!ReadDigits(p, 2, second))
		return 0;
	if (hour > 23 || minute > 59 || second > 59)
		return 0;
	if (*p == '.') {
		p++;
		while (isdigit((unsigned char) *p))
			p++;
	}
	out.Day     = day;
	out.Seconds = hour * 3600 + minute * 60 + second;
	return (int) (p - s);
}

string SecondsToTime(int secs) {
	secs = Clamp(secs, 0, SecondsPerDay - 1);
	char buf[16];
	snprintf(buf, sizeof(buf), "%02d:%02d:%02d", secs / 3600, (secs / 60) % 60, secs % 60);
	return buf;
}

} // namespace clipmeter
