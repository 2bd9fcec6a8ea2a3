#include <string.h>
#include "types.h"

namespace clipmeter {

const char* StrictnessToString(Strictness v) {
	switch (v) {
	case Strictness::Forced: return "Forced";
	case Strictness::Gated: return "Gated";
	}
	return "INVALID";
}

const char* DayStatusToString(DayStatus v) {
	switch (v) {
	case DayStatus::OK: return "OK";
	case DayStatus::NoExceedance: return "NoExceedance";
	case DayStatus::StartupPowerTooHigh: return "StartupPowerTooHigh";
	case DayStatus::InsufficientData: return "InsufficientData";
	case DayStatus::ShutdownPowerTooHigh: return "ShutdownPowerTooHigh";
	case DayStatus::TooCloudy: return "TooCloudy";
	case DayStatus::FitUndefined: return "FitUndefined";
	}
	return "INVALID";
}

bool ParseStrictness(const char* s, Strictness& out) {
	if (strcmp(s, "Forced") == 0) {
		out = Strictness::Forced;
		return true;
	}
	if (strcmp(s, "Gated") == 0) {
		out = Strictness::Gated;
		return true;
	}
	return false;
}

} // namespace clipmeter
