#include "report.h"

using namespace std;

namespace clipmeter {

std::string FormatWh(double ws) {
	char buf[64];
	snprintf(buf, sizeof(buf), "%.2f", ws / 3600.0);
	return buf;
}

double Report::AverageWsPerDay() const {
	return Days == 0 ? 0 : (double) TotalGeneratedWs / (double) Days;
}

double Report::AverageWsPerDevice() const {
	return DeviceDays == 0 ? 0 : (double) TotalGeneratedWs / (double) DeviceDays;
}

void Report::BeginDay() {
	Days++;
}

void Report::Add(const DayAnalysis& a) {
	if (a.Failed()) {
		FailedDeviceDays++;
		return;
	}
	DeviceDays++;
	const auto& r = a.Result;
	TotalGeneratedWs += r.GeneratedWs;
	MaxGenerated.Offer(r.GeneratedWs, a.Device, a.Day);
	if (r.HasExceedance) {
		TotalExceedWs += r.ExceedanceWs;
		MaxExceedance.Offer(r.ExceedanceWs, a.Device, a.Day);
	}
	if (r.HasShaved) {
		TotalShavedWs += r.ShavedWs;
		MaxShaved.Offer(r.ShavedWs, a.Device, a.Day);
	}
}

std::string Report::FormatDetail(const DayAnalysis& a) {
	string s = a.Label() + " " + FormatWh(a.Result.GeneratedWs) + "Whr generated";
	if (a.Result.HasExceedance)
		s += ", " + FormatWh(a.Result.ExceedanceWs) + "Whr exceedance";
	if (a.Result.HasShaved)
		s += ", " + FormatWh(a.Result.ShavedWs) + "Whr shaved";
	if (a.Failed())
		s += " (analysis failed)";
	return s;
}

void Report::PrintSummary(FILE* f) const {
	double devicesPerDay = Days == 0 ? 0 : (double) DeviceDays / (double) Days;
	fprintf(f, "Processed %d days of data for %.2f inverters with a total output of %sWhr.\n", Days, devicesPerDay, FormatWh(TotalGeneratedWs).c_str());
	if (FailedDeviceDays != 0)
		fprintf(f, "Failed to analyze %d inverter days.\n", FailedDeviceDays);
	if (Days != 0 && DeviceDays != 0) {
		fprintf(f, "Average generated power per day: %sWhr (%sWhr per inverter)\n",
		        FormatWh(AverageWsPerDay()).c_str(), FormatWh(AverageWsPerDevice()).c_str());
	}
	fprintf(f, "Maximum inverter power: %sWhr (by SN%lld on %s)\n", FormatWh(MaxGenerated.Ws).c_str(), (long long) MaxGenerated.Device, MaxGenerated.Day.ToString().c_str());
	fprintf(f, "Total exceedance power: %sWhr\n", FormatWh(TotalExceedWs).c_str());
	fprintf(f, "Maximum exceedance power: %sWhr (by SN%lld on %s)\n", FormatWh(MaxExceedance.Ws).c_str(), (long long) MaxExceedance.Device, MaxExceedance.Day.ToString().c_str());
	fprintf(f, "Total shaved power: %sWhr\n", FormatWh(TotalShavedWs).c_str());
	fprintf(f, "Maximum shaved power: %sWhr (by SN%lld on %s)\n", FormatWh(MaxShaved.Ws).c_str(), (long long) MaxShaved.Device, MaxShaved.Day.ToString().c_str());
	if (TotalGeneratedWs != 0)
		fprintf(f, "Shave ratio: %.2f%% (total shaved power / total generated power)\n", 100.0 * (double) TotalShavedWs / (double) TotalGeneratedWs);
}

} // namespace clipmeter
