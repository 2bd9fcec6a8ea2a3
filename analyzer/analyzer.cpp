#include <stdio.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include "analyzer.h"
#include "accountant.h"

using namespace std;

namespace clipmeter {

std::string DayLabel(const Date& day, int64_t device) {
	char buf[32];
	snprintf(buf, sizeof(buf), " SN%lld", (long long) device);
	return day.ToString() + buf;
}

std::string DayAnalysis::Label() const {
	return DayLabel(Day, Device);
}

DayAnalysis AnalyzeDay(const Date& day, int64_t device, const Series& series, const AnalysisParams& params, int cadenceSeconds) {
	DayAnalysis a;
	a.Day                = day;
	a.Device             = device;
	a.Result.GeneratedWs = HalveRounded(DoubledGeneratedEnergy(series));

	string label = a.Label();
	a.Gate       = InspectDay(label, series, params, cadenceSeconds);
	a.Status     = GateDay(a.Gate, params);
	if (a.Status != DayStatus::OK)
		return a;

	if (!FitEnvelope(label, series, params, a.Fit)) {
		a.Status = DayStatus::FitUndefined;
		return a;
	}
	if (!a.Fit.HasFinal) {
		// Too cloudy, and we're in Gated mode
		a.Status = DayStatus::TooCloudy;
		return a;
	}

	a.Fitted = true;
	a.Result = AccountEnergy(series, params.CeilingW, a.Fit.Final);
	return a;
}

std::vector<DayAnalysis> AnalyzeBatch(const DayBatch& batch, const AnalysisParams& params, int cadenceSeconds, int threads) {
	vector<int64_t>       devices;
	vector<const Series*> series;
	for (const auto& d : batch.Devices) {
		devices.push_back(d.first);
		series.push_back(&d.second);
	}

	size_t              n = devices.size();
	vector<DayAnalysis> results(n);
	if (threads <= 1 || n < 2) {
		for (size_t i = 0; i < n; i++)
			results[i] = AnalyzeDay(batch.Day, devices[i], *series[i], params, cadenceSeconds);
		return results;
	}

	// Device-days share no state, so the workers just pull the next index.
	// Each worker writes only to its own slots of results.
	atomic<size_t> next(0);
	auto           worker = [&]() {
		while (true) {
			size_t i = next++;
			if (i >= n)
				break;
			results[i] = AnalyzeDay(batch.Day, devices[i], *series[i], params, cadenceSeconds);
		}
	};
	size_t         nthreads = std::min((size_t) threads, n);
	vector<thread> workers;
	for (size_t i = 0; i < nthreads; i++)
		workers.push_back(thread(worker));
	for (auto& t : workers)
		t.join();
	return results;
}

} // namespace clipmeter
