#include <iostream>
#include <stdio.h>
#include <assert.h>
#include <math.h>
#include <cmath>
#include <time.h>
#include <algorithm>
#include <unistd.h>
#include "timeUtils.h"
#include "telemetry.h"
#include "reconstructor.h"
#include "qualityGate.h"
#include "curveFit.h"
#include "accountant.h"
#include "analyzer.h"
#include "report.h"
#include "diagnostics.h"
#include "dedup.h"
#include "settings.h"

// For debugging:
// ./build/clipmeter-test

using namespace std;
using namespace clipmeter;

template <typename T>
void AssertEqualPrecision(T expected, T actual, T precision) {
	if (std::abs(expected - actual) > precision) {
		printf("Expected:\n  ");
		cout << expected << endl;
		printf("Actual:\n  ");
		cout << actual << endl;
		assert(false);
	}
}

template <typename T>
void AssertEqual(T expected, T actual) {
	if (expected != actual) {
		printf("Expected:\n  ");
		cout << expected << endl;
		printf("Actual:\n  ");
		cout << actual << endl;
		assert(false);
	}
}

void AssertStatus(DayStatus expected, DayStatus actual) {
	AssertEqual<string>(DayStatusToString(expected), DayStatusToString(actual));
}

void AssertSeriesEqual(const Series& expected, const Series& actual) {
	AssertEqual(expected.size(), actual.size());
	for (size_t i = 0; i < expected.size(); i++) {
		AssertEqual(expected[i].Offset, actual[i].Offset);
		AssertEqual(expected[i].Watts, actual[i].Watts);
	}
}

// VectorCursor replays readings from memory. If FailAtEnd is set, the stream ends with a bad row.
class VectorCursor : public TelemetryCursor {
public:
	vector<Reading> Readings;
	bool            FailAtEnd = false;
	size_t          Pos       = 0;

	bool Next(Reading& r) override {
		if (Pos == Readings.size()) {
			if (FailAtEnd)
				LastStatus = StoreResponse::BadRow;
			return false;
		}
		r = Readings[Pos++];
		return true;
	}

	void Add(const Date& day, int seconds, int64_t device, int watts) {
		Reading r;
		r.Time   = Timestamp(day, seconds);
		r.Device = device;
		r.Watts  = watts;
		Readings.push_back(r);
	}
};

// A clear day: peakW - k * (t - noon)^2, sampled every 331 seconds from 05:00 until the
// curve returns to zero in the afternoon. Output is clipped at clipW.
Series MakeClearDay(double peakW, double k, int clipW) {
	Series s;
	for (int t = 18000; t < SecondsPerDay; t += 331) {
		double d     = t - 43200;
		double w     = peakW - k * d * d;
		int    watts = (int) lround(std::max(0.0, w));
		watts        = std::min(watts, clipW);
		s.push_back(Sample(t, watts));
		if (t > 43200 && watts == 0)
			break;
	}
	return s;
}

void TestDates() {
	Date d;
	assert(Date::Parse("2024-02-29", d));
	AssertEqual(2024, d.Year);
	AssertEqual(2, d.Month);
	AssertEqual(29, d.Day);
	assert(!Date::Parse("2023-02-29", d));
	assert(!Date::Parse("2024-1-2", d));
	assert(!Date::Parse("2024-01-02x", d));
	AssertEqual<string>("2024-01-02", Date(2024, 1, 2).ToString());
	assert(Date(2024, 1, 31) < Date(2024, 2, 1));

	Timestamp t;
	AssertEqual(19, Timestamp::Parse("2024-06-01 10:15:31", t));
	AssertEqual(36931, t.Seconds);
	AssertEqual(26, Timestamp::Parse("2024-06-01T10:15:31.123456", t));
	AssertEqual(36931, t.Seconds);
	AssertEqual(0, Timestamp::Parse("2024-06-01 25:15:31", t));
	AssertEqual<string>("10:15:31", SecondsToTime(36931));
}

void TestParseReading() {
	Reading r;
	assert(ParseReading("2024-06-01 10:15:31,121934012345,245", r));
	assert(r.Time.Day == Date(2024, 6, 1));
	AssertEqual(36931, r.Time.Seconds);
	AssertEqual<int64_t>(121934012345, r.Device);
	AssertEqual(245, r.Watts);
	AssertEqual<string>("2024-06-01 10:15:31,121934012345,245", FormatReading(r));

	assert(ParseReading("2024-06-01 10:15:31,12,5\r\n", r));
	AssertEqual(5, r.Watts);

	assert(!ParseReading("2024-06-01 10:15:31,12,-5", r));
	assert(!ParseReading("2024-06-01 10:15:31,12", r));
	assert(!ParseReading("2024-06-01 10:15:31,12,5,6", r));
	assert(!ParseReading("garbage", r));
	assert(!ParseReading("", r));
}

void TestStreamCursor() {
	char filename[64];
	snprintf(filename, sizeof(filename), "/tmp/clipmeter-test-%d.csv", (int) getpid());
	FILE* f = fopen(filename, "w");
	assert(f != nullptr);
	fprintf(f, "# LastReportDate,SerialNumber,Watts\n");
	fprintf(f, "\n");
	fprintf(f, "2024-06-01 10:00:00,7,120\n");
	fprintf(f, "  \n");
	fprintf(f, "2024-06-01 10:05:31,7,125\n");
	fprintf(f, "2024-06-01 10:11:02,7,oops\n");
	fprintf(f, "2024-06-01 10:16:33,7,130\n");
	fclose(f);

	{
		StreamCursor c;
		assert(c.OpenFile(filename));
		Reading r;
		assert(c.Next(r));
		AssertEqual(36000, r.Time.Seconds);
		AssertEqual(120, r.Watts);
		assert(c.Next(r));
		AssertEqual(125, r.Watts);
		assert(!c.Next(r));
		assert(c.Status() == StoreResponse::BadRow);
		// The stream stays stopped
		assert(!c.Next(r));
	}
	unlink(filename);

	{
		StreamCursor c;
		assert(!c.OpenFile(filename));
		assert(c.Status() == StoreResponse::FailOpen);
	}
	{
		// Rows from a client command
		StreamCursor c;
		assert(c.OpenCommand("printf '2024-06-01 10:00:00\\t7\\t120\\n'", "printf"));
		Reading r;
		assert(c.Next(r));
		AssertEqual<int64_t>(7, r.Device);
		AssertEqual(120, r.Watts);
		assert(!c.Next(r));
		assert(c.Status() == StoreResponse::OK);
	}
	{
		// A client that fails is only noticed when the pipe is closed
		StreamCursor c;
		assert(c.OpenCommand("false", "false"));
		Reading r;
		assert(!c.Next(r));
		assert(c.Status() == StoreResponse::FailQuery);
	}
}

void TestGapReconstruction() {
	{
		// A gap of 1000 seconds at a cadence of 331 is 3 intervals
		Series s;
		assert(AppendReading(s, 1000, 50, 331));
		assert(AppendReading(s, 2000, 80, 331));
		Series expect = {Sample(1000, 50), Sample(1333, 50), Sample(1667, 50), Sample(2000, 80)};
		AssertSeriesEqual(expect, s);
	}
	{
		// 496 seconds is not more than 1.5 x cadence
		Series s;
		AppendReading(s, 1000, 50, 331);
		AppendReading(s, 1496, 60, 331);
		AssertEqual<size_t>(2, s.size());

		// 497 seconds is, and the gap is filled with one sample. 248.5 rounds to even.
		s.clear();
		AppendReading(s, 1000, 50, 331);
		AppendReading(s, 1497, 60, 331);
		Series expect = {Sample(1000, 50), Sample(1248, 50), Sample(1497, 60)};
		AssertSeriesEqual(expect, s);
	}
	{
		// 750 seconds at a cadence of 300 is 2.5 intervals, which rounds to 2
		Series s;
		AppendReading(s, 0, 10, 300);
		AppendReading(s, 750, 20, 300);
		Series expect = {Sample(0, 10), Sample(375, 10), Sample(750, 20)};
		AssertSeriesEqual(expect, s);
	}
	{
		// Offsets must increase
		Series s;
		AppendReading(s, 1000, 50, 331);
		assert(!AppendReading(s, 1000, 60, 331));
		assert(!AppendReading(s, 900, 60, 331));
		AssertEqual<size_t>(1, s.size());
	}
	{
		// Every synthetic interval is within a second of the others
		Series s;
		AppendReading(s, 0, 10, 331);
		AppendReading(s, 3000, 10, 331);
		for (size_t i = 1; i < s.size(); i++) {
			int gap = s[i].Offset - s[i - 1].Offset;
			assert(gap == 333 || gap == 334);
		}
	}
}

void TestReconstructor() {
	Date day1(2024, 6, 1);
	Date day2(2024, 6, 2);
	{
		// Date rollover
		VectorCursor c;
		c.Add(day1, 3600, 1, 10);
		c.Add(day1, 3600, 2, 20);
		c.Add(day1, 3931, 1, 11);
		c.Add(day2, 3600, 1, 30);
		Reconstructor rec(&c);
		DayBatch      batch;
		assert(rec.NextDay(batch));
		assert(batch.Day == day1);
		AssertEqual<size_t>(2, batch.Devices.size());
		AssertEqual<size_t>(2, batch.Devices[1].size());
		AssertEqual<size_t>(1, batch.Devices[2].size());
		assert(rec.NextDay(batch));
		assert(batch.Day == day2);
		AssertEqual<size_t>(1, batch.Devices.size());
		AssertEqual(30, batch.Devices[1][0].Watts);
		assert(!rec.NextDay(batch));
		assert(rec.Status() == StoreResponse::OK);
	}
	{
		// Out of order readings are dropped
		VectorCursor c;
		c.Add(day1, 1000, 1, 10);
		c.Add(day1, 2000, 1, 20);
		c.Add(day1, 1500, 1, 30);
		c.Add(day1, 2300, 1, 40);
		Reconstructor rec(&c);
		DayBatch      batch;
		assert(rec.NextDay(batch));
		Series expect = {Sample(1000, 10), Sample(1333, 10), Sample(1667, 10), Sample(2000, 20), Sample(2300, 40)};
		AssertSeriesEqual(expect, batch.Devices[1]);
		AssertEqual(1, rec.NumDropped());
	}
	{
		// A reading from an earlier day is dropped, instead of splitting the current day in two
		Date         later(2026, 10, 19);
		VectorCursor c;
		c.Add(day1, 1000, 1, 10);
		c.Add(later, 1000, 1, 20);
		c.Add(day1, 1331, 1, 30);
		c.Add(later, 1331, 1, 40);
		Reconstructor rec(&c);
		DayBatch      batch;
		assert(rec.NextDay(batch));
		assert(batch.Day == day1);
		AssertEqual<size_t>(1, batch.Devices[1].size());
		assert(rec.NextDay(batch));
		assert(batch.Day == later);
		AssertEqual<size_t>(2, batch.Devices[1].size());
		assert(!rec.NextDay(batch));
		AssertEqual(1, rec.NumDropped());
	}
	{
		// A day cut short by a store error is not returned
		VectorCursor c;
		c.Add(day1, 1000, 1, 10);
		c.Add(day2, 1000, 1, 10);
		c.Add(day2, 2000, 1, 10);
		c.FailAtEnd = true;
		Reconstructor rec(&c);
		DayBatch      batch;
		assert(rec.NextDay(batch));
		assert(batch.Day == day1);
		assert(!rec.NextDay(batch));
		assert(rec.Status() == StoreResponse::BadRow);
	}
}

void TestQualityGate() {
	// 10 samples is too few to analyze, but we still know how much energy was generated
	int    watts[10] = {0, 100, 200, 300, 360, 360, 300, 200, 100, 0};
	Series s;
	for (int i = 0; i < 10; i++)
		s.push_back(Sample(i * 331, watts[i]));
	AnalysisParams p;
	auto           a = AnalyzeDay(Date(2024, 6, 1), 1, s, p, 331);
	AssertStatus(DayStatus::InsufficientData, a.Status);
	AssertEqual<int64_t>(635520, a.Result.GeneratedWs);
	assert(!a.Result.HasExceedance);
	assert(!a.Result.HasShaved);
	assert(!a.Fitted);
	AssertEqual(2, a.Gate.NumAtCeiling);
	AssertEqual(331, a.Gate.AvgGap);

	// Startup and shutdown checks
	Series high = MakeClearDay(300, 300.0 / (21600.0 * 21600.0), 349);
	high.front().Watts = 50;
	auto r             = InspectDay("test", high, p, 331);
	assert(r.StartupTooHigh);
	AssertStatus(DayStatus::StartupPowerTooHigh, GateDay(r, p));
	high.front().Watts = 0;
	high.back().Watts  = 1;
	r                  = InspectDay("test", high, p, 331);
	AssertStatus(DayStatus::ShutdownPowerTooHigh, GateDay(r, p));

	// A wide gap is only a warning
	Series gappy = MakeClearDay(300, 300.0 / (21600.0 * 21600.0), 349);
	gappy.erase(gappy.begin() + 20, gappy.begin() + 23);
	r = InspectDay("test", gappy, p, 331);
	AssertEqual(331, r.MinGap);
	AssertEqual(4 * 331, r.MaxGap);
	assert(r.MaxGap * 2 > r.AvgGap * 3);
	assert(r.Passed());

	// Forced mode ignores the checks, but a day without exceedance is still not fitted
	p.Mode = Strictness::Forced;
	AssertStatus(DayStatus::NoExceedance, GateDay(r, p));
	p.SkipFitWithoutExceedance = false;
	AssertStatus(DayStatus::OK, GateDay(r, p));
}

void TestCrossing() {
	AssertEqualPrecision(50.0, DoubledIntervalExceedance(0, 90, 10, 110, 100), 1e-9);
	AssertEqualPrecision(50.0, DoubledIntervalExceedance(0, 110, 10, 90, 100), 1e-9);
	AssertEqualPrecision(300.0, DoubledIntervalExceedance(0, 110, 10, 120, 100), 1e-9);
	AssertEqualPrecision(0.0, DoubledIntervalExceedance(0, 50, 10, 99, 100), 1e-9);
	AssertEqual<int64_t>(25, HalveRounded(50));
	AssertEqual<int64_t>(3, HalveRounded(5));
}

void TestAccountant() {
	{
		Series   s = {Sample(0, 0), Sample(10, 90), Sample(20, 110), Sample(30, 90), Sample(40, 0)};
		FitCurve fit;
		fit.Coef[0]   = 130;
		fit.DomainMin = 0;
		fit.DomainMax = 40;
		auto r        = AccountEnergy(s, 100, fit);
		AssertEqual<int64_t>(2900, r.GeneratedWs);
		assert(r.HasExceedance);
		AssertEqual<int64_t>(50, r.ExceedanceWs);
		assert(r.HasShaved);
		AssertEqual<int64_t>(175, r.ShavedWs);
	}
	{
		// Nothing reached the ceiling
		Series   s = {Sample(0, 0), Sample(10, 348), Sample(20, 0)};
		FitCurve fit;
		fit.Coef[0]   = 349;
		fit.DomainMax = 20;
		auto r        = AccountEnergy(s, 349, fit);
		assert(!r.HasExceedance);
		assert(!r.HasShaved);

		// Touching the ceiling means there is exceedance, even if it is zero
		s[1].Watts = 349;
		r          = AccountEnergy(s, 349, fit);
		assert(r.HasExceedance);
		AssertEqual<int64_t>(0, r.ExceedanceWs);
		assert(!r.HasShaved);
	}
}

void TestFitQuadratic() {
	vector<double> x, y;
	for (int i = 0; i <= 10; i++) {
		double v = i * 10;
		x.push_back(v);
		y.push_back(2 + 3 * v - 0.01 * v * v);
	}
	FitCurve a, b;
	assert(FitQuadratic(x, y, a));
	assert(FitQuadratic(x, y, b));
	for (int i = 0; i < 3; i++)
		AssertEqual(a.Coef[i], b.Coef[i]);
	AssertEqualPrecision(127.0, a(50), 1e-6);
	AssertEqualPrecision(2.0, a(0), 1e-6);
	AssertEqualPrecision(202.0, a(100), 1e-6);
	double peakOffset, peakWatts;
	assert(a.Peak(peakOffset, peakWatts));
	AssertEqualPrecision(150.0, peakOffset, 1e-6);
	AssertEqualPrecision(227.0, peakWatts, 1e-6);

	// Degenerate inputs
	FitCurve c;
	assert(!FitQuadratic({1, 2}, {1, 2}, c));
	assert(!FitQuadratic({5, 5, 5, 5}, {1, 2, 3, 4}, c));
	assert(!FitQuadratic({1, 1, 2, 2}, {1, 2, 3, 4}, c));
}

void TestCloudRejection() {
	AnalysisParams p;
	Series         s = MakeClearDay(300, 300.0 / (21600.0 * 21600.0), 1000);
	vector<size_t> dips;
	for (size_t i = 0; i < s.size(); i++) {
		if (s[i].Watts > 200 && i % 7 == 0) {
			s[i].Watts /= 2;
			dips.push_back(i);
		}
	}
	assert(dips.size() > 3);

	EnvelopeFit fit;
	assert(FitEnvelope("test", s, p, fit));
	assert(fit.HasFinal);
	assert(!fit.TooCloudy);
	AssertEqualPrecision(300.0, fit.Final(43200), 1.5);
	int numCloudy = 0;
	for (size_t i = 0; i < s.size(); i++)
		numCloudy += fit.CloudyFinal[i] ? 1 : 0;
	AssertEqual((int) dips.size(), numCloudy);
	for (auto i : dips) {
		assert(fit.Cloudy2[i]);
		assert(fit.CloudyFinal[i]);
	}

	auto classes = ClassifySamples(s, fit.Cloudy2, p);
	AssertEqual<string>("low", SampleClassToString(classes[0]));
	AssertEqual<string>("cloudy", SampleClassToString(classes[dips[0]]));

	// Not enough normal points left. Gated mode gives up before the final fit.
	p.MinFitSamples            = 1000;
	p.SkipFitWithoutExceedance = false;
	auto a                     = AnalyzeDay(Date(2024, 6, 1), 1, s, p, 331);
	AssertStatus(DayStatus::TooCloudy, a.Status);
	assert(a.Fit.TooCloudy);
	assert(!a.Fitted);
	assert(!a.Result.HasShaved);

	// Forced mode fits anyway
	p.Mode = Strictness::Forced;
	a      = AnalyzeDay(Date(2024, 6, 1), 1, s, p, 331);
	AssertStatus(DayStatus::OK, a.Status);
	assert(a.Fit.TooCloudy);
	assert(a.Fit.HasFinal);
	assert(a.Fitted);
}

void TestFitUndefined() {
	AnalysisParams p;
	p.Mode   = Strictness::Forced;
	Series s = {Sample(0, 0), Sample(331, 100), Sample(662, 400), Sample(993, 100), Sample(1324, 0)};
	auto   a = AnalyzeDay(Date(2024, 6, 1), 9, s, p, 331);
	AssertStatus(DayStatus::FitUndefined, a.Status);
	assert(a.Failed());
	AssertEqual(1, a.Fit.UndefinedPass);
	AssertEqual<int64_t>(331 * 600, a.Result.GeneratedWs);

	Report rep;
	rep.BeginDay();
	rep.Add(a);
	AssertEqual(1, rep.FailedDeviceDays);
	AssertEqual(0, rep.DeviceDays);
	AssertEqual<int64_t>(0, rep.TotalGeneratedWs);

	// In Gated mode, a day where everything is clipped has nothing to fit. That is too cloudy,
	// not a failure, and the generated energy still counts.
	Series clipped;
	clipped.push_back(Sample(0, 0));
	for (int i = 1; i <= 58; i++)
		clipped.push_back(Sample(i * 331, 400));
	clipped.push_back(Sample(59 * 331, 0));
	AnalysisParams gated;
	auto           g = AnalyzeDay(Date(2024, 6, 1), 10, clipped, gated, 331);
	AssertStatus(DayStatus::TooCloudy, g.Status);
	assert(!g.Failed());
	assert(g.Fit.TooCloudy);
	AssertEqual(1, g.Fit.UndefinedPass);
	AssertEqual<int64_t>(7679200, g.Result.GeneratedWs);
	assert(!g.Result.HasExceedance);
	rep.Add(g);
	AssertEqual(1, rep.DeviceDays);
	AssertEqual<int64_t>(7679200, rep.TotalGeneratedWs);

	// Forced mode gives up on the same day
	gated.Mode = Strictness::Forced;
	AssertStatus(DayStatus::FitUndefined, AnalyzeDay(Date(2024, 6, 1), 10, clipped, gated, 331).Status);
}

// Store a dense day through the deduplicator, read it back through the reconstructor, and analyze it
void TestEndToEnd() {
	const double k     = 5e-6;
	Series       dense = MakeClearDay(3000, k, 2500);
	Date         day(2024, 6, 1);

	ReadingDeduplicator dedup;
	VectorCursor        c;
	for (const auto& s : dense) {
		Timestamp storeTime;
		auto      d = dedup.Offer(7, Timestamp(day, s.Offset), s.Watts, Timestamp(day, 86000), storeTime);
		if (d == ReadingDeduplicator::Decision::Store)
			c.Add(day, storeTime.Seconds, 7, s.Watts);
	}
	assert(c.Readings.size() < dense.size());

	Reconstructor rec(&c);
	DayBatch      batch;
	assert(rec.NextDay(batch));
	AssertSeriesEqual(dense, batch.Devices[7]);
	assert(!rec.NextDay(batch));

	AnalysisParams p;
	p.CeilingW = 2500;
	auto a     = AnalyzeDay(day, 7, batch.Devices[7], p, 331);
	AssertStatus(DayStatus::OK, a.Status);
	assert(a.Fitted);
	assert(!a.Fit.TooCloudy);
	AssertEqualPrecision(3000.0, a.Fit.Final(43200), 3.0);
	assert(a.Result.HasExceedance);
	AssertEqual<int64_t>(0, a.Result.ExceedanceWs);
	assert(a.Result.HasShaved);

	// Area of the parabola above 2500 W: 500 * 20000 - k * 2 * 10000^3 / 3
	double analytic = 500.0 * 20000.0 - k * 2.0 * 1e12 / 3.0;
	AssertEqualPrecision(analytic, (double) a.Result.ShavedWs, analytic * 0.01);

	// Diagnostics
	auto j = DiagnosticsToJSON(a, batch.Devices[7], p);
	AssertEqual<string>("OK", j["Status"].get<string>());
	AssertEqual(dense.size(), j["Samples"].size());
	AssertEqual<string>("low", j["Samples"][0]["Class"].get<string>());
	assert(j.contains("BestFit"));
	assert(j.contains("CloudLimit1"));
	assert(j.contains("FirstExceedance"));
	assert(j["ShavedWh"].is_number());
	AssertEqual<string>("2024-06-01_SN7.json", DiagnosticsFilename(a));
	assert(!WriteDiagnostics("/nonexistent/clipmeter", a, batch.Devices[7], p));
}

void TestDedup() {
	typedef ReadingDeduplicator::Decision Decision;
	Date                                  d1(2024, 6, 1);
	Date                                  d2(2024, 6, 2);
	ReadingDeduplicator                   dedup;
	Timestamp                             st;
	Timestamp                             now(d1, 800);

	AssertEqual<string>("Store", DedupDecisionToString(dedup.Offer(1, Timestamp(d1, 100), 10, now, st)));
	assert(st == Timestamp(d1, 100));
	AssertEqual<string>("Resend", DedupDecisionToString(dedup.Offer(1, Timestamp(d1, 100), 10, now, st)));
	AssertEqual<string>("Unchanged", DedupDecisionToString(dedup.Offer(1, Timestamp(d1, 431), 10, now, st)));
	AssertEqual<string>("Store", DedupDecisionToString(dedup.Offer(1, Timestamp(d1, 762), 20, now, st)));
	assert(st == Timestamp(d1, 762));
	assert(dedup.Offer(1, Timestamp(d1, 762), 25, now, st) == Decision::ConflictingResend);
	assert(st == now);
	// First reading of a new day is always stored
	assert(dedup.Offer(1, Timestamp(d2, 100), 25, now, st) == Decision::Store);
	assert(st == Timestamp(d2, 100));
	assert(dedup.Offer(2, Timestamp(d2, 100), 25, now, st) == Decision::Store);
	AssertEqual<size_t>(2, dedup.NumDevices());

	// Historical data: a conflicting resend stays inside its own day, right after the original
	ReadingDeduplicator offline;
	assert(offline.OfferOffline(1, Timestamp(d1, 1000), 10, st) == Decision::Store);
	assert(offline.OfferOffline(1, Timestamp(d1, 1000), 12, st) == Decision::ConflictingResend);
	assert(st == Timestamp(d1, 1001));
	assert(offline.OfferOffline(1, Timestamp(d1, 86399), 20, st) == Decision::Store);
	assert(offline.OfferOffline(1, Timestamp(d1, 86399), 21, st) == Decision::ConflictingResend);
	assert(st == Timestamp(d1, 86399));
}

void TestShouldEmit() {
	DayAnalysis a;
	assert(!ShouldEmit(VisualizationFilter::All, 0, a));
	a.Fitted = true;
	assert(ShouldEmit(VisualizationFilter::All, 0, a));
	assert(ShouldEmit(VisualizationFilter::GoodData, 0, a));
	assert(ShouldEmit(VisualizationFilter::NotCloudy, 0, a));
	assert(!ShouldEmit(VisualizationFilter::None, 0, a));
	a.Fit.TooCloudy = true;
	assert(!ShouldEmit(VisualizationFilter::NotCloudy, 0, a));
	a.Gate.TooFewSamples = true;
	assert(!ShouldEmit(VisualizationFilter::GoodData, 0, a));

	assert(!ShouldEmit(VisualizationFilter::Exceedance, 0, a));
	a.Result.HasExceedance = true;
	a.Result.ExceedanceWs  = 3600;
	assert(ShouldEmit(VisualizationFilter::Exceedance, 1.0, a));
	assert(!ShouldEmit(VisualizationFilter::Exceedance, 2.0, a));
	assert(!ShouldEmit(VisualizationFilter::Shaved, 0, a));
	a.Result.HasShaved = true;
	a.Result.ShavedWs  = 7200;
	assert(ShouldEmit(VisualizationFilter::Shaved, 2.0, a));
}

DayAnalysis MakeResult(int64_t device, int64_t gen, bool hasExc, int64_t exc, bool hasShaved, int64_t shaved) {
	DayAnalysis a;
	a.Day                  = Date(2024, 6, 1);
	a.Device               = device;
	a.Result.GeneratedWs   = gen;
	a.Result.HasExceedance = hasExc;
	a.Result.ExceedanceWs  = exc;
	a.Result.HasShaved     = hasShaved;
	a.Result.ShavedWs      = shaved;
	return a;
}

void TestReport() {
	Report rep;
	rep.BeginDay();
	auto a1 = MakeResult(7, 7200, true, 3600, true, 1800);
	auto a2 = MakeResult(8, 3600, false, 0, false, 0);
	auto a3 = MakeResult(9, 1000, false, 0, false, 0);
	a3.Status = DayStatus::FitUndefined;
	rep.Add(a1);
	rep.Add(a2);
	rep.Add(a3);
	AssertEqual(1, rep.Days);
	AssertEqual(2, rep.DeviceDays);
	AssertEqual(1, rep.FailedDeviceDays);
	AssertEqual<int64_t>(10800, rep.TotalGeneratedWs);
	AssertEqual<int64_t>(3600, rep.TotalExceedWs);
	AssertEqual<int64_t>(1800, rep.TotalShavedWs);
	AssertEqual<int64_t>(7200, rep.MaxGenerated.Ws);
	AssertEqual<int64_t>(7, rep.MaxGenerated.Device);
	AssertEqual<int64_t>(7, rep.MaxShaved.Device);
	AssertEqualPrecision(10800.0, rep.AverageWsPerDay(), 1e-9);
	AssertEqualPrecision(5400.0, rep.AverageWsPerDevice(), 1e-9);

	// Averages are not truncated to whole watt-seconds
	Report odd;
	odd.BeginDay();
	odd.BeginDay();
	odd.Add(MakeResult(7, 10801, false, 0, false, 0));
	AssertEqualPrecision(5400.5, odd.AverageWsPerDay(), 1e-9);
	AssertEqualPrecision(10801.0, odd.AverageWsPerDevice(), 1e-9);
	AssertEqualPrecision(0.0, Report().AverageWsPerDay(), 0.0);

	AssertEqual<string>("2024-06-01 SN7 2.00Whr generated, 1.00Whr exceedance, 0.50Whr shaved", Report::FormatDetail(a1));
	AssertEqual<string>("2024-06-01 SN8 1.00Whr generated", Report::FormatDetail(a2));
	AssertEqual<string>("2024-06-01 SN9 0.28Whr generated (analysis failed)", Report::FormatDetail(a3));
}

void TestSettings() {
	Settings s;
	assert(ValidateSettings(s));
	assert(ApplySettingsJSON(R"({"CeilingW": 300, "Strictness": "Forced", "Visualize": "Shaved", "StartDate": "2024-01-02", "Threads": 4})", s));
	AssertEqual(300, s.Analysis.CeilingW);
	assert(s.Analysis.Mode == Strictness::Forced);
	assert(s.Visualize == VisualizationFilter::Shaved);
	assert(s.StartDate == Date(2024, 1, 2));
	AssertEqual(4, s.Threads);
	AssertEqual(331, s.CadenceSeconds);
	assert(ValidateSettings(s));

	Settings bad;
	assert(!ApplySettingsJSON(R"({"CeilingW": "lots"})", bad));
	assert(!ApplySettingsJSON(R"({"Visualize": "Sometimes"})", bad));
	assert(!ApplySettingsJSON(R"([1, 2])", bad));
	assert(!ApplySettingsJSON("{", bad));

	bad         = Settings();
	bad.EndDate = Date(2005, 1, 1);
	assert(!ValidateSettings(bad));
	bad                = Settings();
	bad.CadenceSeconds = 0;
	assert(!ValidateSettings(bad));

	Settings db;
	db.StartDate = Date(2024, 6, 1);
	db.EndDate   = Date(2024, 6, 2);
	string sql   = BuildQuerySQL(db.StartDate, db.EndDate);
	assert(sql.find("BETWEEN '2024-06-01 00:00:00' AND '2024-06-02 23:59:59'") != string::npos);
	assert(BuildQueryCommand(db).find("sqlite3 -readonly") == 0);
	db.DBMode = DBModes::Postgres;
	assert(BuildQueryCommand(db).find("psql") != string::npos);

	db.DBMode        = DBModes::MySQL;
	db.MySQLHost     = "db.local";
	db.MySQLUsername = "enphase";
	string mysql     = BuildQueryCommand(db);
	assert(mysql.find("mysql --batch --skip-column-names") != string::npos);
	assert(mysql.find("--host db.local") != string::npos);
	assert(mysql.find("--port 3306") != string::npos);
	assert(mysql.find("--user enphase") != string::npos);
	assert(mysql.find(sql) != string::npos);

	Settings my;
	assert(ApplySettingsJSON(R"({"DBMode": "MySQL", "MySQLDB": "solar"})", my));
	assert(my.DBMode == DBModes::MySQL);
	AssertEqual<string>("solar", my.MySQLDB);

	// mysql batch output is tab separated
	Reading r;
	assert(ParseReading("2024-06-01 10:15:31\t121934012345\t245", r));
	AssertEqual<int64_t>(121934012345, r.Device);
	AssertEqual(245, r.Watts);
	assert(!ParseReading("2024-06-01 10:15:31\t121934012345,245", r));
}

void TestAnalyzeBatch() {
	DayBatch batch;
	batch.Day = Date(2024, 6, 1);
	for (int dev = 1; dev <= 6; dev++)
		batch.Devices[dev] = MakeClearDay(3000 - 100 * dev, 5e-6, 2500);

	AnalysisParams p;
	p.CeilingW  = 2500;
	auto serial = AnalyzeBatch(batch, p, 331, 1);
	auto par    = AnalyzeBatch(batch, p, 331, 4);
	AssertEqual<size_t>(6, serial.size());
	AssertEqual(serial.size(), par.size());
	for (size_t i = 0; i < serial.size(); i++) {
		AssertEqual<int64_t>(i + 1, serial[i].Device);
		AssertEqual(serial[i].Device, par[i].Device);
		AssertStatus(serial[i].Status, par[i].Status);
		AssertEqual(serial[i].Result.GeneratedWs, par[i].Result.GeneratedWs);
		AssertEqual(serial[i].Result.HasShaved, par[i].Result.HasShaved);
		AssertEqual(serial[i].Result.ShavedWs, par[i].Result.ShavedWs);
	}
	// The dimmest device never reaches the ceiling
	AssertStatus(DayStatus::NoExceedance, serial[5].Status);
	assert(serial[0].Result.HasShaved);
}

void PrintBenchmark(const char* operation, int n, clock_t start, int optimizeBreaker) {
	auto   end     = clock();
	auto   elapsed = double(end - start) / (double) CLOCKS_PER_SEC;
	double seconds = elapsed / (double) n;
	if (seconds < 1e-6) {
		printf("%s %.0f nanoseconds per operation (opt breaker %d)\n", operation, 1000000000.f * seconds, optimizeBreaker);
	} else if (seconds < 1e-3) {
		printf("%s %.3f microseconds per operation (opt breaker %d)\n", operation, 1000000.f * seconds, optimizeBreaker);
	} else {
		printf("%s %.3f milliseconds per operation (opt breaker %d)\n", operation, 1000.f * seconds, optimizeBreaker);
	}
}

void BenchmarkAnalyzeDay() {
	int            n = 200;
	Series         s = MakeClearDay(3000, 5e-6, 2500);
	AnalysisParams p;
	p.CeilingW = 2500;

	auto    start  = clock();
	int64_t shaved = 0;
	for (int i = 0; i < n; i++)
		shaved += AnalyzeDay(Date(2024, 6, 1), 1, s, p, 331).Result.ShavedWs;
	PrintBenchmark("AnalyzeDay of 150 samples", n, start, (int) (shaved & 0xffff));
}

int main(int argc, char** argv) {
	TestDates();
	TestParseReading();
	TestStreamCursor();
	TestGapReconstruction();
	TestReconstructor();
	TestQualityGate();
	TestCrossing();
	TestAccountant();
	TestFitQuadratic();
	TestCloudRejection();
	TestFitUndefined();
	TestEndToEnd();
	TestDedup();
	TestShouldEmit();
	TestReport();
	TestSettings();
	TestAnalyzeBatch();
	BenchmarkAnalyzeDay();
	printf("All tests passed\n");
	return 0;
}
