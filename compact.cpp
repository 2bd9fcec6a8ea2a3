#include <stdio.h>
#include <string.h>
#include <string>
#include "analyzer/telemetry.h"
#include "analyzer/dedup.h"

using namespace std;
using namespace clipmeter;

void ShowHelp() {
	fprintf(stderr, "clipmeter-compact [csv]\n");
	fprintf(stderr, "  Reads raw gateway reports, one 'YYYY-MM-DD HH:MM:SS,serial,watts' per line,\n");
	fprintf(stderr, "  and writes only the readings that need to be stored. Default input is stdin.\n");
}

int main(int argc, char** argv) {
	string input = "-";
	if (argc > 2 || (argc == 2 && (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0))) {
		ShowHelp();
		return 1;
	}
	if (argc == 2)
		input = argv[1];

	StreamCursor cursor;
	if (!cursor.OpenFile(input))
		return (int) cursor.Status();

	ReadingDeduplicator dedup;
	int                 counts[4] = {0, 0, 0, 0};
	Reading             r;
	while (cursor.Next(r)) {
		Timestamp storeTime;
		auto      d = dedup.OfferOffline(r.Device, r.Time, r.Watts, storeTime);
		counts[(int) d]++;
		if (d == ReadingDeduplicator::Decision::Store || d == ReadingDeduplicator::Decision::ConflictingResend) {
			Reading out = r;
			out.Time    = storeTime;
			printf("%s\n", FormatReading(out).c_str());
		}
	}
	cursor.Close();

	for (int i = 0; i < 4; i++)
		fprintf(stderr, "%s: %d\n", DedupDecisionToString((ReadingDeduplicator::Decision) i), counts[i]);
	fprintf(stderr, "Devices: %d\n", (int) dedup.NumDevices());

	if (cursor.Status() != StoreResponse::OK) {
		fprintf(stderr, "%s\n", DescribeStoreResponse(cursor.Status()).c_str());
		return (int) cursor.Status();
	}
	return 0;
}
