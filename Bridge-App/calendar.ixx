module;
#include <nlohmann/json.hpp>

export module calendar;
import std;

import model;

// calendar snapshots as the mirror display expects them: one entry per event and per
// day the event touches, for every day of an inclusive range of local days.

export namespace calendar {

using tDay  = std::chrono::local_days;
using tTime = std::chrono::local_seconds;

struct Event {
	std::string Calendar;
	std::string Title;
	tTime Start;
	tTime End;
	std::string Location = {};
	bool IsAllDay        = false;
};

// an event as shown on one particular day
struct Entry {
	std::string Calendar;
	std::string Event;
	std::string Time;
	std::string Location;
	bool IsAllDay;

	bool operator==(const Entry &) const = default;
};

struct Snapshot {
	tDay RangeStart;
	tDay RangeEnd;
	std::map<std::string, std::vector<Entry>> EventsByDate;
};

// the events of a day range, as delivered by a calendar provider
struct Batch {
	tDay RangeStart;
	tDay RangeEnd;
	std::vector<Event> Events;
};

[[nodiscard]] auto dayKey(tDay Day) -> std::string;                // "YYYY-MM-DD"
[[nodiscard]] auto timeRange(const Event & Which) -> std::string;  // "HH:MM–HH:MM", "All-day"
[[nodiscard]] auto entryOf(const Event & Which) -> Entry;

// every day in [RangeStart, RangeEnd] is a key, even without events.
// an event appears on each day that intersects [Start, End), in order of start time.
[[nodiscard]] auto buildSnapshot(tDay RangeStart, tDay RangeEnd,
                                 std::span<const Event> Events) -> Snapshot;
[[nodiscard]] auto toJson(const Snapshot & Days) -> model::tJson;

// three days back, four days ahead
[[nodiscard]] auto defaultWindow(tDay Today) -> std::pair<tDay, tDay>;

[[nodiscard]] auto today(const std::chrono::time_zone * Zone) -> tDay;
// at least one second, to never spin around midnight
[[nodiscard]] auto untilNextMidnight(std::chrono::system_clock::time_point Now,
                                     const std::chrono::time_zone * Zone)
    -> std::chrono::seconds;

// events from JSON like
//   [{"calendar":"Home","title":"Dentist","start":"2024-01-10T14:00",
//     "end":"2024-01-10T15:00","location":"","allDay":false}]
// a date-only "end" names the last day of the event, it ends at the following midnight.
[[nodiscard]] auto eventsFromJson(const model::tJson & Json)
    -> std::expected<std::vector<Event>, std::string>;
[[nodiscard]] auto readEvents(const std::filesystem::path & File)
    -> std::expected<std::vector<Event>, std::string>;

} // namespace calendar
