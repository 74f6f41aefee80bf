module;
#include <nlohmann/json.hpp>

module calendar;
import std;

import model;

using namespace std::chrono;

namespace calendar {

static constexpr std::string_view Whitespace = " \t\r\n\f\v";

static auto trimmed(std::string_view Text) -> std::string_view {
	const auto First = Text.find_first_not_of(Whitespace);
	if (First == std::string_view::npos)
		return {};
	return Text.substr(First, Text.find_last_not_of(Whitespace) - First + 1);
}

auto dayKey(tDay Day) -> std::string {
	return std::format("{:%F}", Day);
}

auto timeRange(const Event & Which) -> std::string {
	if (Which.IsAllDay)
		return "All-day";
	return std::format("{:%H:%M}–{:%H:%M}", floor<minutes>(Which.Start),
	                   floor<minutes>(Which.End));
}

auto entryOf(const Event & Which) -> Entry {
	const auto Title = trimmed(Which.Title);
	return { .Calendar = Which.Calendar.empty() ? "Calendar" : Which.Calendar,
		     .Event    = Title.empty() ? "Untitled" : std::string{ Title },
		     .Time     = timeRange(Which),
		     .Location = Which.Location,
		     .IsAllDay = Which.IsAllDay };
}

auto buildSnapshot(tDay RangeStart, tDay RangeEnd, std::span<const Event> Events)
    -> Snapshot {
	Snapshot Days{ .RangeStart = RangeStart, .RangeEnd = RangeEnd };
	for (auto Day = RangeStart; Day <= RangeEnd; Day += days{ 1 })
		Days.EventsByDate[dayKey(Day)];

	std::vector<const Event *> ByStart;
	for (const auto & Which : Events)
		ByStart.push_back(&Which);
	std::ranges::stable_sort(ByStart, {}, &Event::Start);

	for (const auto * Which : ByStart) {
		const auto Shown = entryOf(*Which);
		for (auto Day = floor<days>(std::max<tTime>(Which->Start, RangeStart));
		     Day <= RangeEnd and Which->End > Day; Day += days{ 1 }) {
			if (Which->Start < Day + days{ 1 })
				Days.EventsByDate[dayKey(Day)].push_back(Shown);
		}
	}
	return Days;
}

auto toJson(const Snapshot & Days) -> model::tJson {
	auto EventsByDate = model::tJson::object();
	for (const auto & [Key, Entries] : Days.EventsByDate) {
		auto & Shown = EventsByDate[Key] = model::tJson::array();
		for (const auto & Which : Entries)
			Shown.push_back({ { "calendar", Which.Calendar },
			                  { "event", Which.Event },
			                  { "time", Which.Time },
			                  { "location", Which.Location },
			                  { "isAllDay", Which.IsAllDay } });
	}
	return { { "rangeStart", dayKey(Days.RangeStart) },
		     { "rangeEnd", dayKey(Days.RangeEnd) },
		     { "eventsByDate", std::move(EventsByDate) } };
}

auto defaultWindow(tDay Today) -> std::pair<tDay, tDay> {
	return { Today - days{ 3 }, Today + days{ 4 } };
}

auto today(const time_zone * Zone) -> tDay {
	return floor<days>(Zone->to_local(system_clock::now()));
}

// the local midnight is recomputed from the current zone rules every time
auto untilNextMidnight(system_clock::time_point Now, const time_zone * Zone) -> seconds {
	const auto NextMidnight = floor<days>(Zone->to_local(Now)) + days{ 1 };
	const auto Remaining    = ceil<seconds>(Zone->to_sys(NextMidnight, choose::earliest) - Now);
	return std::max(Remaining, seconds{ 1 });
}

// a date without time of day is the start of that day, or the end of it if 'EndOfDay'
static auto parseTime(const model::tJson & Json, std::string_view Key, bool EndOfDay = false)
    -> std::optional<tTime> {
	const auto Field = Json.find(Key);
	if (Field == Json.end() or not Field->is_string())
		return std::nullopt;

	local_seconds Time;
	std::istringstream Text(Field->get<std::string>());
	Text >> parse("%Y-%m-%dT%H:%M", Time);
	if (not Text) {
		Text.clear();
		Text.str(Field->get<std::string>());
		local_days Day;
		if (Text >> parse("%Y-%m-%d", Day))
			return EndOfDay ? Day + days{ 1 } : Day;
		return std::nullopt;
	}
	return Time;
}

auto eventsFromJson(const model::tJson & Json) -> std::expected<std::vector<Event>, std::string> {
	if (not Json.is_array())
		return std::unexpected{ "expected an array of events" };

	std::vector<Event> Events;
	for (std::size_t Index = 0; Index < Json.size(); ++Index) {
		const auto & Item = Json[Index];
		if (not Item.is_object())
			return std::unexpected{ std::format("event {} is not an object", Index) };
		const auto Start = parseTime(Item, "start");
		const auto End   = parseTime(Item, "end", true);
		if (not Start or not End)
			return std::unexpected{ std::format("event {} lacks a valid start or end", Index) };
		Events.push_back({ .Calendar = Item.value("calendar", ""),
		                   .Title    = Item.value("title", ""),
		                   .Start    = *Start,
		                   .End      = *End,
		                   .Location = Item.value("location", ""),
		                   .IsAllDay = Item.value("allDay", false) });
	}
	return Events;
}

auto readEvents(const std::filesystem::path & File)
    -> std::expected<std::vector<Event>, std::string> {
	std::ifstream Input(File);
	if (not Input)
		return std::unexpected{ std::format("cannot open {}", File.string()) };
	const auto Json = model::tJson::parse(Input, nullptr, false);
	if (Json.is_discarded())
		return std::unexpected{ std::format("{} is no valid JSON", File.string()) };
	return eventsFromJson(Json);
}

} // namespace calendar
