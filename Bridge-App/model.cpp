module;
#include <nlohmann/json.hpp>

module model;
import std;

namespace model {

static constexpr std::array ControlKindNames = {
	std::pair{ ControlKind::Play, std::string_view{ "play" } },
	std::pair{ ControlKind::Pause, std::string_view{ "pause" } },
	std::pair{ ControlKind::Next, std::string_view{ "next" } },
	std::pair{ ControlKind::Previous, std::string_view{ "previous" } },
	std::pair{ ControlKind::Volume, std::string_view{ "volume" } },
	std::pair{ ControlKind::TrackChanged, std::string_view{ "trackChanged" } },
};

auto toString(ControlKind Kind) -> std::string_view {
	for (const auto & [Known, Name] : ControlKindNames)
		if (Known == Kind)
			return Name;
	return "unknown";
}

auto parseControlKind(std::string_view Name) -> std::optional<ControlKind> {
	for (const auto & [Kind, Known] : ControlKindNames)
		if (Known == Name)
			return Kind;
	return std::nullopt;
}

auto toJson(const NowPlayingInfo & Info) -> tJson {
	return { { "title", Info.Title },       { "artist", Info.Artist },
		     { "album", Info.Album },       { "duration", Info.Duration },
		     { "position", Info.Position }, { "isPlaying", Info.IsPlaying } };
}

// absent optionals are left out rather than sent as null
auto toJson(const ControlEvent & Event) -> tJson {
	using namespace std::chrono;

	tJson Json = { { "kind", toString(Event.Kind) },
		           { "timestamp",
		             std::format("{:%FT%TZ}", floor<milliseconds>(Event.Timestamp)) } };
	if (Event.Value)
		Json["value"] = *Event.Value;
	if (Event.Title)
		Json["title"] = *Event.Title;
	if (Event.Artist)
		Json["artist"] = *Event.Artist;
	if (Event.Album)
		Json["album"] = *Event.Album;
	return Json;
}

auto dump(const tJson & Json) -> std::string {
	return Json.dump(-1, ' ', false, tJson::error_handler_t::replace);
}

auto envelope(std::string_view Type, const tJson & Payload) -> std::string {
	return std::format(R"({{"type":{},"payload":{}}})", dump(tJson(Type)), dump(Payload));
}

auto normalizePath(std::string_view Path) -> std::string {
	if (Path.empty())
		return std::string{ DefaultTransportPath };
	if (Path.starts_with('/'))
		return std::string{ Path };
	return std::format("/{}", Path);
}

auto describe(const Endpoint & Where) -> std::string {
	return std::format("ws://{}:{}{} (rest port {})", Where.Host, Where.TransportPort,
	                   Where.TransportPath, Where.RequestPort);
}

} // namespace model
