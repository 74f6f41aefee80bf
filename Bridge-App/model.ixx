module;
#include <nlohmann/json.hpp>

export module model;
import std;

// the values that travel between the mirror client and the mirror display

export namespace model {

using tJson = nlohmann::json; // objects keep their keys sorted

struct NowPlayingInfo {
	std::string Title;
	std::string Artist;
	std::string Album;
	double Duration = 0.0; // seconds
	double Position = 0.0; // seconds
	bool IsPlaying  = false;

	bool operator==(const NowPlayingInfo &) const = default;

	[[nodiscard]] bool sameTrack(const NowPlayingInfo & Other) const noexcept {
		return Title == Other.Title and Artist == Other.Artist and Album == Other.Album;
	}
};

enum class ControlKind { Play, Pause, Next, Previous, Volume, TrackChanged };

struct ControlEvent {
	ControlKind Kind;
	std::optional<double> Value = {}; // volume only, 0.0 - 1.0
	std::optional<std::string> Title  = {};
	std::optional<std::string> Artist = {};
	std::optional<std::string> Album  = {};
	std::chrono::system_clock::time_point Timestamp = std::chrono::system_clock::now();
};

inline constexpr std::uint16_t DefaultRequestPort = 8000;
inline constexpr std::string_view DefaultTransportPath = "/ws";

struct Endpoint {
	std::string Host;
	std::uint16_t TransportPort;
	std::uint16_t RequestPort = DefaultRequestPort;
	std::string TransportPath = std::string{ DefaultTransportPath };

	bool operator==(const Endpoint &) const = default;
};

struct ConnectionState {
	bool TransportOpen    = false;
	bool RequestReachable = false;

	bool operator==(const ConnectionState &) const = default;

	// what a 'connected' indicator shows
	[[nodiscard]] constexpr bool connected() const noexcept {
		return TransportOpen or RequestReachable;
	}
};

[[nodiscard]] auto toString(ControlKind Kind) -> std::string_view;
[[nodiscard]] auto parseControlKind(std::string_view Name) -> std::optional<ControlKind>;

[[nodiscard]] auto toJson(const NowPlayingInfo & Info) -> tJson;
[[nodiscard]] auto toJson(const ControlEvent & Event) -> tJson;
// the compact text of 'Json'. invalid UTF-8 in strings becomes U+FFFD instead of failing.
[[nodiscard]] auto dump(const tJson & Json) -> std::string;

// the compact text of 'Payload' wrapped as {"type":<Type>,"payload":<Payload>}.
// 'type' always comes first, the payload keys are sorted.
[[nodiscard]] auto envelope(std::string_view Type, const tJson & Payload) -> std::string;

// ensure a leading '/', an empty path becomes the default transport path
[[nodiscard]] auto normalizePath(std::string_view Path) -> std::string;

[[nodiscard]] auto describe(const Endpoint & Where) -> std::string;

} // namespace model
