module;
#include <boost/asio.hpp>
#include <csignal>
#include <spdlog/spdlog.h>
#include <unistd.h>

export module events;
import std;

import bridge;
import executor;
import model;
import net;

namespace asio = boost::asio;

// user interaction
namespace handleEvents {

using tConsole = net::use_await::as_default_on_t<asio::posix::stream_descriptor>;
using tSignals = net::use_await::as_default_on_t<asio::signal_set>;

static constexpr std::string_view Usage =
    "commands:\n"
    "  np <title>|<artist>|<album>|<duration>|<position>|<playing 0/1>\n"
    "  event <play|pause|next|previous|volume|trackChanged> [value]\n"
    "  probe\n"
    "  calendar\n"
    "  state\n"
    "  quit";

static auto fields(std::string_view Text, char Separator) -> std::vector<std::string_view> {
	std::vector<std::string_view> Fields;
	for (const auto Field : std::views::split(Text, Separator))
		Fields.emplace_back(Field);
	return Fields;
}

static auto number(std::string_view Text) -> std::optional<double> {
	double Value;
	const auto [End, Error] = std::from_chars(Text.data(), Text.data() + Text.size(), Value);
	if (Error != std::errc{} or End != Text.data() + Text.size())
		return std::nullopt;
	return Value;
}

// "title|artist|album|duration|position|playing"
static auto nowPlayingFrom(std::string_view Text) -> std::optional<model::NowPlayingInfo> {
	const auto Parts = fields(Text, '|');
	if (Parts.size() != 6)
		return std::nullopt;
	const auto Duration = number(Parts[3]);
	const auto Position = number(Parts[4]);
	if (not Duration or not Position or *Duration < 0 or *Position < 0)
		return std::nullopt;
	return model::NowPlayingInfo{ .Title     = std::string{ Parts[0] },
		                          .Artist    = std::string{ Parts[1] },
		                          .Album     = std::string{ Parts[2] },
		                          .Duration  = *Duration,
		                          .Position  = std::min(*Position, *Duration),
		                          .IsPlaying = Parts[5] == "1" };
}

static auto controlEventFrom(std::string_view Text, const bridge::Bridge & Bridge)
    -> std::optional<model::ControlEvent> {
	const auto Parts = fields(Text, ' ');
	if (Parts.empty())
		return std::nullopt;
	const auto Kind = model::parseControlKind(Parts.front());
	if (not Kind)
		return std::nullopt;

	model::ControlEvent Event{ .Kind = *Kind };
	if (Parts.size() > 1) {
		Event.Value = number(Parts[1]);
		if (not Event.Value)
			return std::nullopt;
		Event.Value = std::clamp(*Event.Value, 0.0, 1.0);
	}
	if (const auto & Playing = Bridge.lastNowPlaying();
	    Playing and *Kind == model::ControlKind::TrackChanged) {
		Event.Title  = Playing->Title;
		Event.Artist = Playing->Artist;
		Event.Album  = Playing->Album;
	}
	return Event;
}

// returns 'false' when the user wants to quit
static auto perform(std::string_view Line, std::shared_ptr<bridge::Bridge> Bridge,
                    const bridge::tCalendarProvider & Calendar) -> asio::awaitable<bool> {
	const auto Blank   = Line.find(' ');
	const auto Command = Line.substr(0, Blank);
	const auto Rest    = Blank == std::string_view::npos ? std::string_view{}
	                                                     : Line.substr(Blank + 1);

	if (Command == "quit")
		co_return false;
	if (Command == "np") {
		if (auto Info = nowPlayingFrom(Rest))
			Bridge->updateNowPlaying(std::move(*Info));
		else
			std::println("{}", Usage);
	} else if (Command == "event") {
		if (auto Event = controlEventFrom(Rest, *Bridge))
			co_await Bridge->sendControlEvent(std::move(*Event));
		else
			std::println("{}", Usage);
	} else if (Command == "probe") {
		co_await Bridge->sendTestProbe();
	} else if (Command == "calendar") {
		co_await Bridge->reloadCalendar(Calendar);
	} else if (Command == "state") {
		const auto State = Bridge->connectionState();
		std::println("connected: {} (transport {}, REST {})", State.connected(),
		             State.TransportOpen ? "open" : "closed",
		             State.RequestReachable ? "reachable" : "unreachable");
	} else if (not Command.empty()) {
		std::println("{}", Usage);
	}
	co_return true;
}

export {

// watch out for an interrupt signal (e.g. from the command line).
// initiate an application stop in that case.

[[nodiscard]] auto fromTerminal(net::tExecutor Executor) -> asio::awaitable<void> {
	tSignals Signals(Executor, SIGINT, SIGTERM);
	const auto WatchDog = executor::abort(Signals);

	const auto [Error, Number] = co_await Signals.async_wait();
	if (not Error)
		spdlog::info("signal {} received, shutting down", Number);
	executor::StopAssetOf(Executor).request_stop();
}

// feed lines from the standard input into the bridge.
// the end of the input leaves the application running, 'quit' stops it.

[[nodiscard]] auto fromConsole(net::tExecutor Executor, std::shared_ptr<bridge::Bridge> Bridge,
                               bridge::tCalendarProvider Calendar) -> asio::awaitable<void> {
	tConsole Input(Executor);
	boost::system::error_code Error;
	const auto Descriptor = ::dup(STDIN_FILENO);
	Input.assign(Descriptor, Error);
	if (Error) {
		if (Descriptor >= 0)
			::close(Descriptor);
		spdlog::info("console: standard input unavailable ({})", Error.message());
		co_return;
	}
	const auto WatchDog = executor::abort(Input);

	std::string Buffer;
	for (;;) {
		const auto [ReadError, Size] =
		    co_await asio::async_read_until(Input, asio::dynamic_buffer(Buffer), '\n');
		if (ReadError)
			break;
		const auto Line = Buffer.substr(0, Size - 1);
		Buffer.erase(0, Size);
		if (not co_await perform(Line, Bridge, Calendar)) {
			executor::StopAssetOf(Executor).request_stop();
			break;
		}
	}
	spdlog::debug("console: input closed");
}

} // export
} // namespace handleEvents
