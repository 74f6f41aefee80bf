module;
#include <argparse/argparse.hpp>

module the.whole.caboodle;
import std;

import bridge;
import discovery;
import model;

namespace caboodle {

static constexpr std::array LogLevels = { "trace", "debug", "info", "warn",
	                                      "error", "critical", "off" };

template <typename T>
static bool fits(int Value) {
	return Value >= 0 and Value <= std::numeric_limits<T>::max();
}

auto getOptions(int argc, char * argv[]) -> std::optional<tOptions> {
	argparse::ArgumentParser Options("mirror-bridge", "",
	                                 argparse::default_arguments::help, false);
	Options.add_argument("-H", "--host")
	    .help("mirror display host, skips discovery")
	    .default_value(std::string{});
	Options.add_argument("-p", "--port")
	    .help("WebSocket port of a fixed display")
	    .default_value(0)
	    .scan<'i', int>();
	Options.add_argument("--path")
	    .help("WebSocket path of a fixed display")
	    .default_value(std::string{ model::DefaultTransportPath });
	Options.add_argument("--prefer")
	    .help("service name to resolve as soon as it shows up")
	    .default_value(std::string{ "SmartMirror" });
	Options.add_argument("--service")
	    .help("DNS-SD service type")
	    .default_value(std::string{ "_mirror._tcp" });
	Options.add_argument("--rest-port")
	    .help("REST port of the display")
	    .default_value(static_cast<int>(model::DefaultRequestPort))
	    .scan<'i', int>();
	Options.add_argument("--throttle")
	    .help("seconds between repeated now-playing REST posts")
	    .default_value(10)
	    .scan<'i', int>();
	Options.add_argument("--duplicate-delay")
	    .help("milliseconds before repeating a play/pause change")
	    .default_value(150)
	    .scan<'i', int>();
	Options.add_argument("--greeting")
	    .help("text sent on every connect, empty for none")
	    .default_value(std::string{ "mirror-bridge client connected" });
	Options.add_argument("-l", "--log-level")
	    .help("trace, debug, info, warn, error, critical or off")
	    .default_value(std::string{ "info" });
	Options.add_argument("-c", "--calendar")
	    .help("JSON file with calendar events")
	    .default_value(std::string{});

	bool needHelp = true;
	try {
		Options.parse_args(argc, argv);
		needHelp = Options.get<bool>("--help");
	} catch (const std::exception & Error) {
		std::println("{}", Error.what());
	}

	tOptions Result;
	if (not needHelp) {
		const auto Host       = Options.get<std::string>("--host");
		const auto Port       = Options.get<int>("--port");
		const auto RestPort   = Options.get<int>("--rest-port");
		const auto Throttle   = Options.get<int>("--throttle");
		const auto Duplicate  = Options.get<int>("--duplicate-delay");
		Result.LogLevel       = Options.get<std::string>("--log-level");

		needHelp = not fits<std::uint16_t>(Port) or not fits<std::uint16_t>(RestPort) or
		           Throttle < 0 or Duplicate < 0 or
		           std::ranges::find(LogLevels, Result.LogLevel) == LogLevels.end() or
		           (not Host.empty() and Port == 0);
		if (not needHelp) {
			Result.Discovery.Preferred   = Options.get<std::string>("--prefer");
			Result.Discovery.ServiceType = Options.get<std::string>("--service");
			Result.Bridge.RequestPort    = static_cast<std::uint16_t>(RestPort);
			Result.Bridge.RestThrottle   = std::chrono::seconds{ Throttle };
			Result.Bridge.DuplicateDelay = std::chrono::milliseconds{ Duplicate };
			Result.Bridge.Transport.Greeting = Options.get<std::string>("--greeting");
			Result.Calendar = Options.get<std::string>("--calendar");
			if (not Host.empty())
				Result.Fixed = model::Endpoint{
					.Host          = Host,
					.TransportPort = static_cast<std::uint16_t>(Port),
					.RequestPort   = Result.Bridge.RequestPort,
					.TransportPath = model::normalizePath(Options.get<std::string>("--path")),
				};
		}
	}

	if (needHelp) {
		std::println("{}", Options.help().str());
		return std::nullopt;
	}
	return Result;
}

} // namespace caboodle
