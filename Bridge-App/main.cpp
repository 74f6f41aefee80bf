/* =============================================================================
The bridge

 - finds the mirror display on the local network by its DNS-SD advertisement, or
   takes a fixed endpoint from the command line
 - adopts a fresh WebSocket transport and REST request channel for every endpoint
 - mirrors now-playing snapshots, control events and calendar snapshots to the
   display, coalesced and throttled
 - carries out the remote commands the display sends (play/pause, skip, volume)

The application

 - takes commands for the bridge from the console
 - sends a calendar snapshot right away and after every local midnight
 - watches for interrupt signals and performs a clean shutdown
==============================================================================*/

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

import std;

import bridge;
import calendar;
import discovery;
import events;
import executor;
import model;
import net;
import player;
import the.whole.caboodle;

namespace asio = boost::asio;

// calendar events come from a JSON file that is read again on every reload
static auto loadCalendar(std::filesystem::path File)
    -> asio::awaitable<bridge::tCalendarBatch> {
	if (File.empty())
		co_return std::unexpected{ std::string{ "no calendar file given" } };
	auto Events = calendar::readEvents(File);
	if (not Events)
		co_return std::unexpected{ std::move(Events).error() };

	const auto [RangeStart, RangeEnd] =
	    calendar::defaultWindow(calendar::today(std::chrono::current_zone()));
	co_return calendar::Batch{ RangeStart, RangeEnd, std::move(Events).value() };
}

int main(int argc, char * argv[]) {
	const auto Options = caboodle::getOptions(argc, argv);
	if (not Options)
		return -1;
	spdlog::set_level(spdlog::level::from_str(Options->LogLevel));

	asio::io_context ExecutionContext; // we have executors at home
	auto Strand = asio::make_strand(ExecutionContext);
	std::stop_source Stop;             // the mother of all stops
	const auto schedule = executor::makeScheduler(Strand, Stop);
	const net::tExecutor Executor = Strand;

	const auto Bridge = std::make_shared<bridge::Bridge>(
	    Executor, std::make_shared<player::LoggingPlayer>(), Options->Bridge);
	const bridge::tCalendarProvider Calendar = [File = Options->Calendar] {
		return loadCalendar(File);
	};

	// one pair per endpoint, the bridge leaves the previous one to us
	const auto adoptEndpoint = [&](model::Endpoint Where) {
		if (const auto & Previous = Bridge->active()) {
			if (Previous->Endpoint_ == Where)
				return;
			Previous->Transport_->disconnect();
		}
		Bridge->adopt(bridge::makePair(Executor, Where, Options->Bridge));
	};

	std::shared_ptr<discovery::ServiceLocator> Locator;
	if (Options->Fixed) {
		asio::post(Strand, [&] { adoptEndpoint(*Options->Fixed); });
	} else {
		Locator = std::make_shared<discovery::ServiceLocator>(
		    Executor, discovery::makeMulticastBackend(Executor, Options->Discovery),
		    Options->Discovery, Options->Bridge.RequestPort);
		Locator->onEndpoint(adoptEndpoint);
		asio::post(Strand, [&] { Locator->start(); });
	}
	asio::post(Strand, [&] { Bridge->startDailyCalendarUpdates(Calendar); });

	schedule(handleEvents::fromTerminal, Executor);
	schedule(handleEvents::fromConsole, Executor, Bridge, Calendar);

	const std::stop_callback Shutdown(Stop.get_token(), [&] {
		asio::post(Strand, [&] {
			if (Locator)
				Locator->stop();
			Bridge->shutdown();
		});
	});

	ExecutionContext.run();
}
