module;
#include <boost/asio.hpp>

export module bridge;
import std;

import calendar;
import coalescer;
import control;
import model;
import net;
import request;
import transport;

namespace asio = boost::asio;

using namespace std::chrono_literals;

// the application-facing side of the connectivity: it owns the transport and request
// channels to the one mirror display in use and decides what goes over which of them.

export namespace bridge {

struct Settings {
	std::chrono::milliseconds RestThrottle   = 10s;   // now-playing REST repeats at most
	std::chrono::milliseconds DuplicateDelay = 150ms; // before repeating a play/pause change
	std::chrono::milliseconds ReadyGrace     = 200ms; // for a transport to come up
	double VolumeStep                        = control::DefaultVolumeStep;
	std::uint16_t RequestPort                = model::DefaultRequestPort;
	std::chrono::milliseconds RequestTimeout = 5s;
	transport::Settings Transport            = {};
};

// the channels to one display endpoint
struct Pair {
	std::shared_ptr<transport::Channel> Transport_;
	std::shared_ptr<request::Channel> Request_;
	model::Endpoint Endpoint_;
};

[[nodiscard]] auto makePair(net::tExecutor Executor, const model::Endpoint & Where,
                            const Settings & How) -> Pair;

using tNow              = std::function<std::chrono::steady_clock::time_point()>;
using tCalendarBatch    = std::expected<calendar::Batch, std::string>;
using tCalendarProvider = std::function<asio::awaitable<tCalendarBatch>()>;
using tStateObserver    = std::function<void(model::ConnectionState)>;

// precondition: all member functions are called on 'Executor', which is expected to be
// a strand. instances are owned by shared_ptrs.
class Bridge : public std::enable_shared_from_this<Bridge> {
public:
	Bridge(net::tExecutor Executor, std::shared_ptr<control::MediaController> Media,
	       Settings How = {}, tNow Now = std::chrono::steady_clock::now);

	// the previous pair is left alone, its owner disconnects it
	void adopt(Pair Fresh);
	// connects and probes the active pair as needed. nothing before the first 'adopt'.
	[[nodiscard]] auto ensureReady() -> asio::awaitable<std::optional<Pair>>;

	// coalesced: a burst of updates sends the first and the latest value only
	[[nodiscard]] auto sendNowPlaying(model::NowPlayingInfo Info) -> asio::awaitable<void>;
	// remember 'Info' and send it in the background
	void updateNowPlaying(model::NowPlayingInfo Info);

	[[nodiscard]] auto sendCalendarSnapshot(calendar::tDay RangeStart, calendar::tDay RangeEnd,
	                                        std::vector<calendar::Event> Events)
	    -> asio::awaitable<void>;
	[[nodiscard]] auto sendControlEvent(model::ControlEvent Event) -> asio::awaitable<void>;
	[[nodiscard]] auto sendTestProbe() -> asio::awaitable<void>;

	// one provider-and-send round, as the periodic background refresh asks for
	[[nodiscard]] auto reloadCalendar(tCalendarProvider Provider,
	                                  const std::chrono::time_zone * Zone =
	                                      std::chrono::current_zone()) -> asio::awaitable<void>;
	// a reload now and after every local midnight, until stopped
	void startDailyCalendarUpdates(tCalendarProvider Provider,
	                               const std::chrono::time_zone * Zone =
	                                   std::chrono::current_zone());
	void stopDailyCalendarUpdates();

	[[nodiscard]] auto connectionState() const -> model::ConnectionState;
	// observers see changes of the connection state only
	void observe(tStateObserver Observer);

	[[nodiscard]] auto lastNowPlaying() const -> const std::optional<model::NowPlayingInfo> & {
		return LastNowPlaying_;
	}
	[[nodiscard]] auto active() const -> const std::optional<Pair> & { return Active_; }

	// stop the daily updates and disconnect the active pair
	void shutdown();

private:
	[[nodiscard]] auto flushNowPlaying(model::NowPlayingInfo Info) -> asio::awaitable<void>;
	[[nodiscard]] bool restDue(const model::NowPlayingInfo & Info) const;
	[[nodiscard]] auto deliver(tCalendarBatch Batch, const std::chrono::time_zone * Zone)
	    -> asio::awaitable<void>;
	[[nodiscard]] static auto daily(std::shared_ptr<Bridge> Self, std::stop_token Token,
	                                tCalendarProvider Provider,
	                                const std::chrono::time_zone * Zone)
	    -> asio::awaitable<void>;

	void connectSignals(const Pair & Fresh);
	[[nodiscard]] bool isActive(const void * Channel) const noexcept;
	void publish();

	net::tExecutor Executor_;
	Settings Settings_;
	tNow Now_;
	control::Dispatcher Commands_;
	coalescer::Coalescer<model::NowPlayingInfo> NowPlaying_;

	std::optional<Pair> Active_;
	std::optional<model::NowPlayingInfo> LastNowPlaying_;
	std::optional<model::NowPlayingInfo> LastRest_;
	std::chrono::steady_clock::time_point LastRestAt_ = {};
	std::optional<bool> LastPlayingSent_;
	std::stop_source Daily_;

	std::vector<tStateObserver> Observers_;
	model::ConnectionState Published_ = {};
};

} // namespace bridge
