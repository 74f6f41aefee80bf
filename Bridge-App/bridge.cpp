module;
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

module bridge;
import std;

import calendar;
import control;
import executor;
import model;
import net;
import request;
import transport;

namespace asio = boost::asio;

namespace bridge {

static constexpr std::string_view TestPacket = "Test  Packet";

auto makePair(net::tExecutor Executor, const model::Endpoint & Where, const Settings & How)
    -> Pair {
	auto Links = transport::webSocketLinks(Executor, Where, How.Transport);
	return { .Transport_ = std::make_shared<transport::Channel>(Executor, std::move(Links),
	                                                            How.Transport),
		     .Request_   = std::make_shared<request::Channel>(request::makeHttpExchange(
                 Executor, Where.Host, Where.RequestPort, How.RequestTimeout)),
		     .Endpoint_  = Where };
}

Bridge::Bridge(net::tExecutor Executor, std::shared_ptr<control::MediaController> Media,
               Settings How, tNow Now)
: Executor_(std::move(Executor))
, Settings_(std::move(How))
, Now_(std::move(Now))
, Commands_(std::move(Media), Settings_.VolumeStep) {}

void Bridge::adopt(Pair Fresh) {
	spdlog::info("bridge: adopting {}", model::describe(Fresh.Endpoint_));
	connectSignals(Fresh);
	Active_ = Fresh;
	publish();

	Fresh.Transport_->connect();
	executor::launch(Executor_,
	                 [](std::shared_ptr<request::Channel> Request) -> asio::awaitable<void> {
		                 if (not co_await Request->ping())
			                 spdlog::info("bridge: REST side not reachable yet");
	                 }(Fresh.Request_));
}

// channel events of a pair that is no longer active are of no interest
void Bridge::connectSignals(const Pair & Fresh) {
	Fresh.Transport_->onInbound([Weak = weak_from_this()](std::string_view Text) {
		if (const auto Self = Weak.lock())
			Self->Commands_.handle(Text);
	});
	Fresh.Transport_->onStateChange(
	    [Weak = weak_from_this(), Channel = Fresh.Transport_.get()](transport::State) {
		    if (const auto Self = Weak.lock(); Self and Self->isActive(Channel))
			    Self->publish();
	    });
	Fresh.Request_->onReachabilityChange(
	    [Weak = weak_from_this(), Channel = Fresh.Request_.get()](bool) {
		    if (const auto Self = Weak.lock(); Self and Self->isActive(Channel))
			    Self->publish();
	    });
}

bool Bridge::isActive(const void * Channel) const noexcept {
	return Active_ and
	       (Active_->Transport_.get() == Channel or Active_->Request_.get() == Channel);
}

// the pair is captured here, a concurrent 'adopt' doesn't affect the caller
auto Bridge::ensureReady() -> asio::awaitable<std::optional<Pair>> {
	if (not Active_) {
		spdlog::warn("bridge: no mirror display adopted yet");
		co_return std::nullopt;
	}
	const auto Ready = *Active_;
	if (not Ready.Transport_->isOpen()) {
		Ready.Transport_->connect();
		if (not co_await Ready.Transport_->waitUntilOpen(Settings_.ReadyGrace))
			spdlog::debug("bridge: transport not open yet, messages wait in the queue");
	}
	if (not Ready.Request_->isReachable()) {
		if (not co_await Ready.Request_->ping())
			spdlog::debug("bridge: REST side still unreachable");
	}
	co_return Ready;
}

auto Bridge::sendNowPlaying(model::NowPlayingInfo Info) -> asio::awaitable<void> {
	co_await NowPlaying_.submit(std::move(Info),
	                            [Self = shared_from_this()](model::NowPlayingInfo Latest) {
		                            return Self->flushNowPlaying(std::move(Latest));
	                            });
}

void Bridge::updateNowPlaying(model::NowPlayingInfo Info) {
	LastNowPlaying_ = Info;
	executor::launch(Executor_,
	                 [](std::shared_ptr<Bridge> Self,
	                    model::NowPlayingInfo Info) -> asio::awaitable<void> {
		                 co_await Self->sendNowPlaying(std::move(Info));
	                 }(shared_from_this(), std::move(Info)));
}

// REST on a track change, a play/pause change, or when the last one is old enough
bool Bridge::restDue(const model::NowPlayingInfo & Info) const {
	if (not LastRest_)
		return true;
	if (not Info.sameTrack(*LastRest_) or Info.IsPlaying != LastRest_->IsPlaying)
		return true;
	return Now_() - LastRestAt_ >= Settings_.RestThrottle;
}

// a play/pause change goes out twice, receivers tend to swallow repeated payloads.
// the first 'playing' value counts as a change.
auto Bridge::flushNowPlaying(model::NowPlayingInfo Info) -> asio::awaitable<void> {
	spdlog::debug("bridge: now playing '{}' by '{}', playing={}", Info.Title, Info.Artist,
	              Info.IsPlaying);
	const auto Ready = co_await ensureReady();
	if (not Ready)
		co_return;

	const auto Payload = model::toJson(Info);
	if (restDue(Info)) {
		co_await Ready->Request_->postJSON("/nowPlaying", Payload);
		LastRest_   = Info;
		LastRestAt_ = Now_();
	}

	const bool PlayPauseChanged =
	    LastPlayingSent_ ? *LastPlayingSent_ != Info.IsPlaying : Info.IsPlaying;
	co_await Ready->Transport_->sendEnvelope("nowPlaying", Payload);
	if (PlayPauseChanged and co_await executor::sleepFor(Executor_, Settings_.DuplicateDelay))
		co_await Ready->Transport_->sendEnvelope("nowPlaying", Payload);
	LastPlayingSent_ = Info.IsPlaying;
}

auto Bridge::sendCalendarSnapshot(calendar::tDay RangeStart, calendar::tDay RangeEnd,
                                  std::vector<calendar::Event> Events)
    -> asio::awaitable<void> {
	const auto Ready = co_await ensureReady();
	if (not Ready)
		co_return;

	const auto Days = calendar::buildSnapshot(RangeStart, RangeEnd, Events);
	spdlog::info("bridge: calendar {} .. {} with {} event(s)", calendar::dayKey(RangeStart),
	             calendar::dayKey(RangeEnd), Events.size());
	co_await Ready->Request_->postJSON("/calendarUpdate", calendar::toJson(Days));
}

auto Bridge::sendControlEvent(model::ControlEvent Event) -> asio::awaitable<void> {
	const auto Ready = co_await ensureReady();
	if (not Ready)
		co_return;
	spdlog::debug("bridge: control event {}", model::toString(Event.Kind));
	co_await Ready->Transport_->sendEnvelope("controlEvent", model::toJson(Event));
}

auto Bridge::sendTestProbe() -> asio::awaitable<void> {
	const auto Ready = co_await ensureReady();
	if (not Ready)
		co_return;
	co_await Ready->Transport_->send(std::string{ TestPacket });
	const auto Reachable = co_await Ready->Request_->ping();
	spdlog::info("bridge: test probe sent, transport {}, REST {}",
	             transport::toString(Ready->Transport_->state()),
	             Reachable ? "reachable" : "unreachable");
}

// a failed provider still clears the display with an empty default window
auto Bridge::deliver(tCalendarBatch Batch, const std::chrono::time_zone * Zone)
    -> asio::awaitable<void> {
	if (not Batch) {
		spdlog::warn("bridge: no calendar events: {}", Batch.error());
		const auto [RangeStart, RangeEnd] = calendar::defaultWindow(calendar::today(Zone));
		co_await sendCalendarSnapshot(RangeStart, RangeEnd, {});
		co_return;
	}
	co_await sendCalendarSnapshot(Batch->RangeStart, Batch->RangeEnd,
	                              std::move(Batch->Events));
}

auto Bridge::reloadCalendar(tCalendarProvider Provider, const std::chrono::time_zone * Zone)
    -> asio::awaitable<void> {
	co_await deliver(co_await Provider(), Zone);
}

auto Bridge::daily(std::shared_ptr<Bridge> Self, std::stop_token Token,
                   tCalendarProvider Provider, const std::chrono::time_zone * Zone)
    -> asio::awaitable<void> {
	net::tTimer Timer(Self->Executor_);
	const auto WatchDog = executor::abortOn(Token, Timer);

	while (not Token.stop_requested()) {
		auto Batch = co_await Provider();
		if (Token.stop_requested())
			break;
		co_await Self->deliver(std::move(Batch), Zone);

		const auto Pause = calendar::untilNextMidnight(std::chrono::system_clock::now(), Zone);
		spdlog::debug("bridge: next calendar update in {}s", Pause.count());
		Timer.expires_after(Pause);
		if (not co_await net::expired(Timer))
			break;
	}
	spdlog::debug("bridge: daily calendar updates ended");
}

void Bridge::startDailyCalendarUpdates(tCalendarProvider Provider,
                                       const std::chrono::time_zone * Zone) {
	stopDailyCalendarUpdates();
	Daily_ = {};
	executor::launch(Executor_, daily(shared_from_this(), Daily_.get_token(),
	                                  std::move(Provider), Zone));
}

void Bridge::stopDailyCalendarUpdates() {
	Daily_.request_stop();
}

auto Bridge::connectionState() const -> model::ConnectionState {
	if (not Active_)
		return {};
	return { .TransportOpen    = Active_->Transport_->isOpen(),
		     .RequestReachable = Active_->Request_->isReachable() };
}

void Bridge::observe(tStateObserver Observer) {
	Observers_.push_back(std::move(Observer));
}

void Bridge::publish() {
	const auto Now = connectionState();
	if (Now == Published_)
		return;
	Published_ = Now;
	spdlog::info("bridge: transport {}, REST {}", Now.TransportOpen ? "open" : "closed",
	             Now.RequestReachable ? "reachable" : "unreachable");
	for (const auto & Observer : Observers_)
		Observer(Now);
}

void Bridge::shutdown() {
	stopDailyCalendarUpdates();
	if (Active_) {
		Active_->Transport_->disconnect();
		Active_.reset();
	}
	publish();
}

} // namespace bridge
