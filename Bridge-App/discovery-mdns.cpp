module;
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

module discovery;
import std;

import dnssd;
import executor;
import net;

namespace asio = boost::asio;

// browsing and resolving with multicast DNS (RFC 6762, RFC 6763).
// queries go out from an ephemeral port, the responders answer them by unicast to that
// port ("legacy unicast"). no system daemon is involved.

using namespace std::chrono_literals;

namespace discovery {

using tClock = std::chrono::steady_clock;

static constexpr auto MulticastGroup       = "224.0.0.251";
static constexpr std::uint16_t MulticastPort = 5353;
static constexpr auto MaxBrowseInterval    = std::chrono::steady_clock::duration{ 1h };
static constexpr auto ResolveQueryInterval = std::chrono::steady_clock::duration{ 1s };

static auto multicastGroup() -> net::tDatagramSource {
	return { asio::ip::make_address_v4(MulticastGroup), MulticastPort };
}

// a socket that fails to bind is closed again
static auto openSocket(net::tDatagram & Socket) -> std::error_code {
	boost::system::error_code Error;
	Socket.open(asio::ip::udp::v4(), Error);
	if (not Error)
		Socket.bind({ asio::ip::udp::v4(), 0 }, Error);
	if (Error)
		net::close(Socket);
	return Error;
}

static auto ask(net::tDatagram & Socket, std::span<const dnssd::Question> Questions)
    -> asio::awaitable<void> {
	const auto Datagram = dnssd::encodeQuery(Questions);
	if (const auto Sent = co_await net::sendDatagram(Socket, Datagram, multicastGroup());
	    not Sent)
		spdlog::warn("discovery: query not sent: {}", Sent.error().message());
}

class MulticastBackend final : public Backend {
public:
	MulticastBackend(net::tExecutor Executor, Settings How)
	: Executor_(std::move(Executor))
	, Settings_(std::move(How))
	, ServiceName_(dnssd::makeName(std::format("{}.{}", Settings_.ServiceType, Settings_.Domain)))
	, Socket_(Executor_)
	, Timer_(Executor_)
	, Interval_(Settings_.BrowseInterval) {}

	auto next() -> asio::awaitable<net::tExpected<tBrowseEvent>> override;
	auto resolve(std::string Name, std::chrono::milliseconds Timeout)
	    -> asio::awaitable<net::tExpected<Resolved>> override;

	void stop() noexcept override { Stop_.request_stop(); }

private:
	// a service instance is refreshed at 80% of its lifetime and forgotten at 100%
	struct Sighting {
		tClock::time_point Refresh;
		tClock::time_point Expiry;
	};

	[[nodiscard]] bool maintain(tClock::time_point Now);
	[[nodiscard]] auto deadline() const -> tClock::time_point;
	void take(std::string_view Datagram, tClock::time_point Now);
	void restart() noexcept;

	net::tExecutor Executor_;
	Settings Settings_;
	dnssd::tName ServiceName_;
	net::tDatagram Socket_;
	net::tTimer Timer_;
	std::stop_source Stop_;

	tClock::duration Interval_;
	tClock::time_point NextQuery_ = {};
	std::map<std::string, Sighting> Known_;
	std::deque<tBrowseEvent> Ready_;
};

// returns whether it is time to ask for the service instances again.
// the query interval doubles after every scheduled query.
bool MulticastBackend::maintain(tClock::time_point Now) {
	bool Ask = false;
	if (Now >= NextQuery_) {
		Ask        = true;
		NextQuery_ = Now + Interval_;
		Interval_  = std::min(Interval_ * 2, MaxBrowseInterval);
	}
	for (auto Entry = Known_.begin(); Entry != Known_.end();) {
		auto & [Name, Seen] = *Entry;
		if (Seen.Expiry <= Now) {
			Ready_.push_back(ServiceRemoved{ Name });
			Entry = Known_.erase(Entry);
			continue;
		}
		if (Seen.Refresh <= Now) {
			Ask          = true;
			Seen.Refresh = Seen.Expiry;
		}
		++Entry;
	}
	return Ask;
}

// browsing starts over on a fresh socket with the next call of 'next()'
void MulticastBackend::restart() noexcept {
	net::close(Socket_);
	Interval_  = Settings_.BrowseInterval;
	NextQuery_ = {};
}

auto MulticastBackend::deadline() const -> tClock::time_point {
	auto Earliest = NextQuery_;
	for (const auto & [Name, Seen] : Known_)
		Earliest = std::min({ Earliest, Seen.Refresh, Seen.Expiry });
	return Earliest;
}

// PTR answers for the service type announce (or with a TTL of 0 withdraw) instances
void MulticastBackend::take(std::string_view Datagram, tClock::time_point Now) {
	const auto Message = dnssd::decode(Datagram);
	if (not Message) {
		spdlog::debug("discovery: ignoring malformed response: {}", Message.error().message());
		return;
	}
	if (not Message->IsResponse_)
		return;

	std::vector<std::string> Appeared;
	for (const auto & Record : Message->Records_) {
		const auto * Pointer = std::get_if<dnssd::PtrData>(&Record.Data_);
		if (not Pointer or not dnssd::sameName(Record.Name_, ServiceName_))
			continue;
		const auto & Target = Pointer->Target_;
		if (Target.size() != ServiceName_.size() + 1 or not dnssd::endsWith(Target, ServiceName_))
			continue;

		const auto & Instance = Target.front();
		if (Record.Ttl_ == 0) {
			if (Known_.erase(Instance) > 0)
				Ready_.push_back(ServiceRemoved{ Instance });
			continue;
		}
		const auto Lifetime = std::chrono::seconds{ Record.Ttl_ };
		const auto [Where, isNew] =
		    Known_.insert_or_assign(Instance, Sighting{ .Refresh = Now + Lifetime * 4 / 5,
		                                                .Expiry  = Now + Lifetime });
		if (isNew)
			Appeared.push_back(Instance);
	}
	for (std::size_t Index = 0; Index < Appeared.size(); ++Index)
		Ready_.push_back(ServiceFound{ .Name       = std::move(Appeared[Index]),
		                               .MoreComing = Index + 1 < Appeared.size() });
}

auto MulticastBackend::next() -> asio::awaitable<net::tExpected<tBrowseEvent>> {
	const auto WatchDog = executor::abortOn(Stop_.get_token(), Socket_, Timer_);
	if (not Socket_.is_open()) {
		if (const auto Error = openSocket(Socket_); Error)
			co_return std::unexpected{ Error };
	}

	const std::array Browse{ dnssd::Question{ .Name_ = ServiceName_,
		                                      .Type_ = dnssd::RecordType::PTR } };
	std::string Datagram;
	net::tDatagramSource Responder;
	while (Ready_.empty()) {
		if (Stop_.stop_requested())
			co_return std::unexpected{ std::make_error_code(std::errc::operation_canceled) };
		if (maintain(tClock::now()))
			co_await ask(Socket_, Browse);
		if (not Ready_.empty())
			break;

		Timer_.expires_at(deadline());
		const auto Received = co_await net::receiveDatagram(Socket_, Timer_, Datagram, Responder);
		if (Received) {
			take(Datagram, tClock::now());
		} else if (not net::isTimeout(Received.error())) {
			restart();
			co_return std::unexpected{ Received.error() };
		}
	}
	auto Event = std::move(Ready_.front());
	Ready_.pop_front();
	co_return Event;
}

// the SRV record names host and port, the TXT record carries the optional path
auto MulticastBackend::resolve(std::string Name, std::chrono::milliseconds Timeout)
    -> asio::awaitable<net::tExpected<Resolved>> {
	net::tDatagram Socket(Executor_);
	if (const auto Error = openSocket(Socket); Error)
		co_return std::unexpected{ Error };
	net::tTimer Timer(Executor_);
	const auto WatchDog = executor::abortOn(Stop_.get_token(), Socket, Timer);

	auto Instance = ServiceName_;
	Instance.insert(Instance.begin(), std::move(Name));
	const std::array Questions{
		dnssd::Question{ .Name_ = Instance, .Type_ = dnssd::RecordType::SRV },
		dnssd::Question{ .Name_ = Instance, .Type_ = dnssd::RecordType::TXT },
	};

	const auto Deadline = tClock::now() + Timeout;
	auto NextQuery      = tClock::now();
	std::optional<dnssd::SrvData> Srv;
	std::optional<dnssd::TxtData> Txt;
	std::string Datagram;
	net::tDatagramSource Responder;
	while (not Srv) {
		const auto Now = tClock::now();
		if (Stop_.stop_requested())
			co_return std::unexpected{ std::make_error_code(std::errc::operation_canceled) };
		if (Now >= Deadline)
			co_return std::unexpected{ std::make_error_code(std::errc::timed_out) };
		if (Now >= NextQuery) {
			co_await ask(Socket, Questions);
			NextQuery = Now + ResolveQueryInterval;
		}

		Timer.expires_at(std::min(NextQuery, Deadline));
		const auto Received = co_await net::receiveDatagram(Socket, Timer, Datagram, Responder);
		if (not Received) {
			if (net::isTimeout(Received.error()))
				continue;
			co_return std::unexpected{ Received.error() };
		}
		const auto Message = dnssd::decode(Datagram);
		if (not Message or not Message->IsResponse_)
			continue;
		for (const auto & Record : Message->Records_) {
			if (not dnssd::sameName(Record.Name_, Instance))
				continue;
			if (const auto * Service = std::get_if<dnssd::SrvData>(&Record.Data_))
				Srv = *Service;
			else if (const auto * Text = std::get_if<dnssd::TxtData>(&Record.Data_))
				Txt = *Text;
		}
	}

	Resolved Service{ .HostName = dnssd::toString(Srv->Target_) + '.', .Port = Srv->Port_ };
	if (Txt) {
		if (auto Path = dnssd::txtValue(*Txt, "path"))
			Service.Txt.emplace("path", std::move(*Path));
	}
	co_return Service;
}

auto makeMulticastBackend(net::tExecutor Executor, Settings How) -> std::unique_ptr<Backend> {
	return std::make_unique<MulticastBackend>(std::move(Executor), std::move(How));
}

} // namespace discovery
