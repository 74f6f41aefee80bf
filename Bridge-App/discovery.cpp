module;
#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <spdlog/spdlog.h>

module discovery;
import std;

import executor;
import model;
import net;

namespace asio = boost::asio;

namespace discovery {

static constexpr auto EventCapacity = 16uz;
static constexpr auto MaxBrowseRetryDelay = std::chrono::milliseconds{ std::chrono::minutes{ 1 } };

auto makeEndpoint(const Resolved & Service, std::uint16_t RequestPort) -> model::Endpoint {
	std::string_view Host = Service.HostName;
	if (Host.ends_with('.'))
		Host.remove_suffix(1);

	std::string_view Path;
	if (const auto Found = Service.Txt.find("path"); Found != Service.Txt.end())
		Path = Found->second;

	return { .Host          = std::string{ Host },
		     .TransportPort = Service.Port,
		     .RequestPort   = RequestPort,
		     .TransportPath = model::normalizePath(Path) };
}

ServiceLocator::ServiceLocator(net::tExecutor Executor, std::unique_ptr<Backend> Source,
                               Settings How, std::uint16_t RequestPort)
: Executor_(std::move(Executor))
, Backend_(std::move(Source))
, Settings_(std::move(How))
, RequestPort_(RequestPort)
, Events_(Executor_, EventCapacity) {}

void ServiceLocator::start() {
	spdlog::info("discovery: searching for {} services in {}", Settings_.ServiceType,
	             Settings_.Domain);
	executor::launch(Executor_, browse(shared_from_this()));
	executor::launch(Executor_, dispatch(shared_from_this()));
}

void ServiceLocator::stop() {
	if (std::exchange(Stopped_, true))
		return;
	spdlog::info("discovery: stopped searching");
	Resolving_.clear();
	Backend_->stop();
	Events_.close();
}

auto ServiceLocator::attemptOf(const std::string & Name) const -> std::optional<int> {
	if (const auto Found = Resolving_.find(Name); Found != Resolving_.end())
		return Found->second.Attempt;
	return std::nullopt;
}

// forward the browse events of the backend to the dispatcher.
// a failing backend is asked again after a pause that grows with every failure.
auto ServiceLocator::browse(std::shared_ptr<ServiceLocator> Self) -> asio::awaitable<void> {
	auto Pause = Self->Settings_.BrowseRetryDelay;
	while (not Self->Stopped_) {
		auto Event = co_await Self->Backend_->next();
		if (Self->Stopped_)
			break;
		if (not Event) {
			spdlog::warn("discovery: browsing failed: {}, trying again in {}ms",
			             Event.error().message(), Pause.count());
			if (not co_await executor::sleepFor(Self->Executor_, Pause))
				break;
			Pause = std::min(Pause * 2, MaxBrowseRetryDelay);
			continue;
		}
		Pause = Self->Settings_.BrowseRetryDelay;
		auto [Error] = co_await Self->Events_.async_send(
		    boost::system::error_code{}, std::visit([](auto && What) -> tEvent { return What; },
		                                            std::move(Event).value()));
		if (Error)
			break;
	}
}

auto ServiceLocator::dispatch(std::shared_ptr<ServiceLocator> Self) -> asio::awaitable<void> {
	while (not Self->Stopped_) {
		auto [Error, Event] = co_await Self->Events_.async_receive();
		if (Error or Self->Stopped_)
			break;
		std::visit(
		    [&](auto && What) {
			    Self->handle(std::move(What));
		    },
		    std::move(Event));
	}
}

auto ServiceLocator::resolve(std::shared_ptr<ServiceLocator> Self, std::string Name,
                             std::uint64_t Ticket, int Attempt) -> asio::awaitable<void> {
	const auto & How = Self->Settings_;
	if (Attempt > 1 and not co_await executor::sleepFor(Self->Executor_, How.RetryDelay))
		co_return;
	if (not Self->tracked(Name, Ticket))
		co_return;

	const auto Timeout = Attempt == 1 ? How.FirstResolveTimeout : How.RetryResolveTimeout;
	spdlog::info("discovery: resolving '{}' (attempt {}/{}, timeout {}ms)", Name, Attempt,
	             How.MaxResolveAttempts, Timeout.count());

	auto Service = co_await Self->Backend_->resolve(Name, Timeout);
	auto Outcome  = Service ? tEvent{ ServiceResolved{ Name, Ticket, std::move(*Service) } }
	                        : tEvent{ ResolutionFailed{ Name, Ticket, Service.error() } };
	if (auto [Error] =
	        co_await Self->Events_.async_send(boost::system::error_code{}, std::move(Outcome));
	    Error)
		spdlog::debug("discovery: outcome for '{}' dropped: {}", Name, Error.message());
}

// a new resolution supersedes the one in progress
void ServiceLocator::beginResolve(const std::string & Name, int Attempt) {
	if (Attempt == 1)
		std::erase_if(Resolving_, [&](const auto & Entry) { return Entry.first != Name; });

	const auto Ticket = ++NextTicket_;
	Resolving_.insert_or_assign(Name, Tracking{ .Attempt = Attempt, .Ticket = Ticket });
	executor::launch(Executor_, resolve(shared_from_this(), Name, Ticket, Attempt));
}

bool ServiceLocator::tracked(const std::string & Name, std::uint64_t Ticket) const {
	const auto Found = Resolving_.find(Name);
	return Found != Resolving_.end() and Found->second.Ticket == Ticket;
}

void ServiceLocator::handle(ServiceFound Found) {
	spdlog::info("discovery: found service '{}'", Found.Name);
	if (Resolving_.contains(Found.Name))
		return;
	if (Found.Name.contains(Settings_.Preferred) or not Found.MoreComing)
		beginResolve(Found.Name, 1);
}

void ServiceLocator::handle(ServiceRemoved Removed) {
	spdlog::info("discovery: service '{}' went away", Removed.Name);
	Resolving_.erase(Removed.Name);
}

void ServiceLocator::handle(ServiceResolved Done) {
	if (not tracked(Done.Name, Done.Ticket))
		return;
	Resolving_.erase(Done.Name);

	auto Where = makeEndpoint(Done.Service, RequestPort_);
	spdlog::info("discovery: resolved '{}' to {}", Done.Name, model::describe(Where));
	if (Handler_)
		Handler_(std::move(Where));
}

// only timeouts are worth another try
void ServiceLocator::handle(ResolutionFailed Failed) {
	if (not tracked(Failed.Name, Failed.Ticket))
		return;

	const auto Attempt = Resolving_.at(Failed.Name).Attempt;
	spdlog::warn("discovery: resolving '{}' failed: {}", Failed.Name, Failed.Error.message());
	if (net::isTimeout(Failed.Error) and Attempt < Settings_.MaxResolveAttempts) {
		beginResolve(Failed.Name, Attempt + 1);
		return;
	}
	spdlog::warn("discovery: giving up on '{}'", Failed.Name);
	Resolving_.erase(Failed.Name);
}

} // namespace discovery
