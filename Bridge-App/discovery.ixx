module;
#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>

export module discovery;
import std;

import model;
import net;

namespace asio = boost::asio;

using namespace std::chrono_literals;

// find the mirror display on the local network by its DNS-SD service advertisement and
// resolve it to an endpoint.

namespace discovery {

export {
	struct Settings {
		std::string ServiceType = "_mirror._tcp";
		std::string Domain      = "local";
		std::string Preferred   = "SmartMirror"; // resolved right away when seen
		int MaxResolveAttempts  = 3;
		std::chrono::milliseconds FirstResolveTimeout = 10s;
		std::chrono::milliseconds RetryResolveTimeout = 15s;
		std::chrono::milliseconds RetryDelay          = 1s;
		std::chrono::milliseconds BrowseInterval      = 1s; // doubles up to an hour
		std::chrono::milliseconds BrowseRetryDelay    = 1s; // doubles up to a minute
	};

	struct ServiceFound {
		std::string Name;
		bool MoreComing = false;
	};
	struct ServiceRemoved {
		std::string Name;
	};
	using tBrowseEvent = std::variant<ServiceFound, ServiceRemoved>;

	struct Resolved {
		std::string HostName;
		std::uint16_t Port;
		std::map<std::string, std::string> Txt; // the TXT keys the bridge knows, lower case
	};

	// the source of browse events and service resolutions
	class Backend {
	public:
		virtual ~Backend() = default;

		// fails if browsing is stopped, or for the time being impossible
		[[nodiscard]] virtual auto next() -> asio::awaitable<net::tExpected<tBrowseEvent>> = 0;
		// fails with 'timed_out' if 'Name' doesn't resolve within 'Timeout'
		[[nodiscard]] virtual auto resolve(std::string Name, std::chrono::milliseconds Timeout)
		    -> asio::awaitable<net::tExpected<Resolved>> = 0;
		virtual void stop() noexcept = 0;
	};

	[[nodiscard]] auto makeMulticastBackend(net::tExecutor Executor, Settings How)
	    -> std::unique_ptr<Backend>;

	// the host loses a trailing root label dot, the path comes from the TXT key 'path'
	[[nodiscard]] auto makeEndpoint(const Resolved & Service,
	                                std::uint16_t RequestPort = model::DefaultRequestPort)
	    -> model::Endpoint;

	using tEndpointHandler = std::function<void(model::Endpoint)>;
} // export

// what happens to the locator, one at a time

struct ServiceResolved {
	std::string Name;
	std::uint64_t Ticket;
	Resolved Service;
};
struct ResolutionFailed {
	std::string Name;
	std::uint64_t Ticket;
	std::error_code Error;
};
using tEvent = std::variant<ServiceFound, ServiceRemoved, ServiceResolved, ResolutionFailed>;
using tEvents = net::use_await::as_default_on_t<
    asio::experimental::channel<void(boost::system::error_code, tEvent)>>;

// precondition: the member functions are called on 'Executor', which is expected to be a
// strand. instances are owned by shared_ptrs.
export class ServiceLocator : public std::enable_shared_from_this<ServiceLocator> {
public:
	ServiceLocator(net::tExecutor Executor, std::unique_ptr<Backend> Source,
	               Settings How = {}, std::uint16_t RequestPort = model::DefaultRequestPort);

	void onEndpoint(tEndpointHandler Handler) { Handler_ = std::move(Handler); }

	void start();
	void stop();

	// the resolution attempt in progress for 'Name', if any
	[[nodiscard]] auto attemptOf(const std::string & Name) const -> std::optional<int>;

private:
	struct Tracking {
		int Attempt;
		std::uint64_t Ticket;
	};

	[[nodiscard]] static auto browse(std::shared_ptr<ServiceLocator> Self)
	    -> asio::awaitable<void>;
	[[nodiscard]] static auto dispatch(std::shared_ptr<ServiceLocator> Self)
	    -> asio::awaitable<void>;
	[[nodiscard]] static auto resolve(std::shared_ptr<ServiceLocator> Self, std::string Name,
	                                  std::uint64_t Ticket, int Attempt)
	    -> asio::awaitable<void>;

	void beginResolve(const std::string & Name, int Attempt);
	[[nodiscard]] bool tracked(const std::string & Name, std::uint64_t Ticket) const;

	void handle(ServiceFound Found);
	void handle(ServiceRemoved Removed);
	void handle(ServiceResolved Done);
	void handle(ResolutionFailed Failed);

	net::tExecutor Executor_;
	std::unique_ptr<Backend> Backend_;
	Settings Settings_;
	std::uint16_t RequestPort_;
	tEvents Events_;
	tEndpointHandler Handler_;

	std::map<std::string, Tracking> Resolving_; // at most one, the latest supersedes
	std::uint64_t NextTicket_ = 0;
	bool Stopped_             = false;
};

} // namespace discovery
