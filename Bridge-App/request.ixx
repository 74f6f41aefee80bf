module;
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>

export module request;
import std;

import model;
import net;

namespace asio = boost::asio;
namespace http = boost::beast::http;

using namespace std::chrono_literals;

// the stateless request/response channel to the REST side of the mirror display.
// it is independent of the transport channel, every call uses a connection of its own.

export namespace request {

using tRequest = http::request<http::string_body>;

// one request, answered by the response status
using tExchange = std::function<asio::awaitable<net::tExpected<unsigned>>(tRequest)>;

[[nodiscard]] auto makeHttpExchange(net::tExecutor Executor, std::string Host,
                                    std::uint16_t Port,
                                    std::chrono::milliseconds TimeBudget = 5s) -> tExchange;

[[nodiscard]] inline bool isSuccess(unsigned Status) noexcept {
	return http::to_status_class(Status) == http::status_class::successful;
}

using tReachabilityObserver = std::function<void(bool)>;

class Channel {
public:
	explicit Channel(tExchange Exchange)
	: Exchange_(std::move(Exchange)) {}

	// 'true' only for a success status of GET /ping. never fails otherwise.
	[[nodiscard]] auto ping() -> asio::awaitable<bool>;

	// best effort: the outcome shows only in the reachability and the log
	[[nodiscard]] auto postJSON(std::string Path, model::tJson Body) -> asio::awaitable<void>;

	[[nodiscard]] bool isReachable() const noexcept { return Reachable_; }
	void onReachabilityChange(tReachabilityObserver Observer) {
		Observer_ = std::move(Observer);
	}

private:
	void reachable(bool Now);

	tExchange Exchange_;
	bool Reachable_ = false;
	tReachabilityObserver Observer_;
};

} // namespace request
