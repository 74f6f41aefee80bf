module;
#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

module request;
import std;

import executor;
import model;
import net;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = boost::beast::http;

namespace request {

using net::operator||;

static constexpr unsigned HttpVersion = 11;
static constexpr std::string_view JsonContent = "application/json";

// one connection per request, only the head of the response is read
static auto exchange(net::tExecutor Executor, std::string Host, std::uint16_t Port,
                     std::chrono::milliseconds TimeBudget, tRequest Message)
    -> asio::awaitable<net::tExpected<unsigned>> {
	net::tTimer Timer(Executor, TimeBudget);
	const auto WatchDog = executor::abort(Timer);

	auto Socket = co_await net::connectTo(Host, net::tPort{ Port }, Timer);
	if (not Socket)
		co_return std::unexpected{ Socket.error() };

	Message.set(http::field::host, std::format("{}:{}", Host, Port));
	Message.keep_alive(false);
	Message.prepare_payload();
	const auto Sent = net::flatten(
	    co_await (http::async_write(*Socket, Message, net::use_await{}) || Timer.async_wait()));
	if (not Sent) {
		net::close(*Socket);
		co_return std::unexpected{ Sent.error() };
	}

	beast::flat_buffer Buffer;
	http::response_parser<http::empty_body> Response;
	const auto Received = net::flatten(co_await (
	    http::async_read_header(*Socket, Buffer, Response, net::use_await{}) ||
	    Timer.async_wait()));
	net::close(*Socket);
	if (not Received)
		co_return std::unexpected{ Received.error() };
	co_return Response.get().result_int();
}

auto makeHttpExchange(net::tExecutor Executor, std::string Host, std::uint16_t Port,
                      std::chrono::milliseconds TimeBudget) -> tExchange {
	return [=](tRequest Message) {
		return exchange(Executor, Host, Port, TimeBudget, std::move(Message));
	};
}

auto Channel::ping() -> asio::awaitable<bool> {
	const auto Status = co_await Exchange_(tRequest{ http::verb::get, "/ping", HttpVersion });
	if (not Status)
		spdlog::warn("request: ping failed: {}", Status.error().message());
	else if (not isSuccess(*Status))
		spdlog::warn("request: ping answered with status {}", *Status);

	reachable(Status and isSuccess(*Status));
	co_return Reachable_;
}

auto Channel::postJSON(std::string Path, model::tJson Body) -> asio::awaitable<void> {
	if (not Path.starts_with('/'))
		Path.insert(0, 1, '/');
	tRequest Post{ http::verb::post, Path, HttpVersion };
	Post.set(http::field::content_type, JsonContent);
	Post.body() = model::dump(Body);

	const auto Status = co_await Exchange_(std::move(Post));
	if (not Status) {
		spdlog::warn("request: POST {} failed: {}", Path, Status.error().message());
		reachable(false);
		co_return;
	}
	spdlog::info("request: POST {} -> status {}", Path, *Status);
	reachable(isSuccess(*Status));
}

void Channel::reachable(bool Now) {
	if (std::exchange(Reachable_, Now) != Now and Observer_)
		Observer_(Now);
}

} // namespace request
