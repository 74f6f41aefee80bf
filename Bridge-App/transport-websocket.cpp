module;
#include <boost/asio.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>

module transport;
import std;

import model;
import net;

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;

// the transport link that speaks WebSocket over a plain TCP connection.
// Beast answers pings and the display's closing handshake on its own.

namespace transport {

using net::operator||;

using tStream = websocket::stream<net::tSocket>;

class WebSocketLink final : public Link {
public:
	WebSocketLink(net::tExecutor Executor, model::Endpoint Where, Settings How)
	: Where_(std::move(Where))
	, Settings_(std::move(How))
	, Stream_(Executor)
	, ConnectTimer_(Executor)
	, WriteTimer_(Executor) {
		Stream_.read_message_max(Settings_.MaxMessageBytes);
		Stream_.set_option(websocket::stream_base::decorator([](websocket::request_type & Upgrade) {
			Upgrade.set(beast::http::field::user_agent, "mirror-bridge");
		}));
	}

	auto open() -> asio::awaitable<std::error_code> override;
	auto write(Message Outbound) -> asio::awaitable<std::error_code> override;
	auto read() -> asio::awaitable<net::tExpected<Message>> override;
	auto shutdown() -> asio::awaitable<void> override;

	void close() noexcept override {
		Closed_ = true;
		ConnectTimer_.cancel();
		WriteTimer_.cancel();
		net::close(Stream_.next_layer());
	}

private:
	model::Endpoint Where_;
	Settings Settings_;
	tStream Stream_;
	net::tTimer ConnectTimer_;
	net::tTimer WriteTimer_;
	beast::flat_buffer Buffer_;
	bool Closed_ = false;
};

static auto aborted() {
	return std::make_error_code(std::errc::operation_canceled);
}

// connect and perform the opening handshake within the connect time budget
auto WebSocketLink::open() -> asio::awaitable<std::error_code> {
	ConnectTimer_.expires_after(Settings_.ConnectTimeBudget);
	auto Connected =
	    co_await net::connectTo(Where_.Host, net::tPort{ Where_.TransportPort }, ConnectTimer_);
	if (Closed_)
		co_return aborted();
	if (not Connected)
		co_return Connected.error();
	Stream_.next_layer() = std::move(Connected).value();

	const auto Host  = std::format("{}:{}", Where_.Host, Where_.TransportPort);
	const auto Error = net::outcome(
	    co_await (Stream_.async_handshake(Host, Where_.TransportPath, net::use_await{}) ||
	              ConnectTimer_.async_wait()));
	if (Closed_)
		co_return aborted();
	if (not Error)
		spdlog::info("transport: upgraded to WebSocket at {}", model::describe(Where_));
	co_return Error;
}

auto WebSocketLink::write(Message Outbound) -> asio::awaitable<std::error_code> {
	Stream_.binary(Outbound.Kind_ == Message::Kind::Binary);
	WriteTimer_.expires_after(Settings_.WriteTimeBudget);
	const auto Sent = net::flatten(
	    co_await (Stream_.async_write(asio::buffer(Outbound.Payload_), net::use_await{}) ||
	              WriteTimer_.async_wait()));
	co_return Sent ? std::error_code{} : Sent.error();
}

// a message larger than 'MaxMessageBytes' fails the read
auto WebSocketLink::read() -> asio::awaitable<net::tExpected<Message>> {
	Buffer_.clear();
	const auto [Error, Size] = co_await Stream_.async_read(Buffer_, net::use_await{});
	if (Error == websocket::error::closed) {
		const auto & Reason = Stream_.reason();
		spdlog::info("transport: display closes with code {}", Reason.code);
		co_return Message{ Message::Kind::Close,
			               std::string{ Reason.reason.data(), Reason.reason.size() } };
	}
	if (Error)
		co_return std::unexpected{ std::error_code{ Error } };
	co_return Message{ Stream_.got_text() ? Message::Kind::Text : Message::Kind::Binary,
		               beast::buffers_to_string(Buffer_.data()) };
}

auto WebSocketLink::shutdown() -> asio::awaitable<void> {
	if (not Stream_.is_open())
		co_return;
	WriteTimer_.expires_after(Settings_.WriteTimeBudget);
	const auto Error = net::outcome(
	    co_await (Stream_.async_close(websocket::close_code::going_away, net::use_await{}) ||
	              WriteTimer_.async_wait()));
	if (Error)
		spdlog::debug("transport: closing handshake incomplete: {}", Error.message());
}

auto makeWebSocketLink(net::tExecutor Executor, model::Endpoint Where, Settings How)
    -> std::unique_ptr<Link> {
	return std::make_unique<WebSocketLink>(std::move(Executor), std::move(Where),
	                                       std::move(How));
}

auto webSocketLinks(net::tExecutor Executor, model::Endpoint Where, Settings How)
    -> tLinkFactory {
	return [Executor = std::move(Executor), Where = std::move(Where),
	        How = std::move(How)] { return makeWebSocketLink(Executor, Where, How); };
}

} // namespace transport
