module;
#include <boost/asio.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

module net;
import std;

namespace asio = boost::asio;

// the lowest-level networking routines with support for cancellation and timeouts

namespace net {
using namespace asio;

static constexpr auto MaxDatagramSize = 9000uz; // mDNS allows jumbo packets

// resolves the host name and connects to the first endpoint that accepts.
// both steps share the time budget of 'Timer'.
auto connectTo(std::string_view HostName, tPort Port, tTimer & Timer)
    -> awaitable<tExpectSocket> {
	tResolver Resolver(Timer.get_executor());
	auto Endpoints = flatten(co_await (
	    Resolver.async_resolve(HostName, std::to_string(Port), ip::resolver_base::numeric_service) ||
	    Timer.async_wait()));
	if (not Endpoints)
		co_return std::unexpected{ Endpoints.error() };
	if (Endpoints->empty())
		co_return std::unexpected{ std::error_code{ make_error_code(error::host_not_found) } };

	tSocket Socket(Timer.get_executor());
	co_return replace(
	    flatten(co_await (async_connect(Socket, *Endpoints) || Timer.async_wait())),
	    std::move(Socket));
}

auto sendDatagram(tDatagram & Socket, std::string_view Data,
                  const tDatagramSource & Destination) -> awaitable<tExpectSize> {
	auto [Error, Sent] = co_await Socket.async_send_to(buffer(Data), Destination);
	if (Error)
		co_return std::unexpected{ std::error_code{ Error } };
	co_return Sent;
}

// receives a single datagram into 'Buffer', replacing its previous contents.
auto receiveDatagram(tDatagram & Socket, tTimer & Timer, std::string & Buffer,
                     tDatagramSource & Sender) -> awaitable<tExpectSize> {
	Buffer.resize(MaxDatagramSize);
	auto Received = flatten(
	    co_await (Socket.async_receive_from(buffer(Buffer), Sender) || Timer.async_wait()));
	Buffer.resize(Received.value_or(0));
	co_return Received;
}

auto expired(tTimer & Timer) noexcept -> asio::awaitable<bool> {
	const auto [Error] = co_await Timer.async_wait();
	co_return not Error;
}

void close(tSocket & Socket) noexcept {
	boost::system::error_code Error;
	Socket.shutdown(tSocket::shutdown_both, Error);
	Socket.close(Error);
}

void close(tDatagram & Socket) noexcept {
	boost::system::error_code Error;
	Socket.close(Error);
}

} // namespace net
