module;
#include <boost/asio.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

export module net;
import std;

namespace asio = boost::asio;

// Convenience types and functions to deal with the networking part of the
// Asio library https://think-async.com/Asio/, as it comes with Boost. Asio reports
// boost::system::error_code values, the bridge passes them on as std::error_code.

// Every network operation of the bridge is a coroutine that races the actual I/O
// against a timer. The loser of the race is cancelled, a timer win is reported as
// 'timed_out'.

namespace aex = asio::experimental;
namespace net {

export {
	template <typename... Ts>
	using tResult   = std::tuple<boost::system::error_code, Ts...>;
	using use_await = asio::as_tuple_t<asio::use_awaitable_t<>>;
	using tSocket   = use_await::as_default_on_t<asio::ip::tcp::socket>;
	using tDatagram = use_await::as_default_on_t<asio::ip::udp::socket>;
	using tResolver = use_await::as_default_on_t<asio::ip::tcp::resolver>;
	using tTimer    = use_await::as_default_on_t<asio::steady_timer>;

	using tExecutor        = asio::any_io_executor;
	using tEndpoint        = asio::ip::tcp::endpoint;
	using tDatagramSource  = asio::ip::udp::endpoint;

	enum tPort : std::uint16_t {};

	// the network layer uses std::expected<T, error_code> as return types

	template <typename T>
	using tExpected     = std::expected<T, std::error_code>;
	using tExpectSize   = tExpected<std::size_t>;
	using tExpectSocket = tExpected<tSocket>;

	inline constexpr auto Forever = tTimer::time_point::max();
} // export

// map the 'variant' return type from asio operator|| into an 'expected'.
// the timer winning the race is a timeout, regardless of its own error code.

template <typename R, typename... Ts>
constexpr auto _map(tResult<Ts...> && Tuple) -> net::tExpected<R> {
	const auto & Error = std::get<boost::system::error_code>(Tuple);
	if constexpr (sizeof...(Ts) == 0)
		return std::unexpected{ std::make_error_code(std::errc::timed_out) };
	else if (Error)
		return std::unexpected{ std::error_code{ Error } };
	else
		return std::get<R>(std::move(Tuple));
}

export {
	using aex::awaitable_operators::operator||;

	template <typename... Ts, typename... Us>
	constexpr auto flatten(std::variant<tResult<Ts...>, tResult<Us...>> && Variant) {
		using net::_map;
		using tReturn = std::type_identity<Ts..., Us...>::type;
		return std::visit(
		    [](auto && Tuple) {
			    return _map<tReturn>(std::move(Tuple));
		    },
		    std::move(Variant));
	}

	template <typename Out, typename In>
	auto replace(net::tExpected<In> && Input, Out && Replacement)->net::tExpected<Out> {
		return std::move(Input).transform([&](In &&) {
			return std::forward<Out>(Replacement);
		});
	}

	// the same for operations that complete with an error code only
	[[nodiscard]] inline auto outcome(std::variant<tResult<>, tResult<>> && Variant)
	    -> std::error_code {
		if (Variant.index() == 1)
			return std::make_error_code(std::errc::timed_out);
		return std::error_code{ std::get<0>(std::get<0>(Variant)) };
	}

	[[nodiscard]] constexpr bool isTimeout(const std::error_code & Error) noexcept {
		return Error == std::errc::timed_out;
	}

	auto connectTo(std::string_view HostName, tPort Port, tTimer & Timer)
	    ->asio::awaitable<tExpectSocket>;

	auto sendDatagram(tDatagram & Socket, std::string_view Data,
	                  const tDatagramSource & Destination)
	    ->asio::awaitable<tExpectSize>;
	auto receiveDatagram(tDatagram & Socket, tTimer & Timer, std::string & Buffer,
	                     tDatagramSource & Sender)
	    ->asio::awaitable<tExpectSize>;

	auto expired(tTimer & Timer) noexcept -> asio::awaitable<bool>;

	void close(tSocket & Socket) noexcept;
	void close(tDatagram & Socket) noexcept;
} // export
} // namespace net
