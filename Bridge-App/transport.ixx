module;
#include <boost/asio.hpp>

export module transport;
import std;

import model;
import net;
import executor;
import serializer;

namespace asio = boost::asio;

using namespace std::chrono_literals;

// the persistent, message-oriented, full-duplex connection to the mirror display.
//
// a channel moves through the states
//   Idle -> Connecting -> Open -> Closed -> Connecting -> ...
// only 'connect()' leaves Idle or Closed. the channel never reconnects by itself.

export namespace transport {

enum class State { Idle, Connecting, Open, Closed };

[[nodiscard]] auto toString(State Which) -> std::string_view;

struct Settings {
	std::chrono::milliseconds ConnectTimeBudget = 5s;
	std::chrono::milliseconds WriteTimeBudget   = 5s;
	std::string Greeting          = "mirror-bridge client connected";
	std::size_t MaxMessageBytes   = 1uz << 20;
	std::size_t MaxQueued         = 64; // the oldest queued message gives way
};

// pings and the closing handshake are the business of the link. 'Close' is what 'read()'
// yields when the display closes the connection, its payload is the reason given.
struct Message {
	enum class Kind { Text, Binary, Close };

	Kind Kind_;
	std::string Payload_ = {};
};

// a single connection attempt to the display and the connection that results from it.
// reads and writes may be pending at the same time, 'close()' aborts both.
class Link {
public:
	virtual ~Link() = default;

	[[nodiscard]] virtual auto open() -> asio::awaitable<std::error_code>          = 0;
	[[nodiscard]] virtual auto write(Message Outbound) -> asio::awaitable<std::error_code> = 0;
	[[nodiscard]] virtual auto read() -> asio::awaitable<net::tExpected<Message>>  = 0;
	// the closing handshake with a 'going away' code, best effort
	[[nodiscard]] virtual auto shutdown() -> asio::awaitable<void> = 0;
	virtual void close() noexcept = 0;
};

// every 'connect()' starts over with a fresh link
using tLinkFactory = std::function<std::unique_ptr<Link>()>;

[[nodiscard]] auto makeWebSocketLink(net::tExecutor Executor, model::Endpoint Where,
                                     Settings How) -> std::unique_ptr<Link>;
[[nodiscard]] auto webSocketLinks(net::tExecutor Executor, model::Endpoint Where,
                                  Settings How) -> tLinkFactory;

using tInboundHandler = std::function<void(std::string_view)>;
using tStateObserver  = std::function<void(State)>;

// precondition: all member functions except 'post' are called on 'Executor', which
// is expected to be a strand. instances are owned by shared_ptrs.
class Channel : public std::enable_shared_from_this<Channel> {
public:
	Channel(net::tExecutor Executor, tLinkFactory MakeLink, Settings How = {});

	// no-op while connecting or open
	void connect();
	// drops queued messages, closes gracefully if open. no-op when not connected.
	void disconnect();

	// completes when 'Text' was written, or queued because the channel isn't open.
	// a line terminator is appended if missing.
	[[nodiscard]] auto send(std::string Text) -> asio::awaitable<void>;
	[[nodiscard]] auto sendEnvelope(std::string_view Type, const model::tJson & Payload)
	    -> asio::awaitable<void>;
	// 'send' from anywhere, without waiting
	void post(std::string Text);

	// 'true' if the channel is open within 'Timeout'
	[[nodiscard]] auto waitUntilOpen(std::chrono::milliseconds Timeout)
	    -> asio::awaitable<bool>;

	[[nodiscard]] State state() const noexcept { return State_; }
	[[nodiscard]] bool isOpen() const noexcept { return State_ == State::Open; }
	[[nodiscard]] std::size_t queued() const noexcept { return Pending_.size(); }
	[[nodiscard]] const net::tExecutor & executor() const noexcept { return Executor_; }

	void onInbound(tInboundHandler Handler) { Inbound_ = std::move(Handler); }
	void onStateChange(tStateObserver Observer) { Observer_ = std::move(Observer); }

private:
	using tLink = std::shared_ptr<Link>;

	[[nodiscard]] bool current(std::uint64_t Generation) const noexcept {
		return Generation == Generation_;
	}
	void queue(std::string Text);
	void changeTo(State Next);
	void opened();
	void markClosed(std::string_view Why);

	// 'Self' keeps the channel alive as long as the connection is in use
	[[nodiscard]] static auto run(std::shared_ptr<Channel> Self, tLink Connection,
	                              std::uint64_t Generation) -> asio::awaitable<void>;
	[[nodiscard]] auto receive(tLink Connection, std::uint64_t Generation)
	    -> asio::awaitable<void>;
	[[nodiscard]] auto transmit(tLink Connection, std::uint64_t Generation,
	                            Message Outbound) -> asio::awaitable<void>;
	[[nodiscard]] auto flush(tLink Connection, std::uint64_t Generation)
	    -> asio::awaitable<void>;

	net::tExecutor Executor_;
	tLinkFactory MakeLink_;
	Settings Settings_;
	serializer::SendSerializer Serializer_;

	State State_               = State::Idle;
	std::uint64_t Generation_  = 0;
	tLink Link_;
	std::deque<std::string> Pending_;
	bool Greeting_             = false; // at the front of 'Pending_'
	bool Flushing_             = false;
	std::shared_ptr<executor::Signal> Settled_; // raised when a connect attempt ends

	tInboundHandler Inbound_;
	tStateObserver Observer_;
};

} // namespace transport
