module;
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

module transport;
import std;

import executor;
import model;
import net;

namespace asio = boost::asio;

namespace transport {

using net::operator||;

auto toString(State Which) -> std::string_view {
	switch (Which) {
		using enum State;
		case Idle:       return "idle";
		case Connecting: return "connecting";
		case Open:       return "open";
		case Closed:     return "closed";
	}
	return "unknown";
}

static auto terminated(std::string Text) -> std::string {
	if (not Text.ends_with('\n'))
		Text += '\n';
	return Text;
}

Channel::Channel(net::tExecutor Executor, tLinkFactory MakeLink, Settings How)
: Executor_(std::move(Executor))
, MakeLink_(std::move(MakeLink))
, Settings_(std::move(How))
, Serializer_(Executor_) {}

void Channel::connect() {
	if (State_ == State::Connecting or State_ == State::Open)
		return;

	++Generation_;
	Link_     = MakeLink_();
	Flushing_ = false;
	Settled_  = std::make_shared<executor::Signal>(Executor_);
	if (not Settings_.Greeting.empty() and not Greeting_) {
		Pending_.push_front(terminated(Settings_.Greeting));
		Greeting_ = true;
	}

	changeTo(State::Connecting);
	executor::launch(Executor_, run(shared_from_this(), Link_, Generation_));
}

// runs through the serializer so that the closing handshake never cuts into a message
static auto farewell(std::shared_ptr<Link> Connection) -> asio::awaitable<void> {
	co_await Connection->shutdown();
	Connection->close();
}

void Channel::disconnect() {
	Pending_.clear();
	Greeting_ = false;
	if (State_ == State::Idle or State_ == State::Closed)
		return;

	spdlog::info("transport: disconnecting");
	++Generation_;
	const bool WasOpen = isOpen();
	auto Connection    = std::exchange(Link_, nullptr);
	Flushing_          = false;
	changeTo(State::Closed);

	if (WasOpen)
		executor::launch(Executor_, Serializer_.enqueue([Connection] {
			return farewell(Connection);
		}));
	else
		Connection->close();
}

auto Channel::send(std::string Text) -> asio::awaitable<void> {
	Text = terminated(std::move(Text));
	if (not isOpen() or Flushing_) {
		queue(std::move(Text));
		co_return;
	}
	co_await Serializer_.enqueue(
	    [Self = shared_from_this(), Connection = Link_, Generation = Generation_,
	     Text = std::move(Text)] {
		    return Self->transmit(Connection, Generation, { Message::Kind::Text, Text });
	    });
}

auto Channel::sendEnvelope(std::string_view Type, const model::tJson & Payload)
    -> asio::awaitable<void> {
	return send(model::envelope(Type, Payload));
}

void Channel::post(std::string Text) {
	executor::launch(
	    Executor_,
	    [](std::shared_ptr<Channel> Self, std::string Text) -> asio::awaitable<void> {
		    co_await Self->send(std::move(Text));
	    }(shared_from_this(), std::move(Text)));
}

auto Channel::waitUntilOpen(std::chrono::milliseconds Timeout) -> asio::awaitable<bool> {
	if (State_ != State::Connecting or not Settled_)
		co_return isOpen();

	const auto Settled = Settled_;
	net::tTimer Timer(Executor_, Timeout);
	co_await (Settled->wait() || Timer.async_wait());
	co_return isOpen();
}

// the greeting stays in front, it is never dropped
void Channel::queue(std::string Text) {
	const auto Oldest = Greeting_ ? 1uz : 0uz;
	if (Pending_.size() >= Settings_.MaxQueued + Oldest and Pending_.size() > Oldest) {
		spdlog::warn("transport: queue full, dropping the oldest message");
		Pending_.erase(Pending_.begin() + static_cast<std::ptrdiff_t>(Oldest));
	}
	spdlog::debug("transport: queued message until the channel opens");
	Pending_.push_back(std::move(Text));
}

void Channel::changeTo(State Next) {
	if (State_ == Next)
		return;
	spdlog::debug("transport: {} -> {}", toString(State_), toString(Next));
	State_ = Next;
	if (Settled_ and (Next == State::Open or Next == State::Closed))
		Settled_->raise();
	if (Observer_)
		Observer_(Next);
}

// queued messages go out in order, before any message sent after opening
void Channel::opened() {
	spdlog::info("transport: open, {} queued message(s)", Pending_.size());
	changeTo(State::Open);
	if (Pending_.empty())
		return;

	Flushing_ = true;
	executor::launch(Executor_,
	                 Serializer_.enqueue([Self = shared_from_this(), Connection = Link_,
	                                      Generation = Generation_] {
		                 return Self->flush(Connection, Generation);
	                 }));
}

// queued messages survive an error, they go out after the next 'connect()'
void Channel::markClosed(std::string_view Why) {
	if (State_ == State::Closed)
		return;
	spdlog::warn("transport: closed, {}", Why);
	if (Link_)
		Link_->close();
	Flushing_ = false;
	changeTo(State::Closed);
}

auto Channel::run(std::shared_ptr<Channel> Self, tLink Connection,
                  std::uint64_t Generation) -> asio::awaitable<void> {
	const auto Error = co_await Connection->open();
	if (not Self->current(Generation))
		co_return;
	if (Error) {
		Self->markClosed(std::format("connect failed: {}", Error.message()));
		co_return;
	}
	Self->opened();
	co_await Self->receive(std::move(Connection), Generation);
}

// inbound messages are handled strictly one at a time
auto Channel::receive(tLink Connection, std::uint64_t Generation) -> asio::awaitable<void> {
	while (current(Generation)) {
		auto Inbound = co_await Connection->read();
		if (not current(Generation))
			break;
		if (not Inbound) {
			markClosed(std::format("receive failed: {}", Inbound.error().message()));
			break;
		}

		auto & [What, Payload] = *Inbound;
		switch (What) {
			using enum Message::Kind;
			case Text:
				spdlog::debug("transport: received '{}'", Payload);
				if (Inbound_)
					Inbound_(Payload);
				break;
			case Binary: spdlog::debug("transport: received {} bytes", Payload.size()); break;
			case Close:
				markClosed(Payload.empty() ? std::string{ "by the display" }
				                           : std::format("by the display: {}", Payload));
				co_return;
		}
	}
}

auto Channel::transmit(tLink Connection, std::uint64_t Generation, Message Outbound)
    -> asio::awaitable<void> {
	if (not current(Generation)) {
		spdlog::debug("transport: dropping a message for a stale connection");
		co_return;
	}
	const auto Size = Outbound.Payload_.size();
	if (const auto Error = co_await Connection->write(std::move(Outbound)); Error) {
		if (current(Generation))
			markClosed(std::format("send failed: {}", Error.message()));
	} else {
		spdlog::debug("transport: sent {} bytes", Size);
	}
}

auto Channel::flush(tLink Connection, std::uint64_t Generation) -> asio::awaitable<void> {
	while (current(Generation) and isOpen() and not Pending_.empty()) {
		auto Text = std::move(Pending_.front());
		Pending_.pop_front();
		Greeting_ = false;
		co_await transmit(Connection, Generation, { Message::Kind::Text, std::move(Text) });
	}
	if (current(Generation))
		Flushing_ = false;
}

} // namespace transport
