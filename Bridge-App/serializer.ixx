module;
#include <boost/asio.hpp>

export module serializer;
import std;

import executor;
import net;

namespace asio = boost::asio;

// outbound writes on one connection happen strictly one after the other, in the order
// in which they were enqueued.

export namespace serializer {

using tOperation = std::function<asio::awaitable<void>()>;

class SendSerializer {
public:
	explicit SendSerializer(net::tExecutor Executor)
	: Executor_(std::move(Executor)) {}

	// the returned awaitable completes after 'Operation' has run to completion.
	// 'Operation' starts after every operation enqueued before it has finished, or its
	// awaitable was dropped without ever being awaited.
	[[nodiscard]] auto enqueue(tOperation Operation) -> asio::awaitable<void>;

private:
	net::tExecutor Executor_;
	std::shared_ptr<executor::Signal> Last_;
};

} // namespace serializer
