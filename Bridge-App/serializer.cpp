module;
#include <boost/asio.hpp>

module serializer;
import std;

import executor;

namespace asio = boost::asio;

namespace serializer {

// raises the completion signal of a link in the chain, whatever happens to it
struct Release {
	explicit Release(std::shared_ptr<executor::Signal> Done)
	: Done_(std::move(Done)) {}
	Release(Release && Other) noexcept
	: Done_(std::exchange(Other.Done_, nullptr)) {}
	~Release() {
		if (Done_)
			Done_->raise();
	}

private:
	std::shared_ptr<executor::Signal> Done_;
};

static auto runAfter(std::shared_ptr<executor::Signal> Previous, Release Done,
                     tOperation Operation) -> asio::awaitable<void> {
	while (Previous and not Previous->raised())
		co_await Previous->wait();
	Previous.reset();
	co_await Operation();
}

// not a coroutine: the chain is extended at the call, not when the caller gets around
// to awaiting the result
auto SendSerializer::enqueue(tOperation Operation) -> asio::awaitable<void> {
	auto Done     = std::make_shared<executor::Signal>(Executor_);
	auto Previous = std::exchange(Last_, Done);
	return runAfter(std::move(Previous), Release{ std::move(Done) }, std::move(Operation));
}

} // namespace serializer
