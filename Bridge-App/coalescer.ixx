module;
#include <boost/asio.hpp>

export module coalescer;
import std;

namespace asio = boost::asio;

// collapse bursts of updates of a rapidly changing value into sends of the latest one.

export namespace coalescer {

template <typename T>
class Coalescer {
public:
	using tSender = std::function<asio::awaitable<void>(T)>;

	// 'Value' replaces any value that is still pending.
	// the first caller drains the pending values one at a time and returns when nothing
	// is left, every other caller returns right away.
	[[nodiscard]] auto submit(T Value, tSender Sender) -> asio::awaitable<void> {
		Pending_ = std::move(Value);
		if (Draining_)
			co_return;

		const Drain Guard{ Draining_ };
		while (Pending_) {
			T Current = std::move(*Pending_);
			Pending_.reset();
			co_await Sender(std::move(Current));
		}
	}

	[[nodiscard]] bool draining() const noexcept { return Draining_; }

private:
	struct Drain {
		explicit Drain(bool & Flag)
		: Flag_(Flag) {
			Flag_ = true;
		}
		~Drain() { Flag_ = false; }
		bool & Flag_;
	};

	std::optional<T> Pending_;
	bool Draining_ = false;
};

} // namespace coalescer
