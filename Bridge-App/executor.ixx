module;
#include <boost/asio.hpp>

export module executor;
import std;

import net;

namespace asio = boost::asio;

// Convenience types and functions to deal with the executor part of the
// Asio library https://think-async.com/Asio/

// The bridge runs all of its coroutines on a single strand of an io_context. The
// context may be driven by any number of threads, the strand makes sure that no two
// pieces of bridge work ever run concurrently.

namespace executor {
template <typename T>
constexpr inline bool Unfortunate = false;
template <typename T>
constexpr inline bool isExecutionContext = std::is_base_of_v<asio::execution_context, T>;
template <typename T>
constexpr inline bool isExecutor =
    asio::is_executor<T>::value or asio::execution::is_executor<T>::value;
template <typename T>
constexpr inline bool hasExecutor = requires(T t) {
	                                    { t.get_executor() };
                                    };

using ServiceBase = asio::execution_context::service;
struct StopService : ServiceBase {
	using key_type = StopService;

	static inline asio::execution_context::id id;

	using ServiceBase::ServiceBase;
	StopService(asio::execution_context & Ctx, std::stop_source Stop)
	: ServiceBase(Ctx)
	, Stop_(std::move(Stop)) {}

	std::stop_source get() const { return Stop_; }

private:
	void shutdown() noexcept override {}
	std::stop_source Stop_;
};

// precondition: 'Context' provides a 'StopService'

std::stop_source getStop(asio::execution_context & Context) {
	return asio::use_service<StopService>(Context).get();
}

template <typename T>
asio::execution_context & getContext(T & Object) noexcept {
	if constexpr (isExecutionContext<T>)
		return Object;
	else if constexpr (isExecutor<T>)
		return asio::query(Object, asio::execution::context);
	else if constexpr (hasExecutor<T>)
		return asio::query(Object.get_executor(), asio::execution::context);
	else
		static_assert(Unfortunate<T>, "Please give me an execution context");
}

// return the stop_source that is 'wired' to the given 'Object'

export [[nodiscard]] auto StopAssetOf(auto & Object) {
	return executor::getStop(executor::getContext(Object));
}

template <typename T>
static constexpr bool isAwaitable = false;
template <typename T>
static constexpr bool isAwaitable<asio::awaitable<T>> = true;

template <typename Func, typename... Ts>
struct isCallable {
	using ReturnType                       = std::invoke_result_t<Func, Ts...>;
	static constexpr bool invocable        = std::is_invocable_v<Func, Ts...>;
	static constexpr bool returnsAwaitable = isAwaitable<ReturnType>;
	static constexpr bool synchronously    = invocable and not returnsAwaitable;
	static constexpr bool asynchronously   = invocable and returnsAwaitable;
};

// run a piece of work independently on 'Executor', typically a strand.
// an escaping exception requests the application-wide stop if the context is wired to
// one, and leaves the context's 'run()' otherwise.

export void launch(const net::tExecutor & Executor, asio::awaitable<void> Work) {
	auto & Context = asio::query(Executor, asio::execution::context);
	asio::co_spawn(Executor, std::move(Work), [&Context](std::exception_ptr pEx) {
		if (not pEx)
			return;
		if (asio::has_service<StopService>(Context))
			executor::getStop(Context).request_stop();
		else
			std::rethrow_exception(pEx);
	});
}

// initiate independent asynchronous execution of a piece of work on a given executor.

#define WORKITEM std::invoke(std::forward<Func>(Work), std::forward<Ts>(Args)...)

export template <typename Func, typename... Ts>
    requires(isCallable<Func, Ts...>::asynchronously)
void commission(const net::tExecutor & Executor, Func && Work, Ts &&... Args) {
	executor::launch(Executor, WORKITEM);
}

// create a scheduler that issues pieces of work onto the given strand.
// asynchronous work is commissioned, synchronous work is executed right away.
// the execution context of the strand is augmented by a stop service related to the
// given stop_source.

#define WORK std::forward<Func>(Work), std::forward<Ts>(Args)...

export template <typename Strand>
[[nodiscard]] auto makeScheduler(Strand & Sequencer, std::stop_source & Stop) {
	asio::make_service<StopService>(Sequencer.context(), Stop);

	return [&]<typename Func, typename... Ts>(Func && Work, Ts &&... Args) {
		using mustBeCalled = isCallable<Func, Ts...>;
		if constexpr (mustBeCalled::asynchronously)
			executor::commission(Sequencer, WORK);
		else if constexpr (mustBeCalled::synchronously)
			return std::invoke(WORK);
		else
			static_assert(Unfortunate<Func>,
			              "Please help, I don't know how to execute this 'Work'");
	};
}

// abort operation of a given object depending on its capabilities.

#define THIS_WORKS(x)                                                                    \
	(requires(T Object) {                                                                \
		 { x };                                                                          \
	 }) x;

// clang-format off
template <typename T>
void _abort(T & Object) {
	if      constexpr THIS_WORKS( net::close(Object) )
	else if constexpr THIS_WORKS( Object.close()     )
	else if constexpr THIS_WORKS( Object.cancel()    )
	else
		static_assert(Unfortunate<T>, "Please tell me how to abort on this 'Object'");
}
// clang-format on

// create an object that is wired up to abort the operation of all given objects
// whenever 'Token' indicates a stop.

export [[nodiscard]] auto abortOn(std::stop_token Token, auto & Object,
                                  auto &... moreObjects) {
	return std::stop_callback{ std::move(Token), [&] {
		                          (_abort(Object), ..., _abort(moreObjects));
		                      } };
}

// same as above, wired to the application-wide stop of the context of 'Object'

export [[nodiscard]] auto abort(auto & Object, auto &... moreObjects) {
	return abortOn(StopAssetOf(Object).get_token(), Object, moreObjects...);
}

// a one-shot event that any number of coroutines can wait for.
// the waiting is cancellable through the usual asio cancellation slots, e.g. when the
// wait is raced against a timer.

export class Signal {
public:
	explicit Signal(net::tExecutor Executor)
	: Timer_(std::move(Executor), net::Forever) {}

	void raise() {
		Raised_ = true;
		Timer_.cancel();
	}
	[[nodiscard]] bool raised() const noexcept { return Raised_; }

	// returns 'true' if the signal was raised, 'false' if the wait was cancelled
	[[nodiscard]] auto wait() -> asio::awaitable<bool> {
		if (not Raised_)
			co_await Timer_.async_wait();
		co_return Raised_;
	}

private:
	net::tTimer Timer_;
	bool Raised_ = false;
};

// suspend for the given duration, or less if the wait is cancelled.
// returns 'true' if the full duration passed.

export [[nodiscard]] auto sleepFor(net::tExecutor Executor,
                                   std::chrono::steady_clock::duration Duration)
    -> asio::awaitable<bool> {
	net::tTimer Timer(std::move(Executor), Duration);
	co_return co_await net::expired(Timer);
}

} // namespace executor
