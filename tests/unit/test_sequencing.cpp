#include "../framework/SimpleTest.hpp"

#include <boost/asio.hpp>

import std;

import coalescer;
import executor;
import net;
import serializer;
import testing;

namespace asio = boost::asio;

using namespace std::chrono_literals;

static auto step(net::tExecutor Executor, std::vector<std::string> & Log, int Index,
                 std::chrono::milliseconds Duration) -> asio::awaitable<void> {
	Log.push_back(std::format("begin {}", Index));
	co_await executor::sleepFor(Executor, Duration);
	Log.push_back(std::format("end {}", Index));
}

TEST_CASE(operationsNeverOverlap) {
	asio::io_context Context;
	serializer::SendSerializer Serializer(Context.get_executor());
	std::vector<std::string> Log;

	// the first one takes longest, it still finishes first
	const std::array<std::pair<int, std::chrono::milliseconds>, 3> Steps = {
		{ { 1, 30ms }, { 2, 10ms }, { 3, 0ms } }
	};
	for (const auto & Step : Steps)
		asio::co_spawn(Context, Serializer.enqueue([&, Step] {
			return step(Context.get_executor(), Log, Step.first, Step.second);
		}),
		               asio::detached);
	testing::settle(Context, 200ms);

	ASSERT_EQ(Log, (std::vector<std::string>{ "begin 1", "end 1", "begin 2", "end 2",
	                                          "begin 3", "end 3" }));
}

TEST_CASE(awaitingCompletesAfterTheOperation) {
	asio::io_context Context;
	serializer::SendSerializer Serializer(Context.get_executor());
	std::vector<std::string> Log;

	testing::drive(Context, [](serializer::SendSerializer & Serializer,
	                           std::vector<std::string> & Log,
	                           net::tExecutor Executor) -> asio::awaitable<void> {
		co_await Serializer.enqueue([&Log, Executor] { return step(Executor, Log, 1, 10ms); });
		Log.push_back("awaited");
	}(Serializer, Log, Context.get_executor()));

	ASSERT_EQ(Log, (std::vector<std::string>{ "begin 1", "end 1", "awaited" }));
}

TEST_CASE(droppedOperationsDoNotBlockTheChain) {
	asio::io_context Context;
	serializer::SendSerializer Serializer(Context.get_executor());
	std::vector<std::string> Log;

	{
		auto Dropped = Serializer.enqueue([&] { return step(Context.get_executor(), Log, 1, 0ms); });
	}
	asio::co_spawn(Context, Serializer.enqueue([&] {
		return step(Context.get_executor(), Log, 2, 0ms);
	}),
	               asio::detached);
	testing::settle(Context, 50ms);

	ASSERT_EQ(Log, (std::vector<std::string>{ "begin 2", "end 2" }));
}

static auto slowSend(net::tExecutor Executor, std::vector<int> & Sent, int Value)
    -> asio::awaitable<void> {
	Sent.push_back(Value);
	co_await executor::sleepFor(Executor, 20ms);
}

TEST_CASE(burstsSendTheFirstAndTheLatestValue) {
	asio::io_context Context;
	coalescer::Coalescer<int> Values;
	std::vector<int> Sent;
	const auto Sender = [&](int Value) {
		return slowSend(Context.get_executor(), Sent, Value);
	};

	for (const int Value : { 1, 2, 3 })
		asio::co_spawn(Context, Values.submit(Value, Sender), asio::detached);
	testing::settle(Context, 200ms);

	ASSERT_EQ(Sent, (std::vector<int>{ 1, 3 }));
	ASSERT_FALSE(Values.draining());
}

TEST_CASE(spacedValuesAreAllSent) {
	asio::io_context Context;
	coalescer::Coalescer<int> Values;
	std::vector<int> Sent;
	const auto Sender = [&](int Value) {
		return slowSend(Context.get_executor(), Sent, Value);
	};

	for (const int Value : { 1, 2 }) {
		asio::co_spawn(Context, Values.submit(Value, Sender), asio::detached);
		testing::settle(Context, 60ms);
	}
	ASSERT_EQ(Sent, (std::vector<int>{ 1, 2 }));
}

int main() {
	mirror::test::TestRunner::instance().name("sequencing");
	return mirror::test::TestRunner::instance().runAll();
}
