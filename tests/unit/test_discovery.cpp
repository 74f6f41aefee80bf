#include "../framework/SimpleTest.hpp"

#include <boost/asio.hpp>

import std;

import discovery;
import model;
import net;
import testing;

namespace asio = boost::asio;

using namespace std::chrono_literals;

static auto quick() -> discovery::Settings {
	discovery::Settings How;
	How.FirstResolveTimeout = 10ms;
	How.RetryResolveTimeout = 15ms;
	How.RetryDelay          = 1ms;
	How.BrowseRetryDelay    = 5ms;
	return How;
}

static auto answeredBy(std::string Host) {
	return [Host](const std::string &) -> net::tExpected<discovery::Resolved> {
		return discovery::Resolved{ .HostName = Host + '.', .Port = 8765, .Txt = {} };
	};
}

static auto failingWith(std::errc Error) {
	return [Error](const std::string &) -> net::tExpected<discovery::Resolved> {
		return std::unexpected{ std::make_error_code(Error) };
	};
}

struct Fixture {
	Fixture()
	: Script_(std::make_shared<testing::Script>(Context_.get_executor())) {}

	void run(std::chrono::milliseconds Duration = 100ms) {
		Locator_ = std::make_shared<discovery::ServiceLocator>(
		    Context_.get_executor(), std::make_unique<testing::ScriptedBackend>(Script_),
		    quick(), 8080);
		Locator_->onEndpoint([this](model::Endpoint Where) { Found_.push_back(Where); });
		Locator_->start();
		testing::settle(Context_, Duration);
	}

	[[nodiscard]] auto resolved() const {
		std::vector<std::string> Names;
		for (const auto & [Name, Timeout] : Script_->Resolves_)
			Names.push_back(Name);
		return Names;
	}

	~Fixture() {
		if (Locator_) {
			Locator_->stop();
			testing::settle(Context_);
		}
	}

	asio::io_context Context_;
	std::shared_ptr<testing::Script> Script_;
	std::shared_ptr<discovery::ServiceLocator> Locator_;
	std::vector<model::Endpoint> Found_;
};

TEST_CASE(preferredServicesResolveRightAway) {
	Fixture The;
	The.Script_->Events_ = { discovery::ServiceFound{ "Hallway Display", true },
		                     discovery::ServiceFound{ "SmartMirror Kitchen", true } };
	The.Script_->Answer_ = answeredBy("kitchen.local");
	The.run();

	ASSERT_EQ(The.resolved(), std::vector<std::string>{ "SmartMirror Kitchen" });
	ASSERT_EQ(The.Found_.size(), 1u);
	ASSERT_EQ(The.Found_[0].Host, "kitchen.local");
	ASSERT_EQ(The.Found_[0].TransportPort, 8765);
	ASSERT_EQ(The.Found_[0].RequestPort, 8080);
	ASSERT_EQ(The.Found_[0].TransportPath, "/ws");
	ASSERT_FALSE(The.Locator_->attemptOf("SmartMirror Kitchen").has_value());
}

TEST_CASE(theLastOfABatchResolves) {
	Fixture The;
	The.Script_->Events_ = { discovery::ServiceFound{ "Hallway Display", true },
		                     discovery::ServiceFound{ "Living Room", false } };
	The.Script_->Answer_ = answeredBy("living.local");
	The.run();

	ASSERT_EQ(The.resolved(), std::vector<std::string>{ "Living Room" });
	ASSERT_EQ(The.Found_.size(), 1u);
}

TEST_CASE(timeoutsAreRetriedUpToTheLimit) {
	Fixture The;
	The.Script_->Events_ = { discovery::ServiceFound{ "SmartMirror", false } };
	The.Script_->Answer_ = failingWith(std::errc::timed_out);
	The.run();

	const auto & Resolves = The.Script_->Resolves_;
	ASSERT_EQ(Resolves.size(), 3u);
	ASSERT_TRUE(Resolves[0].second == 10ms);
	ASSERT_TRUE(Resolves[1].second == 15ms);
	ASSERT_TRUE(Resolves[2].second == 15ms);
	ASSERT_TRUE(The.Found_.empty());
	ASSERT_FALSE(The.Locator_->attemptOf("SmartMirror").has_value());
}

TEST_CASE(otherFailuresAreNotRetried) {
	Fixture The;
	The.Script_->Events_ = { discovery::ServiceFound{ "SmartMirror", false } };
	The.Script_->Answer_ = failingWith(std::errc::host_unreachable);
	The.run();

	ASSERT_EQ(The.Script_->Resolves_.size(), 1u);
	ASSERT_TRUE(The.Found_.empty());
}

TEST_CASE(removedServicesAreNoLongerResolved) {
	Fixture The;
	The.Script_->Events_ = { discovery::ServiceFound{ "SmartMirror", false },
		                     discovery::ServiceRemoved{ "SmartMirror" } };
	The.Script_->Answer_ = failingWith(std::errc::timed_out);
	The.run();

	ASSERT_TRUE(The.Script_->Resolves_.size() <= 1u);
	ASSERT_FALSE(The.Locator_->attemptOf("SmartMirror").has_value());
}

TEST_CASE(theLatestServiceWins) {
	Fixture The;
	The.Script_->Events_ = { discovery::ServiceFound{ "Hallway", false },
		                     discovery::ServiceFound{ "Bedroom", false } };
	The.Script_->Answer_ = [](const std::string & Name) -> net::tExpected<discovery::Resolved> {
		return discovery::Resolved{ .HostName = Name + ".local", .Port = 8765, .Txt = {} };
	};
	The.run();

	ASSERT_FALSE(The.Found_.empty());
	ASSERT_EQ(The.Found_.back().Host, "Bedroom.local");
}

TEST_CASE(stoppedLocatorsStayQuiet) {
	Fixture The;
	The.Script_->Answer_ = answeredBy("mirror.local");
	The.run(10ms);
	The.Locator_->stop();
	The.Script_->Events_.push_back(discovery::ServiceFound{ "SmartMirror", false });
	testing::settle(The.Context_);

	ASSERT_TRUE(The.Script_->Resolves_.empty());
	ASSERT_TRUE(The.Found_.empty());
}

TEST_CASE(browsingRecoversFromBackendErrors) {
	Fixture The;
	The.Script_->Answer_ = answeredBy("mirror.local");
	The.Script_->Events_ = { std::unexpected{ std::make_error_code(std::errc::network_down) },
		                     std::unexpected{ std::make_error_code(std::errc::network_down) },
		                     discovery::ServiceFound{ "SmartMirror", false } };
	The.run();

	ASSERT_TRUE(The.Script_->Pulls_ >= 3);
	ASSERT_EQ(The.resolved(), std::vector<std::string>{ "SmartMirror" });
	ASSERT_EQ(The.Found_.size(), 1u);
	ASSERT_EQ(The.Found_.back().Host, "mirror.local");
}

TEST_CASE(endpointsComeFromTheServiceRecords) {
	const auto Where = discovery::makeEndpoint(
	    { .HostName = "mirror.local.", .Port = 9001, .Txt = { { "path", "socket" } } }, 8000);
	ASSERT_EQ(Where.Host, "mirror.local");
	ASSERT_EQ(Where.TransportPort, 9001);
	ASSERT_EQ(Where.TransportPath, "/socket");

	const auto Plain =
	    discovery::makeEndpoint({ .HostName = "mirror.local", .Port = 9001, .Txt = {} });
	ASSERT_EQ(Plain.Host, "mirror.local");
	ASSERT_EQ(Plain.TransportPath, "/ws");
	ASSERT_EQ(Plain.RequestPort, model::DefaultRequestPort);
}

int main() {
	mirror::test::TestRunner::instance().name("service locator");
	return mirror::test::TestRunner::instance().runAll();
}
