#include "../framework/SimpleTest.hpp"

#include <nlohmann/json.hpp>

import std;

import control;
import model;

using namespace std::chrono;
using namespace std::literals;

TEST_CASE(envelopeNamesTheTypeFirst) {
	const auto Text = model::envelope("nowPlaying", { { "title", "Song" }, { "album", "A" } });
	ASSERT_EQ(Text, R"({"type":"nowPlaying","payload":{"album":"A","title":"Song"}})");
}

TEST_CASE(nowPlayingJsonHasAllFields) {
	const model::NowPlayingInfo Info{ .Title     = "Song",
		                              .Artist    = "Band",
		                              .Album     = "Record",
		                              .Duration  = 180.0,
		                              .Position  = 12.5,
		                              .IsPlaying = true };
	const auto Json = model::toJson(Info);
	ASSERT_EQ(Json.size(), 6u);
	ASSERT_EQ(Json["title"], "Song");
	ASSERT_EQ(Json["isPlaying"], true);
	ASSERT_EQ(Json["duration"], 180.0);
	ASSERT_EQ(Json["position"], 12.5);
}

TEST_CASE(invalidUtf8IsReplacedNotThrown) {
	const auto Payload = model::tJson{ { "title", "Caf\xE9 Tacuba" } };
	const auto Text    = model::dump(Payload);
	ASSERT_EQ(Text, "{\"title\":\"Caf\xEF\xBF\xBD Tacuba\"}");
	ASSERT_TRUE(model::envelope("nowPlaying", Payload).contains("Caf\xEF\xBF\xBD Tacuba"));
}

TEST_CASE(controlEventsLeaveOutWhatIsAbsent) {
	const model::ControlEvent Pause{ .Kind      = model::ControlKind::Pause,
		                             .Timestamp = sys_days{ 2024y / 1 / 10 } + 14h + 5min +
		                                          7s + 250ms };
	const auto Json = model::toJson(Pause);
	ASSERT_EQ(Json.size(), 2u);
	ASSERT_EQ(Json["kind"], "pause");
	ASSERT_EQ(Json["timestamp"], "2024-01-10T14:05:07.250Z");

	const model::ControlEvent Volume{ .Kind = model::ControlKind::Volume, .Value = 0.4 };
	const auto Loud = model::toJson(Volume);
	ASSERT_EQ(Loud["value"], 0.4);
	ASSERT_FALSE(Loud.contains("title"));

	const model::ControlEvent Track{ .Kind   = model::ControlKind::TrackChanged,
		                             .Title  = "Song",
		                             .Artist = "Band" };
	const auto Changed = model::toJson(Track);
	ASSERT_EQ(Changed["kind"], "trackChanged");
	ASSERT_EQ(Changed["artist"], "Band");
	ASSERT_FALSE(Changed.contains("album"));
	ASSERT_FALSE(Changed.contains("value"));
}

TEST_CASE(controlKindsParseByName) {
	ASSERT_TRUE(model::parseControlKind("previous") == model::ControlKind::Previous);
	ASSERT_FALSE(model::parseControlKind("rewind").has_value());
}

TEST_CASE(transportPathsGetALeadingSlash) {
	ASSERT_EQ(model::normalizePath(""), "/ws");
	ASSERT_EQ(model::normalizePath("socket"), "/socket");
	ASSERT_EQ(model::normalizePath("/socket"), "/socket");
}

TEST_CASE(connectedMeansEitherChannel) {
	ASSERT_FALSE(model::ConnectionState{}.connected());
	ASSERT_TRUE((model::ConnectionState{ .TransportOpen = true }.connected()));
	ASSERT_TRUE((model::ConnectionState{ .RequestReachable = true }.connected()));
}

TEST_CASE(endpointsDescribeThemselves) {
	const model::Endpoint Where{ .Host = "mirror.local", .TransportPort = 8765 };
	ASSERT_EQ(model::describe(Where), "ws://mirror.local:8765/ws (rest port 8000)");
}

// a media controller that remembers what it was asked to do
struct Recorder final : control::MediaController {
	void togglePlayPause() override { Calls_.push_back("playPause"); }
	void nextTrack() override { Calls_.push_back("next"); }
	void previousTrack() override { Calls_.push_back("previous"); }
	double outputVolume() const override { return Volume_; }
	void setOutputVolume(double Volume) override { Volume_ = Volume; }

	std::vector<std::string> Calls_;
	double Volume_ = 0.5;
};

TEST_CASE(controlFramesReachTheMediaController) {
	auto Media = std::make_shared<Recorder>();
	control::Dispatcher Commands(Media);

	ASSERT_TRUE(Commands.handle(R"({"type":"control","action":"playPause"})"));
	ASSERT_TRUE(Commands.handle(R"({"action":"skip","type":"control"})"));
	ASSERT_TRUE(Commands.handle(R"({"type":"control","action":"back"})"));
	ASSERT_EQ(Media->Calls_, (std::vector<std::string>{ "playPause", "next", "previous" }));
}

TEST_CASE(otherFramesAreIgnored) {
	auto Media = std::make_shared<Recorder>();
	control::Dispatcher Commands(Media);

	ASSERT_FALSE(Commands.handle(R"({"type":"control","action":"rewind"})"));
	ASSERT_FALSE(Commands.handle(R"({"type":"nowPlaying","action":"skip"})"));
	ASSERT_FALSE(Commands.handle(R"({"type":"control"})"));
	ASSERT_FALSE(Commands.handle("not json at all"));
	ASSERT_TRUE(Media->Calls_.empty());
	ASSERT_EQ(control::parseFrame(R"({"type":"control","action":"volumeUp"})").value_or(""),
	          "volumeUp");
}

TEST_CASE(volumeStepsStayInRange) {
	auto Media = std::make_shared<Recorder>();
	control::Dispatcher Commands(Media, 0.25);

	Commands.perform(control::Action::VolumeUp);
	ASSERT_NEAR(Media->Volume_, 0.75, 1e-9);
	Commands.perform(control::Action::VolumeUp);
	Commands.perform(control::Action::VolumeUp);
	ASSERT_NEAR(Media->Volume_, 1.0, 1e-9);

	Media->Volume_ = 0.05;
	Commands.handle(R"({"type":"control","action":"volumeDown"})");
	ASSERT_NEAR(Media->Volume_, 0.0, 1e-9);
}

int main() {
	mirror::test::TestRunner::instance().name("model and control");
	return mirror::test::TestRunner::instance().runAll();
}
