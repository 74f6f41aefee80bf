module;
#include <spdlog/spdlog.h>

module player;
import std;

namespace player {

void LoggingPlayer::togglePlayPause() {
	Playing_ = not Playing_;
	spdlog::info("player: {}", Playing_ ? "playing" : "paused");
}

void LoggingPlayer::nextTrack() {
	spdlog::info("player: next track ({})", ++Track_);
}

void LoggingPlayer::previousTrack() {
	Track_ = std::max(0, Track_ - 1);
	spdlog::info("player: previous track ({})", Track_);
}

void LoggingPlayer::setOutputVolume(double Volume) {
	Volume_ = std::clamp(Volume, 0.0, 1.0);
	spdlog::info("player: volume {:.0f}%", Volume_ * 100);
}

} // namespace player
