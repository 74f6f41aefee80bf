export module player;
import std;

import control;

// stands in for the media session of the host: it keeps a play state and an output
// volume, and logs what the mirror display asks it to do.

export namespace player {

class LoggingPlayer final : public control::MediaController {
public:
	void togglePlayPause() override;
	void nextTrack() override;
	void previousTrack() override;
	double outputVolume() const override { return Volume_; }
	void setOutputVolume(double Volume) override;

	[[nodiscard]] bool playing() const noexcept { return Playing_; }
	[[nodiscard]] int track() const noexcept { return Track_; }

private:
	bool Playing_  = false;
	int Track_     = 0;
	double Volume_ = 0.5;
};

} // namespace player
