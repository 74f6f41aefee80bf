export module control;
import std;

// remote commands that the mirror display sends to the client, like
//   {"type":"control","action":"playPause"}

export namespace control {

enum class Action { PlayPause, Skip, Back, VolumeUp, VolumeDown };

[[nodiscard]] auto parseAction(std::string_view Name) -> std::optional<Action>;
[[nodiscard]] auto toString(Action What) -> std::string_view;

// the action name of a control frame, if 'Text' is one
[[nodiscard]] auto parseFrame(std::string_view Text) -> std::optional<std::string>;

// the local media playback that remote commands act upon
class MediaController {
public:
	virtual ~MediaController() = default;

	virtual void togglePlayPause()          = 0;
	virtual void nextTrack()                = 0;
	virtual void previousTrack()            = 0;
	virtual double outputVolume() const     = 0; // 0.0 - 1.0
	virtual void setOutputVolume(double Volume) = 0;
};

inline constexpr double DefaultVolumeStep = 0.10;

class Dispatcher {
public:
	explicit Dispatcher(std::shared_ptr<MediaController> Target,
	                    double VolumeStep = DefaultVolumeStep)
	: Target_(std::move(Target))
	, VolumeStep_(VolumeStep) {}

	// returns 'true' if 'Text' was a control frame with a known action.
	// anything else is logged and ignored.
	bool handle(std::string_view Text);
	void perform(Action What);

private:
	void adjustVolume(double Delta);

	std::shared_ptr<MediaController> Target_;
	double VolumeStep_;
};

} // namespace control
