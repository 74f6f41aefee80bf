module;
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

module control;
import std;

namespace control {

static constexpr std::array ActionNames = {
	std::pair{ Action::PlayPause, std::string_view{ "playPause" } },
	std::pair{ Action::Skip, std::string_view{ "skip" } },
	std::pair{ Action::Back, std::string_view{ "back" } },
	std::pair{ Action::VolumeUp, std::string_view{ "volumeUp" } },
	std::pair{ Action::VolumeDown, std::string_view{ "volumeDown" } },
};

auto parseAction(std::string_view Name) -> std::optional<Action> {
	for (const auto & [What, Known] : ActionNames)
		if (Known == Name)
			return What;
	return std::nullopt;
}

auto toString(Action What) -> std::string_view {
	for (const auto & [Known, Name] : ActionNames)
		if (Known == What)
			return Name;
	return "unknown";
}

auto parseFrame(std::string_view Text) -> std::optional<std::string> {
	const auto Json = nlohmann::json::parse(Text, nullptr, false);
	if (not Json.is_object())
		return std::nullopt;
	const auto Type   = Json.find("type");
	const auto Action = Json.find("action");
	if (Type == Json.end() or not Type->is_string() or *Type != "control")
		return std::nullopt;
	if (Action == Json.end() or not Action->is_string())
		return std::nullopt;
	return Action->get<std::string>();
}

bool Dispatcher::handle(std::string_view Text) {
	const auto Name = parseFrame(Text);
	if (not Name) {
		spdlog::debug("control: ignoring '{}'", Text);
		return false;
	}
	const auto What = parseAction(*Name);
	if (not What) {
		spdlog::info("control: unknown action '{}'", *Name);
		return false;
	}
	perform(*What);
	return true;
}

void Dispatcher::perform(Action What) {
	spdlog::info("control: {}", toString(What));
	switch (What) {
		using enum Action;
		case PlayPause:  Target_->togglePlayPause(); break;
		case Skip:       Target_->nextTrack(); break;
		case Back:       Target_->previousTrack(); break;
		case VolumeUp:   adjustVolume(VolumeStep_); break;
		case VolumeDown: adjustVolume(-VolumeStep_); break;
	}
}

void Dispatcher::adjustVolume(double Delta) {
	Target_->setOutputVolume(std::clamp(Target_->outputVolume() + Delta, 0.0, 1.0));
}

} // namespace control
