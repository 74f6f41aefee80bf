export module the.whole.caboodle;
import std;

import bridge;
import discovery;
import model;

namespace caboodle {

struct tOptions {
	std::optional<model::Endpoint> Fixed; // no discovery if given
	discovery::Settings Discovery;
	bridge::Settings Bridge;
	std::string LogLevel;
	std::filesystem::path Calendar;
};

// nothing if the options are unusable or help was asked for
export auto getOptions(int argc, char * argv[]) -> std::optional<tOptions>;

} // namespace caboodle
