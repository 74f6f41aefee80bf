module wire;
import std;

namespace wire {

struct Category : std::error_category {
	const char * name() const noexcept override { return "wire"; }

	std::string message(int Code) const override {
		switch (static_cast<Error>(Code)) {
			using enum Error;
			case Truncated: return "incomplete message";
			case MalformedName: return "malformed domain name";
			case MalformedRecord: return "malformed resource record";
		}
		return "unknown wire error";
	}
};

const std::error_category & category() noexcept {
	static const Category Instance;
	return Instance;
}

} // namespace wire
