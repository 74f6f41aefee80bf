export module wire;
import std;

// errors of the DNS message codec are reported as std::error_code values of their own
// category.

export namespace wire {

enum class Error {
	Truncated = 1,      // need more bytes
	MalformedName,      // label overruns or compression loops
	MalformedRecord,
};

[[nodiscard]] const std::error_category & category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(Error Code) noexcept {
	return { static_cast<int>(Code), wire::category() };
}

template <typename T>
using tExpected = std::expected<T, std::error_code>;

} // namespace wire

template <>
struct std::is_error_code_enum<wire::Error> : std::true_type {};
