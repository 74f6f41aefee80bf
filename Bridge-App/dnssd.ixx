export module dnssd;
import std;

import wire;

// DNS messages as used by multicast DNS service discovery (RFC 6762, RFC 6763).
// only the record types needed to browse and resolve a service are interpreted,
// all others are carried along without data.

export namespace dnssd {

enum class RecordType : std::uint16_t {
	A   = 1,
	PTR = 12,
	TXT = 16,
	SRV = 33,
	ANY = 255,
};

// a domain name as a sequence of labels, without the root label
using tName = std::vector<std::string>;

struct PtrData {
	tName Target_;
};
struct SrvData {
	std::uint16_t Priority_;
	std::uint16_t Weight_;
	std::uint16_t Port_;
	tName Target_;
};
struct TxtData {
	std::vector<std::string> Entries_;
};
struct AddressData {
	std::array<std::uint8_t, 4> Octets_;
};
using tRecordData = std::variant<std::monostate, PtrData, SrvData, TxtData, AddressData>;

struct Question {
	tName Name_;
	RecordType Type_;
	bool UnicastResponse_ = false;
};

struct Record {
	tName Name_;
	RecordType Type_;
	std::uint32_t Ttl_;
	tRecordData Data_;
};

// answers, authority and additional records are merged into 'Records_'
struct Message {
	std::uint16_t Id_ = 0;
	bool IsResponse_  = false;
	std::vector<Question> Questions_;
	std::vector<Record> Records_;
};

[[nodiscard]] auto makeName(std::string_view Dotted) -> tName;
[[nodiscard]] auto toString(const tName & Name) -> std::string;

// names compare case-insensitively
[[nodiscard]] bool sameName(const tName & Lhs, const tName & Rhs) noexcept;
[[nodiscard]] bool endsWith(const tName & Name, const tName & Suffix) noexcept;

[[nodiscard]] auto encodeQuery(std::span<const Question> Questions, std::uint16_t Id = 0)
    -> std::string;
[[nodiscard]] auto decode(std::string_view Datagram) -> wire::tExpected<Message>;

// the value of 'Key' in a TXT record of "key=value" entries.
// a key without '=' has an empty value.
[[nodiscard]] auto txtValue(const TxtData & Txt, std::string_view Key)
    -> std::optional<std::string>;

} // namespace dnssd
