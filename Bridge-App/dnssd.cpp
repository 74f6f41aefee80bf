module dnssd;
import std;

import wire;

namespace dnssd {

static constexpr auto HeaderSizeBytes = 12uz;
static constexpr auto MaxLabelSize    = 63uz;
static constexpr auto MaxPointerHops  = 64;

static constexpr std::uint16_t ClassInternet  = 0x0001;
static constexpr std::uint16_t UnicastBit     = 0x8000;
static constexpr std::uint8_t CompressionMark = 0xC0;

static constexpr char lower(char C) noexcept {
	return C >= 'A' and C <= 'Z' ? static_cast<char>(C - 'A' + 'a') : C;
}

static bool sameLabel(std::string_view Lhs, std::string_view Rhs) noexcept {
	return std::ranges::equal(Lhs, Rhs, {}, lower, lower);
}

auto makeName(std::string_view Dotted) -> tName {
	tName Name;
	for (const auto Label : std::views::split(Dotted, '.')) {
		if (not Label.empty())
			Name.emplace_back(std::string_view{ Label });
	}
	return Name;
}

auto toString(const tName & Name) -> std::string {
	std::string Dotted;
	for (const auto & Label : Name) {
		if (not Dotted.empty())
			Dotted += '.';
		Dotted += Label;
	}
	return Dotted;
}

bool sameName(const tName & Lhs, const tName & Rhs) noexcept {
	return std::ranges::equal(Lhs, Rhs, sameLabel);
}

bool endsWith(const tName & Name, const tName & Suffix) noexcept {
	return Name.size() >= Suffix.size() and
	       std::ranges::equal(Name | std::views::drop(Name.size() - Suffix.size()), Suffix,
	                          sameLabel);
}

// encoding queries

struct Writer {
	std::string Bytes_;

	void u8(std::uint8_t Value) { Bytes_.push_back(static_cast<char>(Value)); }
	void u16(std::uint16_t Value) {
		u8(static_cast<std::uint8_t>(Value >> 8));
		u8(static_cast<std::uint8_t>(Value & 0xFF));
	}
	// precondition: no label exceeds 63 bytes
	void name(const tName & Name) {
		for (const auto & Label : Name) {
			u8(static_cast<std::uint8_t>(std::min(Label.size(), MaxLabelSize)));
			Bytes_.append(Label, 0, MaxLabelSize);
		}
		u8(0);
	}
	// a standard query, no records
	void header(std::uint16_t Id, std::size_t Questions) {
		u16(Id);
		u16(0);
		u16(static_cast<std::uint16_t>(Questions));
		u16(0);
		u16(0);
		u16(0);
	}
};

auto encodeQuery(std::span<const Question> Questions, std::uint16_t Id) -> std::string {
	Writer Out;
	Out.header(Id, Questions.size());
	for (const auto & Question : Questions) {
		Out.name(Question.Name_);
		Out.u16(std::to_underlying(Question.Type_));
		Out.u16(Question.UnicastResponse_ ? ClassInternet | UnicastBit : ClassInternet);
	}
	return std::move(Out.Bytes_);
}

// decoding
// the reader remembers the first error and yields zeros from then on

struct Reader {
	std::string_view Message_;
	std::size_t Offset_ = 0;
	std::error_code Error_ = {};

	[[nodiscard]] bool failed() const noexcept { return static_cast<bool>(Error_); }
	void fail(wire::Error Code) noexcept {
		if (not Error_)
			Error_ = Code;
	}
	bool need(std::size_t Size) noexcept {
		if (failed() or Offset_ + Size > Message_.size()) {
			fail(wire::Error::Truncated);
			return false;
		}
		return true;
	}
	std::uint8_t u8() noexcept {
		if (not need(1))
			return 0;
		return static_cast<std::uint8_t>(Message_[Offset_++]);
	}
	std::uint16_t u16() noexcept {
		const auto High = u8();
		return static_cast<std::uint16_t>((High << 8) | u8());
	}
	std::uint32_t u32() noexcept {
		const auto High = u16();
		return (static_cast<std::uint32_t>(High) << 16) | u16();
	}
	std::string_view bytes(std::size_t Size) noexcept {
		if (not need(Size))
			return {};
		const auto Bytes = Message_.substr(Offset_, Size);
		Offset_ += Size;
		return Bytes;
	}

	// follows compression pointers, which may only point backwards
	tName name() {
		tName Name;
		auto Position    = Offset_;
		auto Hops        = 0;
		bool Jumped      = false;
		while (not failed()) {
			if (Position >= Message_.size()) {
				fail(wire::Error::Truncated);
				break;
			}
			const auto Size = static_cast<std::uint8_t>(Message_[Position]);
			if ((Size & CompressionMark) == CompressionMark) {
				if (Position + 1 >= Message_.size()) {
					fail(wire::Error::Truncated);
					break;
				}
				const auto Target =
				    static_cast<std::size_t>(((Size & ~CompressionMark) << 8) |
				                             static_cast<std::uint8_t>(Message_[Position + 1]));
				if (not Jumped)
					Offset_ = Position + 2;
				if (Target >= Position or ++Hops > MaxPointerHops) {
					fail(wire::Error::MalformedName);
					break;
				}
				Jumped   = true;
				Position = Target;
				continue;
			}
			if (Size > MaxLabelSize) {
				fail(wire::Error::MalformedName);
				break;
			}
			if (Position + 1 + Size > Message_.size()) {
				fail(wire::Error::Truncated);
				break;
			}
			if (Size == 0) {
				if (not Jumped)
					Offset_ = Position + 1;
				break;
			}
			Name.emplace_back(Message_.substr(Position + 1, Size));
			Position += 1 + Size;
		}
		return Name;
	}
};

static auto readData(Reader & In, RecordType Type, std::size_t Size) -> tRecordData {
	const auto End = In.Offset_ + Size;
	tRecordData Data;
	switch (Type) {
		using enum RecordType;
		case PTR: Data = PtrData{ In.name() }; break;
		case SRV: {
			SrvData Srv{ .Priority_ = In.u16(), .Weight_ = In.u16(), .Port_ = In.u16() };
			Srv.Target_ = In.name();
			Data        = std::move(Srv);
		} break;
		case TXT: {
			TxtData Txt;
			while (not In.failed() and In.Offset_ < End) {
				const auto Length = In.u8();
				if (const auto Entry = In.bytes(Length); not Entry.empty())
					Txt.Entries_.emplace_back(Entry);
			}
			Data = std::move(Txt);
		} break;
		case A: {
			AddressData Address;
			for (auto & Octet : Address.Octets_)
				Octet = In.u8();
			Data = Address;
		} break;
		default: In.bytes(Size); break;
	}
	if (not In.failed() and In.Offset_ != End)
		In.fail(wire::Error::MalformedRecord);
	return Data;
}

auto decode(std::string_view Datagram) -> wire::tExpected<Message> {
	Reader In{ .Message_ = Datagram };
	if (not In.need(HeaderSizeBytes))
		return std::unexpected{ In.Error_ };

	Message Result;
	Result.Id_         = In.u16();
	Result.IsResponse_ = (In.u16() & 0x8000) != 0;
	const auto NumberOfQuestions = In.u16();
	const auto NumberOfRecords   = In.u16() + In.u16() + In.u16();

	for (auto Index = 0; Index < NumberOfQuestions and not In.failed(); ++Index) {
		auto Name        = In.name();
		const auto Type  = static_cast<RecordType>(In.u16());
		const auto Class = In.u16();
		Result.Questions_.push_back({ .Name_            = std::move(Name),
		                              .Type_            = Type,
		                              .UnicastResponse_ = (Class & UnicastBit) != 0 });
	}
	for (auto Index = 0; Index < NumberOfRecords and not In.failed(); ++Index) {
		auto Name        = In.name();
		const auto Type  = static_cast<RecordType>(In.u16());
		In.u16(); // class, including the cache-flush bit
		const auto Ttl  = In.u32();
		const auto Size = In.u16();
		if (not In.need(Size))
			break;
		auto Data = readData(In, Type, Size);
		Result.Records_.push_back(
		    { .Name_ = std::move(Name), .Type_ = Type, .Ttl_ = Ttl, .Data_ = std::move(Data) });
	}
	if (In.failed())
		return std::unexpected{ In.Error_ };
	return Result;
}

auto txtValue(const TxtData & Txt, std::string_view Key) -> std::optional<std::string> {
	for (const std::string_view Entry : Txt.Entries_) {
		const auto Separator = Entry.find('=');
		if (sameLabel(Entry.substr(0, Separator), Key))
			return Separator == std::string_view::npos
			           ? std::string{}
			           : std::string{ Entry.substr(Separator + 1) };
	}
	return std::nullopt;
}

} // namespace dnssd
