#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "fmt/core.h"

namespace numpat {

enum class error_category {
	success = 0,

	// pattern syntax
	invalid_digit,
	missing_closing_bracket,
	unexpected_char,
	unexpected_empty_range,
	expensive_pattern_expansion,

	// registration
	path_already_exists
};


static constexpr std::string_view error_message(error_category category) noexcept{
	switch(category) {
	case error_category::success:                     return "successed";
	case error_category::invalid_digit:               return "only digits 0-9 are allowed";
	case error_category::missing_closing_bracket:     return "missing closing bracket";
	case error_category::unexpected_char:             return "unexpected character";
	case error_category::unexpected_empty_range:      return "empty bracket expression";
	case error_category::expensive_pattern_expansion: return "pattern expands to too many variants";
	case error_category::path_already_exists:         return "path already holds a different value";
	}
	return "";
}

template <typename CharT>
struct error_info {
	using char_t = CharT;

	error_category category = error_category::success;

	// offset of the offending code unit in the input (a byte offset for char),
	// or the failing variant's index for path_already_exists
	std::size_t position = 0;

	// active when category == invalid_digit or unexpected_char
	char_t character = char_t{};

	constexpr error_info() noexcept = default;
	constexpr error_info(error_category category, std::size_t position = 0, char_t character = char_t{}) noexcept:
		category{category}, position{position}, character{character} {}

	constexpr bool ok() const noexcept{
		return category == error_category::success;
	}

	friend constexpr bool operator==(const error_info&, const error_info&) noexcept = default;
};

namespace impl {

template <typename CharT>
std::string printable(CharT c) {
	auto code = static_cast<std::uint32_t>(static_cast<std::make_unsigned_t<CharT>>(c));
	if(0x20 <= code && code < 0x7f) return std::string(1, static_cast<char>(code));
	// a single byte above 0x7f is part of a multi-byte sequence, not a code point
	if constexpr(sizeof(CharT) == 1) {
		if(code > 0x7f) return fmt::format("0x{:02X}", code);
	}
	return fmt::format("U+{:04X}", code);
}

} // namespace impl

template <typename CharT>
std::string describe(const error_info<CharT>& info) {
	switch(info.category) {
	case error_category::success:
		return std::string{error_message(info.category)};
	case error_category::invalid_digit:
		return fmt::format("invalid digit '{}' at position {}: {}",
			impl::printable(info.character), info.position, error_message(info.category));
	case error_category::unexpected_char:
		return fmt::format("unexpected character '{}' at position {}",
			impl::printable(info.character), info.position);
	case error_category::expensive_pattern_expansion:
		return fmt::format("{} at position {}: raise max_variants to accept it",
			error_message(info.category), info.position);
	case error_category::path_already_exists:
		return fmt::format("{} (variant {})", error_message(info.category), info.position);
	default:
		return fmt::format("{} at position {}", error_message(info.category), info.position);
	}
}

} // namespace numpat
