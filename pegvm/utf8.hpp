// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

// Based on the Flexible and Economical UTF-8 Decoder by Bjoern Hoehrmann
// Copyright (c) 2008-2010 Bjoern Hoehrmann <bjoern@hoehrmann.de>
// See LICENSE.md file or http://bjoern.hoehrmann.de/utf-8/decoder/dfa/
// for more details.

#ifndef PEGVM_INCLUDE_PEGVM_UTF8_HPP
#define PEGVM_INCLUDE_PEGVM_UTF8_HPP

#include <pegvm/detail.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace pegvm::utf8 {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

namespace detail {

enum class decode_state : unsigned char { accept = 0, reject = 12 };

inline constexpr std::array<unsigned char, 256> dfa_class_table
{
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
	 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9,
	 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7,
	 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7,
	 8, 8, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
	 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
	10, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 4, 3, 3,
	11, 6, 6, 6, 5, 8, 8, 8, 8, 8, 8, 8, 8, 8, 8, 8
};

inline constexpr std::array<unsigned char, 108> dfa_transition_table
{
	0,12,24,36,60,96,84,12,12,12,48,72,12,12,12,12,
	12,12,12,12,12,12,12,12,12, 0,12,12,12,12,12, 0,
	12, 0,12,12,12,24,12,12,12,12,12,24,12,24,12,12,
	12,12,12,12,12,12,12,24,12,12,12,12,12,24,12,12,
	12,12,12,12,12,24,12,12,12,12,12,12,12,12,12,36,
	12,36,12,12,12,36,12,12,12,12,12,36,12,36,12,12,
	12,36,12,12,12,12,12,12,12,12,12,12
};

inline constexpr char32_t utf32_replacement = U'\U0000fffd';

[[nodiscard]] constexpr decode_state decode_rune_octet(char32_t& rune, char octet, decode_state state) noexcept
{
	auto const symbol = static_cast<unsigned int>(static_cast<unsigned char>(octet));
	auto const dfa_class = static_cast<unsigned int>(dfa_class_table[symbol]); // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
	rune = (state == decode_state::accept) ? (symbol & (0xffU >> dfa_class)) : ((symbol & 0x3fU) | (rune << 6U));
	return static_cast<decode_state>(dfa_transition_table[static_cast<std::size_t>(state) + dfa_class]); // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

} // namespace detail

[[nodiscard]] constexpr bool is_lead(char octet) noexcept
{
	return (static_cast<unsigned char>(octet) & 0xc0U) != 0x80U;
}

template <class InputIt, class = pegvm::detail::enable_if_char_input_iterator_t<InputIt>>
[[nodiscard]] constexpr std::pair<InputIt, char32_t> decode_rune(InputIt first, InputIt last)
{
	char32_t rune = U'\0';
	detail::decode_state state = detail::decode_state::accept;
	while ((first != last) && (state != detail::decode_state::reject))
		if (state = utf8::detail::decode_rune_octet(rune, *first++, state); state == detail::decode_state::accept)
			return std::make_pair(first, rune);
	return std::make_pair(std::find_if(first, last, pegvm::utf8::is_lead), detail::utf32_replacement);
}

template <class InputIt, class = pegvm::detail::enable_if_char_input_iterator_t<InputIt>>
[[nodiscard]] constexpr InputIt next_rune(InputIt first, InputIt last)
{
	return pegvm::utf8::decode_rune(first, last).first;
}

// Case mapping covers the ASCII letters only
[[nodiscard]] constexpr char32_t tolower(char32_t rune) noexcept
{
	return ((U'A' <= rune) && (rune <= U'Z')) ? (rune + (U'a' - U'A')) : rune;
}

[[nodiscard]] constexpr char32_t toupper(char32_t rune) noexcept
{
	return ((U'a' <= rune) && (rune <= U'z')) ? (rune - (U'a' - U'A')) : rune;
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace pegvm::utf8

#endif
