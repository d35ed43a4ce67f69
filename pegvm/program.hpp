// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_PROGRAM_HPP
#define PEGVM_INCLUDE_PEGVM_PROGRAM_HPP

#include <pegvm/instruction.hpp>

#include <cstdio>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace pegvm {

struct literal_matcher
{
	std::string text;
	bool ignore_case{false};
	[[nodiscard]] bool operator==(literal_matcher const& other) const noexcept { return text == other.text && ignore_case == other.ignore_case; }
	[[nodiscard]] bool operator!=(literal_matcher const& other) const noexcept { return !(*this == other); }
};

struct char_class_matcher
{
	std::string pattern;
	[[nodiscard]] bool operator==(char_class_matcher const& other) const noexcept { return pattern == other.pattern; }
	[[nodiscard]] bool operator!=(char_class_matcher const& other) const noexcept { return !(*this == other); }
};

struct any_matcher
{
	[[nodiscard]] constexpr bool operator==(any_matcher const& /*other*/) const noexcept { return true; }
	[[nodiscard]] constexpr bool operator!=(any_matcher const& /*other*/) const noexcept { return false; }
};

using matcher = std::variant<literal_matcher, char_class_matcher, any_matcher>;

struct thunk_info
{
	std::string code;
	std::vector<word> params; // string indices of the labels visible to the code
	word rule{-1};
};

struct rule_info
{
	word name{0};
	word display_name{0};
	word entry{0};
};

struct program
{
	std::string init;
	std::vector<instruction> instructions;
	std::vector<matcher> matchers;
	std::vector<std::string> strings;
	std::vector<thunk_info> actions;
	std::vector<thunk_info> predicates;
	std::vector<word> instr_to_rule;
	std::vector<rule_info> rules;

	[[nodiscard]] std::string_view rule_name(word rule) const { return strings.at(static_cast<std::size_t>(rules.at(static_cast<std::size_t>(rule)).name)); }
	[[nodiscard]] std::string_view rule_display_name(word rule) const { return strings.at(static_cast<std::size_t>(rules.at(static_cast<std::size_t>(rule)).display_name)); }
};

[[nodiscard]] inline std::string quote(std::string_view text)
{
	std::string result{"\""};
	for (char const c : text) {
		switch (c) {
			case '"': result.append("\\\""); break;
			case '\\': result.append("\\\\"); break;
			case '\n': result.append("\\n"); break;
			case '\r': result.append("\\r"); break;
			case '\t': result.append("\\t"); break;
			default:
				if (static_cast<unsigned char>(c) < 0x20U || c == '\x7f') {
					char buf[8]; // NOLINT(cppcoreguidelines-avoid-c-arrays,hicpp-avoid-c-arrays,modernize-avoid-c-arrays)
					std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
					result.append(buf);
				} else {
					result.push_back(c);
				}
				break;
		}
	}
	result.push_back('"');
	return result;
}

// Canonical text of a matcher; two matchers are equal exactly when their
// canonical text is equal.
[[nodiscard]] inline std::string to_string(matcher const& m)
{
	return std::visit([](auto const& x) -> std::string {
		using T = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<T, literal_matcher>)
			return quote(x.text) + (x.ignore_case ? "i" : "");
		else if constexpr (std::is_same_v<T, char_class_matcher>)
			return x.pattern;
		else
			return ".";
	}, m);
}

} // namespace pegvm

#endif
