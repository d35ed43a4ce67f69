// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_INSTRUCTION_HPP
#define PEGVM_INCLUDE_PEGVM_INSTRUCTION_HPP

#include <pegvm/detail.hpp>
#include <pegvm/error.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pegvm {

using word = std::int_least32_t;

enum class opcode : std::uint_least8_t
{
	push,           pop,            call,           ret,            exit,
	match,          restore,        restore_if_f,   store,          jump,
	jump_if_f,      jump_if_not_f,  flip_f,         cumul_or_f,     call_a,
	call_b
};

inline constexpr std::size_t opcode_count = static_cast<std::size_t>(opcode::call_b) + 1;
inline constexpr std::size_t max_operands = 3;

enum class stack_id : std::uint_least8_t
{
	position,   // saved input cursors for backtracking
	call        // return addresses, rule entry points and loop counters
};

struct opcode_arity
{
	std::size_t min;
	std::size_t max;
};

namespace detail {

struct opcode_traits
{
	std::string_view name;
	opcode_arity arity;
};

inline constexpr std::array<opcode_traits, opcode_count> opcode_table
{{
	{"Push",       {1, 2}},
	{"Pop",        {1, 1}},
	{"Call",       {0, 0}},
	{"Return",     {0, 0}},
	{"Exit",       {0, 0}},
	{"Match",      {1, 1}},
	{"Restore",    {0, 0}},
	{"RestoreIfF", {0, 0}},
	{"Store",      {1, 1}},
	{"Jump",       {1, 1}},
	{"JumpIfF",    {1, 1}},
	{"JumpIfNotF", {1, 1}},
	{"FlipF",      {0, 0}},
	{"CumulOrF",   {0, 0}},
	{"CallA",      {1, 1}},
	{"CallB",      {1, 1}}
}};

inline constexpr unsigned int count_shift = 8U;
inline constexpr word opcode_mask = 0xff;

template <class T>
[[nodiscard]] constexpr std::ptrdiff_t to_operand(T x) noexcept
{
	if constexpr (std::is_enum_v<T>)
		return static_cast<std::ptrdiff_t>(static_cast<std::underlying_type_t<T>>(x));
	else
		return static_cast<std::ptrdiff_t>(x);
}

} // namespace detail

[[nodiscard]] constexpr bool is_valid_opcode(word op) noexcept
{
	return (op >= 0) && (static_cast<std::size_t>(op) < opcode_count);
}

[[nodiscard]] constexpr std::string_view opcode_name(opcode op) noexcept
{
	return detail::opcode_table[static_cast<std::size_t>(op)].name; // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

[[nodiscard]] constexpr opcode_arity arity(opcode op) noexcept
{
	return detail::opcode_table[static_cast<std::size_t>(op)].arity; // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

// One encoded instruction: a header word holding the opcode and operand
// count, followed by fixed storage for the operand words. Unused operand
// words are always zero so instructions compare by value.
struct alignas(std::uint_least64_t) instruction
{
	word header{0};
	std::array<word, max_operands> operands{};

	[[nodiscard]] constexpr opcode op() const noexcept { return static_cast<opcode>(header & detail::opcode_mask); }
	[[nodiscard]] constexpr std::size_t operand_count() const noexcept { return static_cast<std::size_t>(header >> detail::count_shift); }
	[[nodiscard]] constexpr std::size_t size() const noexcept { return 1 + operand_count(); }
	[[nodiscard]] constexpr word operand(std::size_t i) const noexcept { return (i < operand_count()) ? operands[i] : word{0}; } // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
	[[nodiscard]] std::vector<word> words() const { std::vector<word> result{header}; result.insert(result.end(), operands.begin(), operands.begin() + static_cast<std::ptrdiff_t>(operand_count())); return result; }
	[[nodiscard]] constexpr bool operator==(instruction const& other) const noexcept { return header == other.header && operands == other.operands; }
	[[nodiscard]] constexpr bool operator!=(instruction const& other) const noexcept { return !(*this == other); }
};

static_assert(sizeof(instruction) == 4 * sizeof(word), "expected instruction to be four words wide");

struct decoded_instruction
{
	opcode op;
	std::size_t count;
	word operand0;
	word operand1;
	word operand2;
};

[[nodiscard]] inline instruction encode_operands(opcode op, std::ptrdiff_t const* operands, std::size_t count)
{
	if (auto const [min, max] = arity(op); (count < min) || (count > max))
		throw encoding_arity_error{std::string{opcode_name(op)}};
	instruction instr;
	instr.header = static_cast<word>(static_cast<word>(op) | static_cast<word>(count << detail::count_shift));
	for (std::size_t i = 0; i < count; ++i)
		instr.operands[i] = detail::checked_cast<word, program_limit_error>(operands[i]); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic,cppcoreguidelines-pro-bounds-constant-array-index)
	return instr;
}

template <class... Operands>
[[nodiscard]] inline instruction encode(opcode op, Operands... operands)
{
	static_assert(sizeof...(Operands) <= max_operands, "too many operands for any opcode");
	static_assert((... && (std::is_integral_v<Operands> || std::is_enum_v<Operands>)), "operands must be integers or enumerators");
	if constexpr (sizeof...(Operands) == 0) {
		return encode_operands(op, nullptr, 0);
	} else {
		std::array<std::ptrdiff_t, sizeof...(Operands)> const values{detail::to_operand(operands)...};
		return encode_operands(op, values.data(), values.size());
	}
}

[[nodiscard]] constexpr decoded_instruction decode(instruction const& instr) noexcept
{
	return decoded_instruction{instr.op(), instr.operand_count(), instr.operand(0), instr.operand(1), instr.operand(2)};
}

// Reads one instruction back from a flat stream of words such as the one
// produced by concatenating instruction::words().
template <class InputIt>
[[nodiscard]] inline std::pair<InputIt, instruction> decode_words(InputIt first, InputIt last)
{
	if (first == last)
		throw bad_encoding{};
	instruction instr;
	instr.header = *first++;
	if (!is_valid_opcode(instr.header & detail::opcode_mask) || (instr.header < 0))
		throw bad_encoding{};
	auto const count = instr.operand_count();
	if (auto const [min, max] = arity(instr.op()); (count < min) || (count > max))
		throw bad_encoding{};
	for (std::size_t i = 0; i < count; ++i) {
		if (first == last)
			throw bad_encoding{};
		instr.operands[i] = *first++; // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
	}
	return {first, instr};
}

} // namespace pegvm

#endif
