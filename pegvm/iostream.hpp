// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_IOSTREAM_HPP
#define PEGVM_INCLUDE_PEGVM_IOSTREAM_HPP

#include <pegvm/program.hpp>

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>

#ifndef PEGVM_NO_ISATTY
#ifdef _MSC_VER
#ifndef PEGVM_HAS_ISATTY_MSVC
#define PEGVM_HAS_ISATTY_MSVC
#endif
#else
#ifndef PEGVM_HAS_ISATTY_POSIX
#ifdef __has_include
#if __has_include(<unistd.h>)
#define PEGVM_HAS_ISATTY_POSIX
#endif
#endif
#endif
#endif
#endif // PEGVM_NO_ISATTY

#if defined PEGVM_HAS_ISATTY_MSVC
#include <io.h>
#elif defined PEGVM_HAS_ISATTY_POSIX
#include <unistd.h>
#endif

namespace pegvm {

[[nodiscard]] inline bool stdin_isatty() noexcept
{
#if defined PEGVM_HAS_ISATTY_MSVC
	return _isatty(_fileno(stdin)) != 0;
#elif defined PEGVM_HAS_ISATTY_POSIX
	return isatty(fileno(stdin)) != 0;
#else
	return false;
#endif
}

inline std::ostream& operator<<(std::ostream& out, opcode op)
{
	if (!is_valid_opcode(static_cast<word>(op)))
		return out << "Invalid(" << static_cast<unsigned int>(op) << ")";
	return out << opcode_name(op);
}

inline std::ostream& operator<<(std::ostream& out, stack_id s)
{
	switch (s) {
		case stack_id::position: return out << 'P';
		case stack_id::call: return out << 'C';
		default: return out << static_cast<unsigned int>(s);
	}
}

inline std::ostream& operator<<(std::ostream& out, instruction const& instr)
{
	out << instr.op();
	for (std::size_t i = 0; i < instr.operand_count(); ++i) {
		out << ' ';
		if ((i == 0) && ((instr.op() == opcode::push) || (instr.op() == opcode::pop)))
			out << static_cast<stack_id>(instr.operand(0));
		else
			out << instr.operand(i);
	}
	return out;
}

inline std::ostream& operator<<(std::ostream& out, matcher const& m)
{
	return out << to_string(m);
}

namespace detail {

[[nodiscard]] inline int decimal_width(std::size_t n) noexcept
{
	int width = 1;
	for (; n >= 10; n /= 10)
		++width;
	return width;
}

template <class Table>
[[nodiscard]] inline bool in_table(Table const& table, word i) noexcept
{
	return (i >= 0) && (static_cast<std::size_t>(i) < table.size());
}

inline void write_thunks(std::ostream& out, char const* title, program const& p, std::vector<thunk_info> const& thunks)
{
	if (thunks.empty())
		return;
	out << title << '\n';
	for (std::size_t i = 0; i < thunks.size(); ++i) {
		out << "  " << i << " {" << thunks[i].code << "}";
		if (in_table(p.rules, thunks[i].rule))
			out << " in " << p.rule_name(thunks[i].rule);
		for (word const param : thunks[i].params)
			out << ' ' << (in_table(p.strings, param) ? p.strings[static_cast<std::size_t>(param)] : std::string{"?"});
		out << '\n';
	}
}

} // namespace detail

// Writes the side tables followed by one line per instruction. Each rule's
// instructions are preceded by a line holding its name.
inline std::ostream& disassemble(std::ostream& out, program const& p)
{
	if (!p.init.empty())
		out << "init {" << p.init << "}\n";
	if (!p.strings.empty()) {
		out << "strings\n";
		for (std::size_t i = 0; i < p.strings.size(); ++i)
			out << "  " << i << ' ' << quote(p.strings[i]) << '\n';
	}
	if (!p.matchers.empty()) {
		out << "matchers\n";
		for (std::size_t i = 0; i < p.matchers.size(); ++i)
			out << "  " << i << ' ' << p.matchers[i] << '\n';
	}
	detail::write_thunks(out, "actions", p, p.actions);
	detail::write_thunks(out, "predicates", p, p.predicates);
	out << "code\n";
	int const width = detail::decimal_width(p.instructions.size());
	for (std::size_t addr = 0; addr < p.instructions.size(); ++addr) {
		for (std::size_t r = 0; r < p.rules.size(); ++r) {
			if (static_cast<std::size_t>(p.rules[r].entry) == addr) {
				out << p.rule_name(static_cast<word>(r));
				if (p.rules[r].display_name != p.rules[r].name)
					out << ' ' << quote(p.rule_display_name(static_cast<word>(r)));
				out << ":\n";
			}
		}
		auto const& instr = p.instructions[addr];
		out << std::setw(width) << addr << ": " << instr;
		auto const operand = instr.operand(0);
		switch (instr.op()) {
			case opcode::match:
				if (detail::in_table(p.matchers, operand))
					out << "  ; " << p.matchers[static_cast<std::size_t>(operand)];
				break;
			case opcode::store:
				if (detail::in_table(p.strings, operand))
					out << "  ; " << p.strings[static_cast<std::size_t>(operand)];
				break;
			case opcode::call_a:
				if (detail::in_table(p.actions, operand))
					out << "  ; {" << p.actions[static_cast<std::size_t>(operand)].code << "}";
				break;
			case opcode::call_b:
				if (detail::in_table(p.predicates, operand))
					out << "  ; &{" << p.predicates[static_cast<std::size_t>(operand)].code << "}";
				break;
			default:
				break;
		}
		out << '\n';
	}
	return out;
}

} // namespace pegvm

#endif
