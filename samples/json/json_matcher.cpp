// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>

#include <iterator>
#include <string>

namespace samples::json {

using namespace pegvm::language;

pegvm::grammar make_grammar()
{
	auto const ws = ref("WS");
	auto const digit = bracket("[0-9]");
	auto const hex = bracket("[0-9a-fA-F]");
	return pegvm::grammar{
		{"JSON", "document", ws > ref("Value") > ws > eoi()},
		{"Value", "value", ref("Object") | ref("Array") | ref("String") | ref("Number") | "true"_sx | "false"_sx | "null"_sx},
		{"Object", "object", "{"_sx > ws > ~(ref("Member") > *(ws > ","_sx > ws > ref("Member"))) > ws > "}"_sx},
		{"Member", "member", ref("String") > ws > ":"_sx > ws > ref("Value")},
		{"Array", "array", "["_sx > ws > ~(ref("Value") > *(ws > ","_sx > ws > ref("Value"))) > ws > "]"_sx},
		{"String", "string", "\""_sx > *(
			  ("\\"_sx > (bracket("[\"\\\\/bfnrt]") | ("u"_sx > hex > hex > hex > hex)))
			| bracket("[^\"\\\\\\x00-\\x1f]")) > "\""_sx},
		{"Number", "number", ~"-"_sx > ("0"_sx | (bracket("[1-9]") > *digit)) > ~("."_sx > +digit) > ~(bracket("[eE]") > ~bracket("[-+]") > +digit)},
		{"WS", *bracket("[ \\t\\r\\n]")}
	};
}

} // namespace samples::json

int main(int argc, char** argv)
try {
	auto const program = pegvm::generate(samples::json::make_grammar());
	if ((argc > 1) && (std::string_view{argv[1]} == "--disassemble")) { // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
		pegvm::disassemble(std::cout, program);
		return 0;
	}
	std::string const text{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
	pegvm::machine machine{program};
	if (!machine.parse(text)) {
		std::cout << "invalid: " << machine.failure_message() << " (offset " << machine.failure_position() << ")\n";
		return 1;
	}
	std::cout << "valid\n";
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
