// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>

#include <array>
#include <cstdlib>
#include <string>

namespace samples::calc {

using namespace pegvm::language;

struct calc_environment : pegvm::environment
{
	std::vector<double> stack;
	std::array<double, 26> variables{};
	bool quit{false};

	void on_reset() override
	{
		stack.clear();
	}

	double pop()
	{
		if (stack.empty())
			throw pegvm::bad_stack{};
		double const x = stack.back();
		stack.pop_back();
		return x;
	}

	[[nodiscard]] static std::size_t variable_index(pegvm::syntax const& id)
	{
		return static_cast<std::size_t>(pegvm::utf8::tolower(static_cast<char32_t>(id.str().at(0))) - U'a');
	}
};

pegvm::grammar make_grammar()
{
	auto const sp = ref("SPACE");
	return pegvm::grammar{
		{"Stmt", "statement", sp > (
			  ((("exit"_isx | "quit"_isx) > sp > eoi())        < "quit")
			| ((ref("Expr") > sp > eoi())                      < "print"))},
		{"Expr", "expression",
			  (("i" % ref("ID") > sp > "="_sx > sp > ref("Sum")) < "assign")
			| ref("Sum")},
		{"Sum", ref("Prod") > *(
			  ((sp > "+"_sx > sp > ref("Prod"))                < "add")
			| ((sp > "-"_sx > sp > ref("Prod"))                < "sub"))},
		{"Prod", ref("Value") > *(
			  ((sp > "*"_sx > sp > ref("Value"))               < "mul")
			| ((sp > "/"_sx > sp > ref("Value"))               < "div"))},
		{"Value", "value",
			  ref("NUMBER")
			| (("i" % ref("ID"))                               < "load")
			| ("("_sx > sp > ref("Expr") > sp > ")"_sx)},
		{"NUMBER", "number", "n" % (~bracket("[-+]") > +bracket("[0-9]") > ~("."_sx > +bracket("[0-9]"))) < "number"},
		{"ID", "identifier", bracket("[a-z]i")},
		{"SPACE", *bracket("[ \\t]")}
	};
}

void bind_actions(pegvm::machine& m)
{
	m.bind_action("quit", [](calc_environment& e) { e.quit = true; })
	 .bind_action("print", [](calc_environment& e) { std::cout << e.pop() << "\n"; })
	 .bind_action("number", [](calc_environment& e) { e.stack.push_back(std::stod(std::string{e.label("n")})); })
	 .bind_action("load", [](calc_environment& e) { e.stack.push_back(e.variables.at(calc_environment::variable_index(e.label("i")))); })
	 .bind_action("assign", [](calc_environment& e) { e.stack.push_back(e.variables.at(calc_environment::variable_index(e.label("i"))) = e.pop()); })
	 .bind_action("add", [](calc_environment& e) { double const r = e.pop(); e.stack.push_back(e.pop() + r); })
	 .bind_action("sub", [](calc_environment& e) { double const r = e.pop(); e.stack.push_back(e.pop() - r); })
	 .bind_action("mul", [](calc_environment& e) { double const r = e.pop(); e.stack.push_back(e.pop() * r); })
	 .bind_action("div", [](calc_environment& e) { double const r = e.pop(); e.stack.push_back(e.pop() / r); });
}

} // namespace samples::calc

int main(int argc, char** argv)
try {
	auto const program = pegvm::generate(samples::calc::make_grammar());
	if ((argc > 1) && (std::string_view{argv[1]} == "--disassemble")) { // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
		pegvm::disassemble(std::cout, program);
		return 0;
	}
	samples::calc::calc_environment environment;
	pegvm::machine machine{program, environment};
	samples::calc::bind_actions(machine);
	bool const interactive = pegvm::stdin_isatty();
	std::string line;
	for (;;) {
		if (interactive)
			std::cout << "> " << std::flush;
		if (!std::getline(std::cin, line))
			break;
		if (!machine.parse(line))
			std::cerr << "SYNTAX ERROR: " << machine.failure_message() << "\n";
		if (environment.quit)
			break;
	}
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
