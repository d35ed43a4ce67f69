// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <iostream>

#undef NDEBUG
#include <cassert>

struct word_environment : public pegvm::environment
{
	int reset_count{0};
	std::vector<std::string> words;

	void on_reset() override
	{
		++reset_count;
		words.clear();
	}
};

void test_action_value()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ("n" % +bracket("[0-9]")) < "to_int"}});
	pegvm::machine m{P};
	m.bind_action("to_int", [](pegvm::environment& e) { return std::stoi(std::string{e.label("n")}); });
	assert(m.parse("123"));
	assert(std::any_cast<int>(m.value()) == 123);
	assert(!m.parse("x"));
	assert(!m.value().has_value());
}

void test_values_flow_through_rules()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{
		{"Sum", ("l" % ref("Num") > "+"_sx > "r" % ref("Num")) < "add"},
		{"Num", ("d" % +bracket("[0-9]")) < "num"}
	});
	pegvm::machine m{P};
	m.bind_action("num", [](pegvm::environment& e) { return std::stoi(std::string{e.label("d")}); })
	 .bind_action("add", [](pegvm::environment& e) { return e.label_value<int>("l") + e.label_value<int>("r"); });
	assert(m.parse("12+30"));
	assert(std::any_cast<int>(m.value()) == 42);
	assert(!m.parse("12+"));
}

void test_label_syntax()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ("a"_sx > "w" % +bracket("[a-z]")) < "word"}});
	pegvm::machine m{P};
	pegvm::syntax captured;
	std::size_t position = 0;
	m.bind_action("word", [&](pegvm::environment& e) {
		assert(e.has_label("w"));
		assert(!e.has_label("a"));
		captured = e.label("w");
		position = e.position();
	});
	assert(m.parse("abcd"));
	assert(captured.str() == "bcd");
	assert(captured.index() == 1);
	assert(position == 4);
	assert(!m.value().has_value());
}

void test_labels_out_of_scope()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ("x" % "a"_sx | "b"_sx) < "f"}});
	pegvm::machine m{P};
	bool had_label = true;
	m.bind_action("f", [&had_label](pegvm::environment& e) {
		had_label = e.has_label("x");
		return std::string{e.label("x")};
	});
	bool thrown = false;
	try {
		(void)m.parse("a");
	} catch (pegvm::unbound_label_error const&) {
		thrown = true;
	}
	assert(thrown);
	assert(!had_label);
}

void test_failed_optional_unbinds_label()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ("x" % "a"_sx > ~("x" % "b"_sx > "z"_sx) > any) < "f"}});
	pegvm::machine m{P};
	std::string x;
	m.bind_action("f", [&x](pegvm::environment& e) { x = std::string{e.label("x")}; });
	assert(m.parse("ab"));
	assert(x == "a");
	assert(m.parse("abz!"));
	assert(x == "b");
}

void test_failed_alternative_unbinds_label()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ("x" % "a"_sx > (("x" % "b"_sx > "z"_sx) | "b"_sx)) < "f"}});
	pegvm::machine m{P};
	pegvm::syntax x;
	m.bind_action("f", [&x](pegvm::environment& e) { x = e.label("x"); });
	assert(m.parse("ab"));
	assert(x.str() == "a");
	assert(x.index() == 0);
	assert(m.parse("abz"));
	assert(x.str() == "b");
	assert(x.index() == 1);
}

void test_failed_lookahead_keeps_label_value()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{
		{"S", ("v" % ref("Num") > !("v" % ref("Num") > "x"_sx) > any) < "f"},
		{"Num", ("d" % bracket("[0-9]")) < "num"}
	});
	pegvm::machine m{P};
	int v = -1;
	m.bind_action("num", [](pegvm::environment& e) { return std::stoi(std::string{e.label("d")}); })
	 .bind_action("f", [&v](pegvm::environment& e) { v = std::any_cast<int>(e.label_any("v")); });
	assert(m.parse("12"));
	assert(v == 1);
	assert(!m.parse("12x"));
}

void test_action_runs_only_on_success()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", (("a"_sx > "b"_sx) < "ab") | (("a"_sx > "c"_sx) < "ac")}});
	pegvm::machine m{P};
	std::vector<std::string> ran;
	m.bind_action("ab", [&ran](pegvm::environment&) { ran.emplace_back("ab"); })
	 .bind_action("ac", [&ran](pegvm::environment&) { ran.emplace_back("ac"); });
	assert(m.parse("ac"));
	assert(ran == (std::vector<std::string>{"ac"}));
	assert(m.parse("ab"));
	assert(ran == (std::vector<std::string>{"ac", "ab"}));
	assert(!m.parse("ad"));
	assert(ran.size() == 2);
}

void test_derived_environment()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", *((("w" % +bracket("[a-z]")) < "push") > ~" "_sx) > eoi()}});
	word_environment E;
	pegvm::machine m{P, E};
	m.bind_action("push", [](word_environment& e) { e.words.emplace_back(e.label("w")); });
	assert(m.parse("ab cd ef"));
	assert(E.reset_count == 1);
	assert(E.words == (std::vector<std::string>{"ab", "cd", "ef"}));
	assert(m.parse("xyz"));
	assert(E.reset_count == 2);
	assert(E.words == (std::vector<std::string>{"xyz"}));
	assert(pegvm::parse("", P, E));
	assert(E.reset_count == 3);
	assert(E.words.empty());
}

void test_same_code_binds_every_thunk()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ("a"_sx < "tick") > ("b"_sx < "tick")}});
	assert(P.actions.size() == 2);
	pegvm::machine m{P};
	int ticks = 0;
	m.bind_action("tick", [&ticks](pegvm::environment&) { return ++ticks; });
	assert(m.parse("ab"));
	assert(ticks == 2);
	assert(std::any_cast<int>(m.value()) == 2);
}

void test_unbound_action()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", "a"_sx < "missing"}});
	bool thrown = false;
	try {
		(void)pegvm::parse("a", P);
	} catch (pegvm::unbound_thunk_error const&) {
		thrown = true;
	}
	assert(thrown);
	assert(!pegvm::parse("b", P));
}

void test_reentrant_parse()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", "a"_sx < "again"}});
	pegvm::machine m{P};
	m.bind_action("again", [&m](pegvm::environment&) { return m.parse("a"); });
	bool thrown = false;
	try {
		(void)m.parse("a");
	} catch (pegvm::reenterant_parse_error const&) {
		thrown = true;
	}
	assert(thrown);
	m.bind_action("again", [](pegvm::environment&) { return true; });
	assert(m.parse("a"));
}

int main()
try {
	test_action_value();
	test_values_flow_through_rules();
	test_label_syntax();
	test_labels_out_of_scope();
	test_failed_optional_unbinds_label();
	test_failed_alternative_unbinds_label();
	test_failed_lookahead_keeps_label_value();
	test_action_runs_only_on_success();
	test_derived_environment();
	test_same_code_binds_every_thunk();
	test_unbound_action();
	test_reentrant_parse();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
