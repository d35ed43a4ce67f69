// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <iostream>

#undef NDEBUG
#include <cassert>

void test_positive_lookahead()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", &"a"_sx > any > eoi()}});
	assert(pegvm::parse("a", P));
	assert(!pegvm::parse("b", P));
	assert(!pegvm::parse("", P));

	auto const Q = pegvm::generate(pegvm::grammar{{"S", &"ab"_sx}});
	pegvm::machine m{Q};
	assert(m.parse("abc"));
	assert(m.cursor() == 0);
	assert(!m.parse("ac"));
	assert(m.cursor() == 0);
}

void test_negative_lookahead()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", (!"a"_sx) > any > eoi()}});
	assert(pegvm::parse("b", P));
	assert(!pegvm::parse("a", P));
	assert(!pegvm::parse("", P));

	auto const Q = pegvm::generate(pegvm::grammar{{"S", !"x"_sx}});
	pegvm::machine m{Q};
	assert(m.parse("abc"));
	assert(m.cursor() == 0);
	assert(!m.parse("xyz"));
	assert(m.cursor() == 0);

	auto const R = pegvm::generate(pegvm::grammar{{"S", (!!"ab"_sx) > "a"_sx}});
	assert(pegvm::parse("ab", R));
	assert(!pegvm::parse("ac", R));
}

void test_end_of_input()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", "a"_sx > eoi()}});
	assert(pegvm::parse("a", P));
	assert(!pegvm::parse("ab", P));
	assert(!pegvm::parse("", P));
}

void test_semantic_predicate()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", "ab"_sx > pred("at2") > any > eoi()}});
	pegvm::machine m{P};
	int calls = 0;
	m.bind_predicate("at2", [&calls](pegvm::environment& e) {
		++calls;
		return e.position() == 2 && e.subject().substr(e.position()) == "c";
	});
	assert(m.parse("abc"));
	assert(calls == 1);
	assert(!m.parse("abd"));
	assert(calls == 2);
	assert(m.cursor() == 0);
	assert(!m.parse("ax"));
	assert(calls == 2);
}

void test_predicate_with_label()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", "n" % +bracket("[0-9]") > pred("small") > eoi()}});
	pegvm::machine m{P};
	m.bind_predicate("small", [](pegvm::environment& e) {
		return std::stoi(std::string{e.label("n")}) < 100;
	});
	assert(m.parse("42"));
	assert(m.parse("099"));
	assert(!m.parse("420"));
}

void test_failed_predicate_retries_choice()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", ((pred("no") > "a"_sx > "b"_sx) | ("a"_sx > any)) > eoi()}});
	pegvm::machine m{P};
	m.bind_predicate("no", [](pegvm::environment&) { return false; });
	assert(m.parse("ab"));
	assert(m.parse("ac"));
	assert(!m.parse("a"));
}

void test_unbound_predicate()
{
	using namespace pegvm::language;
	auto const P = pegvm::generate(pegvm::grammar{{"S", pred("missing")}});
	bool thrown = false;
	try {
		(void)pegvm::parse("", P);
	} catch (pegvm::unbound_thunk_error const& e) {
		thrown = true;
		assert(std::string{e.what()}.find("missing") != std::string::npos);
	}
	assert(thrown);
}

int main()
try {
	test_positive_lookahead();
	test_negative_lookahead();
	test_end_of_input();
	test_semantic_predicate();
	test_predicate_with_label();
	test_failed_predicate_retries_choice();
	test_unbound_predicate();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
