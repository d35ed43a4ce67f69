// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/tables.hpp>

#undef NDEBUG
#include <cassert>
#include <iostream>

void test_matcher_interning()
{
	pegvm::program p;
	pegvm::table_builder t{p};
	assert(t.add_matcher(pegvm::literal_matcher{"a"}) == 0);
	assert(t.add_matcher(pegvm::literal_matcher{"a", true}) == 1);
	assert(t.add_matcher(pegvm::char_class_matcher{"[a]"}) == 2);
	assert(t.add_matcher(pegvm::literal_matcher{"a"}) == 0);
	assert(t.add_matcher(pegvm::any_matcher{}) == 3);
	assert(t.add_matcher(pegvm::literal_matcher{"."}) == 4);
	assert(t.add_matcher(pegvm::literal_matcher{"[a]"}) == 5);
	assert(t.add_matcher(pegvm::any_matcher{}) == 3);
	assert(t.add_matcher(pegvm::char_class_matcher{"[a]"}) == 2);
	assert(p.matchers.size() == 6);
	assert((p.matchers[1] == pegvm::matcher{pegvm::literal_matcher{"a", true}}));
}

void test_string_interning()
{
	pegvm::program p;
	pegvm::table_builder t{p};
	assert(t.add_string("A") == 0);
	assert(t.add_string("B") == 1);
	assert(t.add_string("A") == 0);
	assert(t.add_string("") == 2);
	assert(p.strings == (std::vector<std::string>{"A", "B", ""}));
}

void test_thunks_are_not_interned()
{
	pegvm::program p;
	pegvm::table_builder t{p};
	assert(t.add_action(pegvm::thunk_info{"x"}) == 0);
	assert(t.add_action(pegvm::thunk_info{"x"}) == 1);
	assert(t.add_predicate(pegvm::thunk_info{"x"}) == 0);
	assert(p.actions.size() == 2);
	assert(p.predicates.size() == 1);
	t.action_at(1).params.push_back(4);
	assert(p.actions[1].params == (std::vector<pegvm::word>{4}));
	assert(p.actions[0].params.empty());
	assert(p.actions[0].rule == -1);
}

void test_builder_resumes_existing_tables()
{
	pegvm::program p;
	{
		pegvm::table_builder t{p};
		(void)t.add_string("A");
		(void)t.add_string("B");
		(void)t.add_matcher(pegvm::any_matcher{});
	}
	pegvm::table_builder t{p};
	assert(t.add_string("B") == 1);
	assert(t.add_string("C") == 2);
	assert(t.add_matcher(pegvm::any_matcher{}) == 0);
	assert(t.add_matcher(pegvm::literal_matcher{"b"}) == 1);
}

void test_canonical_text()
{
	assert(pegvm::to_string(pegvm::literal_matcher{"a\"b"}) == "\"a\\\"b\"");
	assert(pegvm::to_string(pegvm::literal_matcher{"x", true}) == "\"x\"i");
	assert(pegvm::to_string(pegvm::literal_matcher{"\n\x01"}) == "\"\\n\\x01\"");
	assert(pegvm::to_string(pegvm::char_class_matcher{"[^a-z]i"}) == "[^a-z]i");
	assert(pegvm::to_string(pegvm::any_matcher{}) == ".");
}

int main()
try {
	test_matcher_interning();
	test_string_interning();
	test_thunks_are_not_interned();
	test_builder_resumes_existing_tables();
	test_canonical_text();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
