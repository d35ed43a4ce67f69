// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_GRAMMAR_HPP
#define PEGVM_INCLUDE_PEGVM_GRAMMAR_HPP

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pegvm {

struct expression_node;

// Immutable handle to a grammar expression tree. Copies share the node.
class expression
{
	std::shared_ptr<expression_node const> node_;

public:
	template <class T, class = std::enable_if_t<std::conjunction_v<std::negation<std::is_same<std::decay_t<T>, expression>>, std::is_constructible<expression_node, T&&>>>>
	expression(T&& node); // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	[[nodiscard]] expression_node const& node() const noexcept { return *node_; }
	template <class Visitor> decltype(auto) visit(Visitor&& vis) const;
};

struct literal_expression { std::string text; bool ignore_case{false}; };
struct char_class_expression { std::string pattern; };
struct any_expression {};
struct sequence_expression { std::vector<expression> children; };
struct choice_expression { std::vector<expression> alternatives; };
struct zero_or_more_expression { expression child; };
struct one_or_more_expression { expression child; };
struct optional_expression { expression child; };
struct positive_lookahead_expression { expression child; };
struct negative_lookahead_expression { expression child; };
struct labeled_expression { std::string name; expression child; };
struct action_expression { expression child; std::string code; };
struct predicate_expression { std::string code; };
struct rule_expression { std::string name; };

struct expression_node
{
	using variant_type = std::variant<
		literal_expression,
		char_class_expression,
		any_expression,
		sequence_expression,
		choice_expression,
		zero_or_more_expression,
		one_or_more_expression,
		optional_expression,
		positive_lookahead_expression,
		negative_lookahead_expression,
		labeled_expression,
		action_expression,
		predicate_expression,
		rule_expression>;

	variant_type value;

	template <class T, class = std::enable_if_t<std::is_constructible_v<variant_type, T&&>>>
	expression_node(T&& x) : value{std::forward<T>(x)} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions,bugprone-forwarding-reference-overload)
};

template <class T, class>
inline expression::expression(T&& node)
	: node_{std::make_shared<expression_node const>(std::forward<T>(node))}
{}

template <class Visitor>
inline decltype(auto) expression::visit(Visitor&& vis) const
{
	return std::visit(std::forward<Visitor>(vis), node_->value);
}

struct rule
{
	std::string name;
	std::optional<std::string> display_name;
	pegvm::expression expr;

	rule(std::string n, pegvm::expression e) : name{std::move(n)}, expr{std::move(e)} {}
	rule(std::string n, std::string d, pegvm::expression e) : name{std::move(n)}, display_name{std::move(d)}, expr{std::move(e)} {}

	[[nodiscard]] bool has_display_name() const noexcept { return display_name.has_value() && (*display_name != name); }
};

struct grammar
{
	std::string init;
	std::vector<rule> rules;

	grammar() = default;
	grammar(std::initializer_list<rule> r) : rules{r} {}
	grammar(std::string i, std::initializer_list<rule> r) : init{std::move(i)}, rules{r} {}
};

namespace language {

inline constexpr any_expression any{};

[[nodiscard]] inline expression str(std::string_view text) { return literal_expression{std::string{text}, false}; }
[[nodiscard]] inline expression istr(std::string_view text) { return literal_expression{std::string{text}, true}; }
[[nodiscard]] inline expression bracket(std::string_view pattern) { return char_class_expression{std::string{pattern}}; }
[[nodiscard]] inline expression ref(std::string_view name) { return rule_expression{std::string{name}}; }
[[nodiscard]] inline expression pred(std::string_view code) { return predicate_expression{std::string{code}}; }
[[nodiscard]] inline expression eps() { return sequence_expression{}; }
[[nodiscard]] inline expression eoi() { return negative_lookahead_expression{any_expression{}}; }

[[nodiscard]] inline expression operator""_sx(char const* s, std::size_t n) { return str(std::string_view{s, n}); }
[[nodiscard]] inline expression operator""_isx(char const* s, std::size_t n) { return istr(std::string_view{s, n}); }
[[nodiscard]] inline expression operator""_bx(char const* s, std::size_t n) { return bracket("[" + std::string{s, n} + "]"); }

[[nodiscard]] inline expression operator>(expression const& e1, expression const& e2)
{
	std::vector<expression> children;
	for (auto const& e : {e1, e2}) {
		if (auto const* s = std::get_if<sequence_expression>(&e.node().value); s != nullptr && !s->children.empty())
			children.insert(children.end(), s->children.begin(), s->children.end());
		else
			children.push_back(e);
	}
	return sequence_expression{std::move(children)};
}

[[nodiscard]] inline expression operator|(expression const& e1, expression const& e2)
{
	std::vector<expression> alternatives;
	if (auto const* c = std::get_if<choice_expression>(&e1.node().value); c != nullptr)
		alternatives = c->alternatives;
	else
		alternatives.push_back(e1);
	alternatives.push_back(e2);
	return choice_expression{std::move(alternatives)};
}

[[nodiscard]] inline expression operator*(expression const& e) { return zero_or_more_expression{e}; }
[[nodiscard]] inline expression operator+(expression const& e) { return one_or_more_expression{e}; }
[[nodiscard]] inline expression operator~(expression const& e) { return optional_expression{e}; }
[[nodiscard]] inline expression operator&(expression const& e) { return positive_lookahead_expression{e}; }
[[nodiscard]] inline expression operator!(expression const& e) { return negative_lookahead_expression{e}; }
[[nodiscard]] inline expression operator%(std::string_view name, expression const& e) { return labeled_expression{std::string{name}, e}; }
[[nodiscard]] inline expression operator<(expression const& e, std::string_view code) { return action_expression{e, std::string{code}}; }

} // namespace language

} // namespace pegvm

#endif
