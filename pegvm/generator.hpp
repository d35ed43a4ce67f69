// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_GENERATOR_HPP
#define PEGVM_INCLUDE_PEGVM_GENERATOR_HPP

#include <pegvm/grammar.hpp>
#include <pegvm/tables.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pegvm {

class encoder
{
	program* program_;
	table_builder tables_;
	std::vector<std::pair<std::ptrdiff_t, std::string>> calls_;
	std::vector<word> labels_;
	word rule_{-1};

public:
	explicit encoder(program& p) : program_{&p}, tables_{p} {}
	encoder(encoder const&) = delete;
	encoder(encoder&&) = delete;
	encoder& operator=(encoder const&) = delete;
	encoder& operator=(encoder&&) = delete;
	~encoder() = default;
	[[nodiscard]] table_builder& tables() noexcept { return tables_; }
	[[nodiscard]] word rule() const noexcept { return rule_; }
	[[nodiscard]] std::ptrdiff_t here() const noexcept { return static_cast<std::ptrdiff_t>(program_->instructions.size()); }
	[[nodiscard]] instruction& instruction_at(std::ptrdiff_t addr) { return program_->instructions.at(static_cast<std::size_t>(addr)); }
	void jump_to_target(std::ptrdiff_t addr, std::ptrdiff_t target) { instruction_at(addr).operands[0] = detail::checked_cast<word, program_limit_error>(target); }
	void jump_to_here(std::ptrdiff_t addr) { jump_to_target(addr, here()); }

	std::ptrdiff_t append(instruction instr)
	{
		std::ptrdiff_t const addr{here()};
		program_->instructions.push_back(instr);
		program_->instr_to_rule.push_back(rule_);
		return addr;
	}

	template <class... Operands>
	std::ptrdiff_t encode(opcode op, Operands... operands)
	{
		return append(pegvm::encode(op, operands...));
	}

	std::ptrdiff_t match(matcher m)
	{
		return encode(opcode::match, tables_.add_matcher(std::move(m)));
	}

	// The rule's entry address is patched in by resolve_calls once every
	// rule has been placed.
	std::ptrdiff_t call(std::string_view rule_name)
	{
		std::ptrdiff_t const addr = encode(opcode::push, stack_id::call, 0);
		calls_.emplace_back(addr, std::string{rule_name});
		encode(opcode::call);
		return addr;
	}

	void begin_rule(word r)
	{
		rule_ = r;
		labels_.clear();
	}

	void end_rule()
	{
		rule_ = -1;
		labels_.clear();
	}

	[[nodiscard]] std::size_t label_count() const noexcept { return labels_.size(); }
	void bind_label(word name) { labels_.push_back(name); }
	void drop_labels(std::size_t count) { labels_.resize((std::min)(count, labels_.size())); }

	[[nodiscard]] std::vector<word> visible_labels() const
	{
		std::vector<word> result;
		for (word const name : labels_)
			if (std::find(result.begin(), result.end(), name) == result.end())
				result.push_back(name);
		return result;
	}

	void resolve_calls()
	{
		std::unordered_map<std::string_view, word> entries;
		for (auto const& r : program_->rules)
			entries.emplace(program_->strings[static_cast<std::size_t>(r.name)], r.entry);
		for (auto const& [addr, name] : calls_) {
			auto const entry = entries.find(name);
			if (entry == entries.end())
				throw undefined_rule_error{name};
			instruction_at(addr).operands[1] = entry->second;
		}
		calls_.clear();
	}
};

class expression_compiler
{
	encoder& d_;
	bool guarded_;

	void compile(expression const& e, bool guarded)
	{
		e.visit(expression_compiler{d_, guarded});
	}

	void terminal(matcher m)
	{
		if (guarded_) {
			d_.match(std::move(m));
			return;
		}
		d_.encode(opcode::push, stack_id::position);
		d_.match(std::move(m));
		d_.encode(opcode::restore_if_f);
	}

	[[nodiscard]] auto label_scope()
	{
		return [&d = d_, count = d_.label_count()]() { d.drop_labels(count); };
	}

public:
	// A guarded expression runs right after its enclosing construct pushed
	// the input position, and that construct pops it again afterwards.
	expression_compiler(encoder& d, bool guarded) noexcept : d_{d}, guarded_{guarded} {}

	void operator()(literal_expression const& x) { terminal(literal_matcher{x.text, x.ignore_case}); }
	void operator()(char_class_expression const& x) { terminal(char_class_matcher{x.pattern}); }
	void operator()(any_expression const& /*x*/) { terminal(any_matcher{}); }

	void operator()(sequence_expression const& x)
	{
		if (x.children.empty()) {
			terminal(literal_matcher{});
			return;
		}
		if (x.children.size() == 1) {
			compile(x.children.front(), guarded_);
			return;
		}
		std::vector<std::ptrdiff_t> exits;
		for (std::size_t i = 0, n = x.children.size(); i < n; ++i) {
			compile(x.children[i], false);
			if (i + 1 < n)
				exits.push_back(d_.encode(opcode::jump_if_f, 0));
		}
		for (auto const addr : exits)
			d_.jump_to_here(addr);
	}

	void operator()(choice_expression const& x)
	{
		if (x.alternatives.empty()) {
			terminal(literal_matcher{});
			d_.encode(opcode::flip_f);
			return;
		}
		if (x.alternatives.size() == 1) {
			compile(x.alternatives.front(), guarded_);
			return;
		}
		auto const restore_labels = label_scope();
		std::vector<std::ptrdiff_t> exits;
		for (std::size_t i = 0, n = x.alternatives.size(); i + 1 < n; ++i) {
			d_.encode(opcode::push, stack_id::position);
			compile(x.alternatives[i], true);
			d_.encode(opcode::restore_if_f);
			exits.push_back(d_.encode(opcode::jump_if_not_f, 0));
			restore_labels();
		}
		compile(x.alternatives.back(), guarded_);
		restore_labels();
		for (auto const addr : exits)
			d_.jump_to_here(addr);
	}

	void operator()(zero_or_more_expression const& x)
	{
		detail::scope_exit const restore_labels{label_scope()};
		auto const loop = d_.here();
		d_.encode(opcode::push, stack_id::position);
		compile(x.child, true);
		d_.encode(opcode::restore_if_f);
		d_.encode(opcode::jump_if_not_f, loop);
		d_.encode(opcode::flip_f);
	}

	void operator()(one_or_more_expression const& x)
	{
		detail::scope_exit const restore_labels{label_scope()};
		d_.encode(opcode::push, stack_id::call, 0);
		auto const loop = d_.here();
		d_.encode(opcode::push, stack_id::position);
		compile(x.child, true);
		d_.encode(opcode::restore_if_f);
		auto const done = d_.encode(opcode::jump_if_f, 0);
		d_.encode(opcode::cumul_or_f);
		d_.encode(opcode::jump, loop);
		d_.jump_to_here(done);
		d_.encode(opcode::cumul_or_f);
	}

	void operator()(optional_expression const& x)
	{
		detail::scope_exit const restore_labels{label_scope()};
		d_.encode(opcode::push, stack_id::position);
		compile(x.child, true);
		d_.encode(opcode::restore_if_f);
		auto const matched = d_.encode(opcode::jump_if_not_f, 0);
		d_.encode(opcode::flip_f);
		d_.jump_to_here(matched);
	}

	void operator()(positive_lookahead_expression const& x)
	{
		detail::scope_exit const restore_labels{label_scope()};
		d_.encode(opcode::push, stack_id::position);
		compile(x.child, true);
		d_.encode(opcode::restore);
	}

	void operator()(negative_lookahead_expression const& x)
	{
		detail::scope_exit const restore_labels{label_scope()};
		d_.encode(opcode::push, stack_id::position);
		compile(x.child, true);
		d_.encode(opcode::restore);
		d_.encode(opcode::flip_f);
	}

	void operator()(labeled_expression const& x)
	{
		auto const name = d_.tables().add_string(x.name);
		d_.encode(opcode::push, stack_id::position);
		compile(x.child, true);
		d_.encode(opcode::store, name);
		d_.bind_label(name);
	}

	void operator()(action_expression const& x)
	{
		detail::scope_exit const restore_labels{label_scope()};
		auto const thunk = d_.tables().add_action(thunk_info{x.code, {}, d_.rule()});
		compile(x.child, guarded_);
		auto const failed = d_.encode(opcode::jump_if_f, 0);
		d_.encode(opcode::call_a, thunk);
		d_.jump_to_here(failed);
		d_.tables().action_at(thunk).params = d_.visible_labels();
	}

	void operator()(predicate_expression const& x)
	{
		d_.encode(opcode::call_b, d_.tables().add_predicate(thunk_info{x.code, d_.visible_labels(), d_.rule()}));
	}

	void operator()(rule_expression const& x)
	{
		d_.call(x.name);
	}
};

// Compiles every rule of the grammar into one program. Rule 0, the first
// rule declared, is the entry point called by the three instruction
// prologue.
[[nodiscard]] inline program generate(grammar const& g)
{
	if (g.rules.empty())
		throw no_rule_error{};
	std::unordered_map<std::string_view, std::size_t> names;
	for (std::size_t i = 0; i < g.rules.size(); ++i)
		if (!names.emplace(g.rules[i].name, i).second)
			throw duplicate_rule_error{g.rules[i].name};
	program p;
	p.init = g.init;
	encoder d{p};
	d.call(g.rules.front().name);
	d.encode(opcode::exit);
	for (std::size_t i = 0; i < g.rules.size(); ++i) {
		auto const& r = g.rules[i];
		d.begin_rule(detail::checked_cast<word, resource_limit_error>(i));
		rule_info info;
		info.name = d.tables().add_string(r.name);
		info.display_name = r.has_display_name() ? d.tables().add_string(*r.display_name) : info.name;
		info.entry = detail::checked_cast<word, program_limit_error>(d.here());
		p.rules.push_back(info);
		d.encode(opcode::push, stack_id::position);
		r.expr.visit(expression_compiler{d, true});
		d.encode(opcode::restore_if_f);
		d.encode(opcode::ret);
		d.end_rule();
	}
	d.resolve_calls();
	return p;
}

} // namespace pegvm

#endif
