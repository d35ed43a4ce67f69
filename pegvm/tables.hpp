// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_TABLES_HPP
#define PEGVM_INCLUDE_PEGVM_TABLES_HPP

#include <pegvm/program.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pegvm {

// Fills the side tables of a program under construction. Matchers and
// strings are interned; thunks are always appended.
class table_builder
{
	program* program_;
	std::unordered_map<std::string, word> matcher_indices_;
	std::unordered_map<std::string, word> string_indices_;

	template <class Item, class ItemValue>
	[[nodiscard]] static word add_item(std::vector<Item>& items, ItemValue&& item)
	{
		items.push_back(std::forward<ItemValue>(item));
		return detail::checked_cast<word, resource_limit_error>(items.size() - 1);
	}

public:
	explicit table_builder(program& p) : program_{&p}
	{
		for (std::size_t i = 0; i < p.matchers.size(); ++i)
			matcher_indices_.emplace(key(p.matchers[i]), detail::checked_cast<word, resource_limit_error>(i));
		for (std::size_t i = 0; i < p.strings.size(); ++i)
			string_indices_.emplace(p.strings[i], detail::checked_cast<word, resource_limit_error>(i));
	}

	[[nodiscard]] static std::string key(matcher const& m)
	{
		return std::to_string(m.index()) + ':' + to_string(m);
	}

	word add_matcher(matcher m)
	{
		auto [entry, inserted] = matcher_indices_.try_emplace(key(m), 0);
		if (inserted)
			entry->second = add_item(program_->matchers, std::move(m));
		return entry->second;
	}

	word add_string(std::string_view s)
	{
		auto [entry, inserted] = string_indices_.try_emplace(std::string{s}, 0);
		if (inserted)
			entry->second = add_item(program_->strings, std::string{s});
		return entry->second;
	}

	word add_action(thunk_info t) { return add_item(program_->actions, std::move(t)); }
	word add_predicate(thunk_info t) { return add_item(program_->predicates, std::move(t)); }
	[[nodiscard]] thunk_info& action_at(word index) { return program_->actions.at(static_cast<std::size_t>(index)); }
	[[nodiscard]] thunk_info& predicate_at(word index) { return program_->predicates.at(static_cast<std::size_t>(index)); }
};

} // namespace pegvm

#endif
