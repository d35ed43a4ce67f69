// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_MACHINE_HPP
#define PEGVM_INCLUDE_PEGVM_MACHINE_HPP

#include <pegvm/program.hpp>
#include <pegvm/utf8.hpp>

#include <any>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace pegvm {

class environment;
class machine;

using semantic_action = std::function<std::any(environment&)>;
using semantic_predicate = std::function<bool(environment&)>;

class syntax
{
	std::string_view str_;
	std::size_t index_{0};
public:
	constexpr syntax() noexcept = default;
	constexpr syntax(std::string_view c, std::size_t i) noexcept : str_{c}, index_{i} {}
	[[nodiscard]] constexpr std::string_view str() const noexcept { return str_; }
	[[nodiscard]] constexpr std::size_t index() const noexcept { return index_; }
	[[nodiscard]] operator std::string() const { return std::string{str_}; } // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	[[nodiscard]] constexpr operator std::string_view() const noexcept { return str_; } // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	[[nodiscard]] constexpr bool empty() const noexcept { return str_.empty(); }
	[[nodiscard]] constexpr std::size_t size() const noexcept { return str_.size(); }
	[[nodiscard]] constexpr bool operator==(syntax const& other) const noexcept { return str_ == other.str_ && index_ == other.index_; }
	[[nodiscard]] constexpr bool operator!=(syntax const& other) const noexcept { return str_ != other.str_ || index_ != other.index_; }
};

// Text matched under a label together with the value of the last action
// that ran inside it.
struct capture
{
	syntax text;
	std::any value;
};

using label_frame = std::unordered_map<word, capture>;

class environment
{
	friend class machine;

	program const* program_{nullptr};
	std::string_view subject_;
	std::size_t position_{0};
	std::vector<word> const* params_{nullptr};
	label_frame const* frame_{nullptr};

	virtual void on_reset() {}

	void reset(program const& p, std::string_view sub)
	{
		program_ = &p;
		subject_ = sub;
		position_ = 0;
		params_ = nullptr;
		frame_ = nullptr;
		on_reset();
	}

	[[nodiscard]] capture const* find_label(std::string_view name) const
	{
		if ((params_ == nullptr) || (frame_ == nullptr))
			return nullptr;
		for (word const param : *params_) {
			if (program_->strings.at(static_cast<std::size_t>(param)) == name) {
				auto const bound = frame_->find(param);
				return (bound != frame_->end()) ? &bound->second : nullptr;
			}
		}
		return nullptr;
	}

	[[nodiscard]] capture const& get_label(std::string_view name) const
	{
		if (auto const* c = find_label(name); c != nullptr)
			return *c;
		throw unbound_label_error{std::string{name}};
	}

public:
	environment() = default;
	environment(environment const&) = delete;
	environment(environment&&) noexcept = default;
	environment& operator=(environment const&) = delete;
	environment& operator=(environment&&) noexcept = default;
	virtual ~environment() = default;
	[[nodiscard]] std::string_view subject() const noexcept { return subject_; }
	[[nodiscard]] std::size_t position() const noexcept { return position_; }
	[[nodiscard]] bool has_label(std::string_view name) const { return find_label(name) != nullptr; }
	[[nodiscard]] syntax label(std::string_view name) const { return get_label(name).text; }
	[[nodiscard]] std::any const& label_any(std::string_view name) const { return get_label(name).value; }

	template <class T>
	[[nodiscard]] T label_value(std::string_view name) const
	{
		return std::any_cast<T>(get_label(name).value);
	}
};

namespace detail {

struct rune_range
{
	char32_t first;
	char32_t last;
};

struct compiled_class
{
	std::vector<rune_range> ranges;
	bool negated{false};
	bool ignore_case{false};

	[[nodiscard]] bool contains(char32_t r) const noexcept
	{
		for (auto const& range : ranges)
			if ((range.first <= r) && (r <= range.last))
				return true;
		return false;
	}

	[[nodiscard]] bool matches(char32_t r) const noexcept
	{
		bool const found = contains(r) || (ignore_case && (contains(utf8::tolower(r)) || contains(utf8::toupper(r))));
		return found != negated;
	}
};

[[nodiscard]] inline char32_t parse_class_hex(std::string_view::const_iterator& first, std::string_view::const_iterator last, std::size_t digits, std::string const& pattern)
{
	char32_t r = U'\0';
	for (std::size_t i = 0; i < digits; ++i, ++first) {
		if (first == last)
			throw bad_character_class{pattern};
		char const c = *first;
		unsigned int d = 0;
		if ((c >= '0') && (c <= '9'))
			d = static_cast<unsigned int>(c - '0');
		else if ((c >= 'a') && (c <= 'f'))
			d = static_cast<unsigned int>(c - 'a') + 10U;
		else if ((c >= 'A') && (c <= 'F'))
			d = static_cast<unsigned int>(c - 'A') + 10U;
		else
			throw bad_character_class{pattern};
		r = (r << 4U) | d;
	}
	if (r > U'\U0010ffff')
		throw bad_character_class{pattern};
	return r;
}

[[nodiscard]] inline char32_t parse_class_rune(std::string_view::const_iterator& first, std::string_view::const_iterator last, std::string const& pattern)
{
	if (*first != '\\') {
		auto const [next, rune] = utf8::decode_rune(first, last);
		first = next;
		return rune;
	}
	if (++first == last)
		throw bad_character_class{pattern};
	switch (*first++) {
		case 'n': return U'\n';
		case 't': return U'\t';
		case 'r': return U'\r';
		case '\\': return U'\\';
		case ']': return U']';
		case '[': return U'[';
		case '-': return U'-';
		case '^': return U'^';
		case 'x': return parse_class_hex(first, last, 2, pattern);
		case 'u': return parse_class_hex(first, last, 4, pattern);
		case 'U': return parse_class_hex(first, last, 8, pattern);
		default: throw bad_character_class{pattern};
	}
}

// Parses [items], [^items] and a trailing i for case insensitivity. Items
// are single runes, escapes and a-z style ranges.
[[nodiscard]] inline compiled_class compile_class(std::string const& pattern)
{
	compiled_class result;
	std::string_view s{pattern};
	if ((s.size() >= 3) && (s.back() == 'i') && (s[s.size() - 2] == ']')) {
		result.ignore_case = true;
		s.remove_suffix(1);
	}
	if ((s.size() < 2) || (s.front() != '[') || (s.back() != ']'))
		throw bad_character_class{pattern};
	s = s.substr(1, s.size() - 2);
	if (!s.empty() && (s.front() == '^')) {
		result.negated = true;
		s.remove_prefix(1);
	}
	auto first = s.begin();
	auto const last = s.end();
	while (first != last) {
		char32_t const lo = parse_class_rune(first, last, pattern);
		if ((first != last) && (*first == '-') && (std::next(first) != last)) {
			++first;
			char32_t const hi = parse_class_rune(first, last, pattern);
			if (hi < lo)
				throw bad_character_range{pattern};
			result.ranges.push_back(rune_range{lo, hi});
		} else {
			result.ranges.push_back(rune_range{lo, lo});
		}
	}
	return result;
}

} // namespace detail

// Executes a generated program against an input string. One machine runs
// one parse at a time; the program may be shared between machines.
class machine
{
	using compiled_matcher = std::variant<literal_matcher, detail::compiled_class, any_matcher>;

	static constexpr std::size_t default_call_depth_limit{4096};

	struct saved_position
	{
		std::size_t position;
		std::size_t trail;
	};

	// previous binding of a label, restored when the attempt that rebound it fails
	struct binding
	{
		std::size_t frame;
		word name;
		std::optional<capture> previous;
	};

	program const* program_;
	std::vector<compiled_matcher> matchers_;
	std::vector<semantic_action> actions_;
	std::vector<semantic_predicate> predicates_;
	environment default_environment_;
	environment* environment_;
	std::vector<saved_position> position_stack_;
	std::vector<binding> trail_;
	std::vector<std::ptrdiff_t> call_stack_;
	std::vector<label_frame> frames_;
	std::string_view subject_;
	std::size_t cursor_{0};
	std::any value_;
	std::ptrdiff_t failure_instruction_{-1};
	std::size_t failure_position_{0};
	std::size_t call_depth_limit_{default_call_depth_limit};
	bool fail_{false};
	bool parsing_{false};

	[[nodiscard]] static compiled_matcher compile(matcher const& m)
	{
		return std::visit([](auto const& x) -> compiled_matcher {
			using T = std::decay_t<decltype(x)>;
			if constexpr (std::is_same_v<T, char_class_matcher>)
				return detail::compile_class(x.pattern);
			else
				return x;
		}, m);
	}

	template <class T>
	[[nodiscard]] static T pop(std::vector<T>& s)
	{
		if (s.empty())
			throw bad_stack{};
		return detail::pop_back(s);
	}

	template <class Thunk>
	[[nodiscard]] static std::vector<Thunk> bind_thunks(std::vector<thunk_info> const& thunks, std::vector<Thunk> bound, std::string_view code, Thunk const& fn)
	{
		for (std::size_t i = 0; i < thunks.size(); ++i)
			if (thunks[i].code == code)
				bound[i] = fn;
		return bound;
	}

	template <class Fn>
	[[nodiscard]] static semantic_action make_action(Fn&& fn)
	{
		return [f = std::forward<Fn>(fn)](environment& envr) -> std::any {
			using result_type = std::invoke_result_t<std::decay_t<Fn> const&, detail::dynamic_cast_if_base_of<environment&>>;
			if constexpr (std::is_void_v<result_type>) {
				f(detail::dynamic_cast_if_base_of<environment&>{envr});
				return std::any{};
			} else {
				return std::any{f(detail::dynamic_cast_if_base_of<environment&>{envr})};
			}
		};
	}

	[[nodiscard]] std::ptrdiff_t address(word target) const
	{
		if ((target < 0) || (static_cast<std::size_t>(target) > program_->instructions.size()))
			throw bad_operand{};
		return static_cast<std::ptrdiff_t>(target);
	}

	template <class Table>
	[[nodiscard]] static std::size_t index(Table const& table, word i)
	{
		if ((i < 0) || (static_cast<std::size_t>(i) >= table.size()))
			throw bad_operand{};
		return static_cast<std::size_t>(i);
	}

	[[nodiscard]] bool match_literal(literal_matcher const& m)
	{
		auto const rest = subject_.substr(cursor_);
		if (!m.ignore_case) {
			if (rest.substr(0, m.text.size()) != m.text)
				return false;
			cursor_ += m.text.size();
			return true;
		}
		auto s = rest.begin();
		auto t = m.text.begin();
		while (t != m.text.end()) {
			if (s == rest.end())
				return false;
			auto const [snext, srune] = utf8::decode_rune(s, rest.end());
			auto const [tnext, trune] = utf8::decode_rune(t, m.text.end());
			if (utf8::tolower(srune) != utf8::tolower(trune))
				return false;
			s = snext;
			t = tnext;
		}
		cursor_ += static_cast<std::size_t>(s - rest.begin());
		return true;
	}

	[[nodiscard]] bool match_class(detail::compiled_class const& c)
	{
		if (cursor_ >= subject_.size())
			return false;
		auto const rest = subject_.substr(cursor_);
		auto const [next, rune] = utf8::decode_rune(rest.begin(), rest.end());
		if (!c.matches(rune))
			return false;
		cursor_ += static_cast<std::size_t>(next - rest.begin());
		return true;
	}

	[[nodiscard]] bool match_any()
	{
		if (cursor_ >= subject_.size())
			return false;
		auto const rest = subject_.substr(cursor_);
		cursor_ += static_cast<std::size_t>(utf8::next_rune(rest.begin(), rest.end()) - rest.begin());
		return true;
	}

	[[nodiscard]] bool match(compiled_matcher const& m)
	{
		return std::visit([this](auto const& x) -> bool {
			using T = std::decay_t<decltype(x)>;
			if constexpr (std::is_same_v<T, literal_matcher>)
				return match_literal(x);
			else if constexpr (std::is_same_v<T, detail::compiled_class>)
				return match_class(x);
			else
				return match_any();
		}, m);
	}

	void bind_label(word name, capture c)
	{
		auto& frame = frames_.back();
		auto const prior = frame.find(name);
		trail_.push_back(binding{frames_.size() - 1, name, (prior != frame.end()) ? std::optional<capture>{prior->second} : std::nullopt});
		frame[name] = std::move(c);
	}

	void unwind_labels(std::size_t mark)
	{
		while (trail_.size() > mark) {
			auto b = detail::pop_back(trail_);
			auto& frame = frames_.at(b.frame);
			if (b.previous)
				frame[b.name] = std::move(*b.previous);
			else
				frame.erase(b.name);
		}
	}

	environment& prepare_thunk(thunk_info const& thunk)
	{
		environment_->position_ = cursor_;
		environment_->params_ = &thunk.params;
		environment_->frame_ = &frames_.back();
		return *environment_;
	}

	void reset(std::string_view input)
	{
		subject_ = input;
		cursor_ = 0;
		value_.reset();
		fail_ = false;
		failure_instruction_ = -1;
		failure_position_ = 0;
		position_stack_.clear();
		trail_.clear();
		call_stack_.clear();
		frames_.clear();
		frames_.emplace_back();
		environment_->reset(*program_, input);
	}

public:
	explicit machine(program const& p) : machine{p, default_environment_} {}

	machine(program const& p, environment& envr)
		: program_{&p}, actions_(p.actions.size()), predicates_(p.predicates.size()), environment_{&envr}
	{
		matchers_.reserve(p.matchers.size());
		for (auto const& m : p.matchers)
			matchers_.push_back(compile(m));
	}

	machine(machine const&) = delete;
	machine(machine&&) = delete;
	machine& operator=(machine const&) = delete;
	machine& operator=(machine&&) = delete;
	~machine() = default;

	[[nodiscard]] std::size_t cursor() const noexcept { return cursor_; }
	[[nodiscard]] std::any const& value() const noexcept { return value_; }
	[[nodiscard]] std::ptrdiff_t failure_instruction() const noexcept { return failure_instruction_; }
	[[nodiscard]] std::size_t failure_position() const noexcept { return failure_position_; }
	[[nodiscard]] std::size_t call_depth_limit() const noexcept { return call_depth_limit_; }
	machine& call_depth_limit(std::size_t n) noexcept { call_depth_limit_ = n; return *this; }

	[[nodiscard]] std::string failure_message() const
	{
		if (failure_instruction_ < 0)
			return std::string{};
		auto const r = program_->instr_to_rule.at(static_cast<std::size_t>(failure_instruction_));
		std::string const name = (r >= 0) ? std::string{program_->rule_display_name(r)} : std::string{"<start>"};
		return "rule " + name + " failed at instruction " + std::to_string(failure_instruction_);
	}

	template <class Fn, class = std::enable_if_t<std::is_invocable_v<std::decay_t<Fn> const&, detail::dynamic_cast_if_base_of<environment&>>>>
	machine& bind_action(std::string_view code, Fn&& fn)
	{
		actions_ = bind_thunks(program_->actions, std::move(actions_), code, make_action(std::forward<Fn>(fn)));
		return *this;
	}

	template <class Fn, class = std::enable_if_t<std::is_invocable_r_v<bool, std::decay_t<Fn> const&, detail::dynamic_cast_if_base_of<environment&>>>>
	machine& bind_predicate(std::string_view code, Fn&& fn)
	{
		semantic_predicate const pred = [f = std::forward<Fn>(fn)](environment& envr) -> bool {
			return f(detail::dynamic_cast_if_base_of<environment&>{envr});
		};
		predicates_ = bind_thunks(program_->predicates, std::move(predicates_), code, pred);
		return *this;
	}

	bool parse(std::string_view input)
	{
		detail::reentrancy_sentinel<reenterant_parse_error> const guard{parsing_};
		reset(input);
		auto const& instructions = program_->instructions;
		std::ptrdiff_t pc = 0;
		for (;;) {
			if ((pc < 0) || (static_cast<std::size_t>(pc) >= instructions.size()))
				throw bad_operand{};
			std::ptrdiff_t const addr = pc++;
			auto const& instr = instructions[static_cast<std::size_t>(addr)];
			switch (instr.op()) {
				case opcode::push: {
					auto const stack = instr.operand(0);
					if (stack == static_cast<word>(stack_id::position)) {
						if (instr.operand_count() > 1) {
							if (instr.operand(1) < 0)
								throw bad_operand{};
							position_stack_.push_back(saved_position{static_cast<std::size_t>(instr.operand(1)), trail_.size()});
						} else {
							position_stack_.push_back(saved_position{cursor_, trail_.size()});
						}
					} else if (stack == static_cast<word>(stack_id::call)) {
						call_stack_.push_back((instr.operand_count() > 1) ? static_cast<std::ptrdiff_t>(instr.operand(1)) : static_cast<std::ptrdiff_t>(cursor_));
					} else {
						throw bad_operand{};
					}
				} break;
				case opcode::pop: {
					auto const stack = instr.operand(0);
					if (stack == static_cast<word>(stack_id::position))
						(void)pop(position_stack_);
					else if (stack == static_cast<word>(stack_id::call))
						(void)pop(call_stack_);
					else
						throw bad_operand{};
				} break;
				case opcode::call: {
					auto const target = pop(call_stack_);
					if ((target < 0) || (static_cast<std::size_t>(target) >= instructions.size()))
						throw bad_operand{};
					if (frames_.size() > call_depth_limit_)
						throw resource_limit_error{};
					call_stack_.push_back(pc);
					frames_.emplace_back();
					pc = target;
				} break;
				case opcode::ret: {
					if (frames_.size() < 2)
						throw bad_stack{};
					pc = pop(call_stack_);
					frames_.pop_back();
					while (!trail_.empty() && (trail_.back().frame >= frames_.size()))
						trail_.pop_back();
				} break;
				case opcode::exit: {
					if (!position_stack_.empty() || !call_stack_.empty())
						throw bad_stack{};
					return !fail_;
				}
				case opcode::match: {
					auto const& m = matchers_[index(matchers_, instr.operand(0))];
					std::size_t const start = cursor_;
					if (match(m)) {
						fail_ = false;
						value_.reset();
					} else {
						fail_ = true;
						if ((failure_instruction_ < 0) || (start > failure_position_)) {
							failure_instruction_ = addr;
							failure_position_ = start;
						}
					}
				} break;
				case opcode::restore: {
					auto const saved = pop(position_stack_);
					cursor_ = saved.position;
					unwind_labels(saved.trail);
				} break;
				case opcode::restore_if_f: {
					auto const saved = pop(position_stack_);
					if (fail_) {
						cursor_ = saved.position;
						unwind_labels(saved.trail);
					}
				} break;
				case opcode::store: {
					auto const name = static_cast<word>(index(program_->strings, instr.operand(0)));
					auto const saved = pop(position_stack_);
					if (fail_) {
						unwind_labels(saved.trail);
					} else {
						if (saved.position > cursor_)
							throw bad_stack{};
						bind_label(name, capture{syntax{subject_.substr(saved.position, cursor_ - saved.position), saved.position}, value_});
					}
				} break;
				case opcode::jump: {
					pc = address(instr.operand(0));
				} break;
				case opcode::jump_if_f: {
					if (fail_)
						pc = address(instr.operand(0));
				} break;
				case opcode::jump_if_not_f: {
					if (!fail_)
						pc = address(instr.operand(0));
				} break;
				case opcode::flip_f: {
					fail_ = !fail_;
				} break;
				case opcode::cumul_or_f: {
					auto const n = pop(call_stack_);
					if (!fail_)
						call_stack_.push_back(n + 1);
					else
						fail_ = (n == 0);
				} break;
				case opcode::call_a: {
					auto const i = index(actions_, instr.operand(0));
					auto const& thunk = program_->actions[i];
					if (!actions_[i])
						throw unbound_thunk_error{thunk.code};
					value_ = actions_[i](prepare_thunk(thunk));
				} break;
				case opcode::call_b: {
					auto const i = index(predicates_, instr.operand(0));
					auto const& thunk = program_->predicates[i];
					if (!predicates_[i])
						throw unbound_thunk_error{thunk.code};
					fail_ = !predicates_[i](prepare_thunk(thunk));
				} break;
				default: throw bad_opcode{};
			}
		}
	}
};

inline bool parse(std::string_view input, program const& p)
{
	return machine{p}.parse(input);
}

inline bool parse(std::string_view input, program const& p, environment& envr)
{
	return machine{p, envr}.parse(input);
}

} // namespace pegvm

#endif
