// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_DETAIL_HPP
#define PEGVM_INCLUDE_PEGVM_DETAIL_HPP

#include <functional>
#include <iterator>
#include <limits>
#include <type_traits>
#include <utility>

#ifndef PEGVM_NO_RTTI
#if defined __GNUC__
#ifndef __GXX_RTTI
#define PEGVM_NO_RTTI
#endif
#elif defined _MSC_VER
#ifndef _CPPRTTI
#define PEGVM_NO_RTTI
#endif
#endif
#endif // PEGVM_NO_RTTI

namespace pegvm::detail {

template <class It>
inline constexpr bool is_char_input_iterator_v =
	!std::is_integral_v<It> &&
	std::is_base_of_v<std::input_iterator_tag, typename std::iterator_traits<It>::iterator_category> &&
	std::is_same_v<char, std::remove_cv_t<typename std::iterator_traits<It>::value_type>>;

template <class It, class T = void> using enable_if_char_input_iterator_t = std::enable_if_t<is_char_input_iterator_v<It>, T>;

template <class T>
class dynamic_cast_if_base_of
{
	std::reference_wrapper<std::remove_reference_t<T>> value_;

public:
	constexpr explicit dynamic_cast_if_base_of(std::remove_reference_t<T>& x) noexcept : value_{x} {}

	template <class U, class = std::enable_if_t<std::is_base_of_v<std::decay_t<T>, std::decay_t<U>>>>
	[[nodiscard]] constexpr operator U&() const noexcept(std::is_same_v<std::decay_t<T>, std::decay_t<U>>) // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	{
#ifndef PEGVM_NO_RTTI
		if constexpr (std::is_same_v<std::decay_t<T>, std::decay_t<U>>)
#endif // PEGVM_NO_RTTI
			return static_cast<std::remove_reference_t<U>&>(value_.get());
#ifndef PEGVM_NO_RTTI
		else
			return dynamic_cast<std::remove_reference_t<U>&>(value_.get());
#endif // PEGVM_NO_RTTI
	}
};

template <class Error>
class reentrancy_sentinel
{
	std::reference_wrapper<bool> value_;

public:
	constexpr explicit reentrancy_sentinel(bool& x)
		: value_{x}
	{
		if (value_.get())
			throw Error();
		value_.get() = true;
	}

	~reentrancy_sentinel()
	{
		value_.get() = false;
	}

	reentrancy_sentinel(reentrancy_sentinel const&) = delete;
	reentrancy_sentinel(reentrancy_sentinel&&) = delete;
	reentrancy_sentinel& operator=(reentrancy_sentinel const&) = delete;
	reentrancy_sentinel& operator=(reentrancy_sentinel&&) = delete;
};

template <class EF>
class scope_exit
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_exit(Fn&& fn) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
	{}

	~scope_exit()
	{
		destructor_();
	}

	scope_exit(scope_exit const&) = delete;
	scope_exit(scope_exit&&) = delete;
	scope_exit& operator=(scope_exit const&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_exit(Fn) -> scope_exit<std::decay_t<Fn>>;

template <class Error, class T, class U, class V, class = std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<U> && std::is_integral_v<V>>>
constexpr void assure_in_range(T x, U minval, V maxval)
{
	if constexpr (std::is_signed_v<T> == std::is_signed_v<U>) {
		if (x < minval)
			throw Error();
	} else if constexpr (std::is_signed_v<T>) {
		if ((x < 0) || (static_cast<std::make_unsigned_t<T>>(x) < minval))
			throw Error();
	} else {
		if ((minval > 0) && (x < static_cast<std::make_unsigned_t<U>>(minval)))
			throw Error();
	}
	if constexpr (std::is_signed_v<T> == std::is_signed_v<V>) {
		if (x > maxval)
			throw Error();
	} else if constexpr (std::is_signed_v<T>) {
		if ((x > 0) && (static_cast<std::make_unsigned_t<T>>(x) > static_cast<std::make_unsigned_t<V>>(maxval)))
			throw Error();
	} else {
		if ((maxval < 0) || (x > static_cast<std::make_unsigned_t<V>>(maxval)))
			throw Error();
	}
}

template <class T, class Error, class S, class U, class V, class = std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<S> && std::is_integral_v<U> && std::is_integral_v<V>>>
[[nodiscard]] constexpr T checked_cast(S x, U minval, V maxval)
{
	detail::assure_in_range<Error>(x, minval, maxval);
	return static_cast<T>(x);
}

template <class T, class Error, class S, class = std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<S>>>
[[nodiscard]] constexpr T checked_cast(S x)
{
	return detail::checked_cast<T, Error>(x, (std::numeric_limits<std::decay_t<T>>::min)(), (std::numeric_limits<std::decay_t<T>>::max)());
}

template <class Sequence>
[[nodiscard]] constexpr auto pop_back(Sequence& s) -> typename Sequence::value_type
{
	typename Sequence::value_type result{std::move(s.back())}; // NOLINT(misc-const-correctness)
	s.pop_back();
	return result;
}

} // namespace pegvm::detail

#endif
