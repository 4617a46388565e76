#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Useful macro for constexpr-detection of whether a macro is assigned to 1. This is useful given
 * the behavior of -D options passed through CMake.
 *
 * #define FOO 1
 * // #define BAR
 *
 * static_assert(IS_MACRO_ENABLED(FOO))
 * static_assert(!IS_MACRO_ENABLED(BAR))
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')
#define IS_DEFINED(macro) IS_MACRO_ENABLED(macro)

/*
 * Marks the arguments as used without evaluating them. The LOG_*() macros use this so that a
 * variable referenced only in a compiled-out log statement does not trigger unused-variable
 * warnings.
 */
#define USE_UNEVALUATED(...) ((void)sizeof(std::make_tuple(__VA_ARGS__)))

namespace util {

/*
 * This identity function is intended to be used to declare required members in concepts.
 *
 * Example usage:
 *
 * template <class T>
 * concept Foo = requires(T t) {
 *   { util::decay_copy(T::bar) } -> std::same_as<int>;
 * };
 *
 * The above expresses the requirement that the class T has a static member bar of type int.
 *
 * This function does not actually have an implementation, and so you will get a linker error if
 * you try to actually invoke it in other contexts.
 */
template <class T>
std::decay_t<T> decay_copy(T&&);

template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }
  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    if (N != M) return false;
    for (size_t i = 0; i < N; ++i) {
      if (value[i] != other.value[i]) return false;
    }
    return true;
  }
  char value[N];
};

template <StringLiteral...>
struct StringLiteralSequence {};

template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

template <typename T>
struct is_int_sequence {
  static constexpr bool value = false;
};
template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> {
  static constexpr bool value = true;
};
template <typename T>
inline constexpr bool is_int_sequence_v = is_int_sequence<T>::value;

/*
 * true: util::int_sequence_contains_v<util::int_sequence<1, 3, 5>, 1>
 * false: util::int_sequence_contains_v<util::int_sequence<1, 3, 5>, 2>
 */
template <typename T, int K>
struct int_sequence_contains {
  static constexpr bool value = false;
};
template <int I, int... Is, int K>
struct int_sequence_contains<int_sequence<I, Is...>, K> {
  static constexpr bool value = (I == K) || int_sequence_contains<int_sequence<Is...>, K>::value;
};
template <typename T, int K>
inline constexpr bool int_sequence_contains_v = int_sequence_contains<T, K>::value;

template <typename T, StringLiteral S>
struct string_literal_sequence_contains {
  static constexpr bool value = false;
};
template <StringLiteral I, StringLiteral... Is, StringLiteral S>
struct string_literal_sequence_contains<StringLiteralSequence<I, Is...>, S> {
  static constexpr bool value =
    (I == S) || string_literal_sequence_contains<StringLiteralSequence<Is...>, S>::value;
};
template <typename T, StringLiteral S>
inline constexpr bool string_literal_sequence_contains_v =
  string_literal_sequence_contains<T, S>::value;

/*
 * The following are equivalent:
 *
 * using U = util::concat_int_sequence_t<util::int_sequence<1, 2>, util::int_sequence<3>>;
 * using U = util::int_sequence<1, 2, 3>;
 */
template <typename T, typename U>
struct concat_int_sequence {};
template <int... Ints1, int... Ints2>
struct concat_int_sequence<int_sequence<Ints1...>, int_sequence<Ints2...>> {
  using type = int_sequence<Ints1..., Ints2...>;
};
template <typename T, typename U>
using concat_int_sequence_t = typename concat_int_sequence<T, U>::type;

template <typename T, typename U>
struct concat_string_literal_sequence {};
template <StringLiteral... S1, StringLiteral... S2>
struct concat_string_literal_sequence<StringLiteralSequence<S1...>, StringLiteralSequence<S2...>> {
  using type = StringLiteralSequence<S1..., S2...>;
};
template <typename T, typename U>
using concat_string_literal_sequence_t = typename concat_string_literal_sequence<T, U>::type;

template <typename T, typename U>
struct no_overlap {
  static constexpr bool value = true;
};
template <typename T, StringLiteral S, StringLiteral... Ss>
struct no_overlap<T, StringLiteralSequence<S, Ss...>> {
  static constexpr bool value = !string_literal_sequence_contains_v<T, S> &&
                                no_overlap<T, StringLiteralSequence<Ss...>>::value;
};
template <typename T, int I, int... Is>
struct no_overlap<T, int_sequence<I, Is...>> {
  static constexpr bool value =
    !int_sequence_contains_v<T, I> && no_overlap<T, int_sequence<Is...>>::value;
};
template <typename T, typename U>
inline constexpr bool no_overlap_v = no_overlap<T, U>::value;

// Integer power for small non-negative exponents, used to size enumeration spaces.
constexpr uint64_t int_pow(uint64_t base, int exponent);

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence_v<T>;

}  // namespace concepts

}  // namespace util

#include "inline/util/CppUtil.inl"
