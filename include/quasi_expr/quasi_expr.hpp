/*
MIT License

Copyright (c) 2023-2024 Jason Turner

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef QUASI_EXPR_HPP
#define QUASI_EXPR_HPP

#include <algorithm>
#include <array>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

/// What?
// A quotation and quasiquotation engine. Code is captured as a tree instead of
// being evaluated, and computed values are re-introduced into the tree with
// escape markers before it is finally evaluated:
//
//   !!x          unquote: the value of x replaces the marker
//   !!!xs        unquote-splice: each item of xs becomes a sibling argument
//   (:= n v)     define: an argument whose name is computed
//
// Arguments to user functions are promises, so a function can capture the
// expression its caller wrote (enexpr/enquo) without ever evaluating it.

/// Goals
// * small and hackable, one header
// * constexpr evaluation of script possible
// * constexpr creation of interpreter possible
// * all trees are immutable, rewriting creates new trees that share subtrees
// * no exceptions or dynamic allocations, errors are values
// * C++23 as a minimum
// * never thread safe

/// Notes
// * every object lives in an arena owned by the engine and is referred to by index
// * arenas never move their storage, so spans and references into them stay valid
//   while the arena grows
// * only indices and values are passed around, which keeps SExpr trivially copyable
// * Promise state and the binding table are the only things mutated in place


namespace quasi {

inline constexpr int quasi_expr_version_major{ 0 };
inline constexpr int quasi_expr_version_minor{ 1 };
inline constexpr int quasi_expr_version_patch{ 0 };
inline constexpr int quasi_expr_version_tweak{};


template<typename char_type> struct chars
{
  [[nodiscard]] static consteval std::string_view str(const char *input) noexcept
    requires std::is_same_v<char_type, char>
  {
    return input;
  }

  template<std::size_t Size>
  [[nodiscard]] static consteval auto str(const char (&input)[Size]) noexcept// NOLINT c-arrays
    requires(!std::is_same_v<char_type, char>)
  {
    struct Result
    {
      char_type data[Size];// NOLINT c-arrays
      constexpr operator std::basic_string_view<char_type>() { return { data, Size - 1 }; }// NOLINT implicit
    };

    Result result;
    std::copy(std::begin(input), std::end(input), std::begin(result.data));
    return result;
  }

  [[nodiscard]] static consteval char_type ch(const char input) noexcept { return input; }
};


template<std::unsigned_integral SizeType,
  typename Contained,
  SizeType SmallSize,
  typename KeyType,
  typename SpanType = std::span<const Contained>>
struct SmallVector
{
  using size_type = SizeType;
  using span_type = SpanType;

  std::array<Contained, SmallSize> small;
  size_type small_size_used = 0;
  bool error_state = false;

  static constexpr auto small_capacity = SmallSize;

  [[nodiscard]] constexpr Contained &operator[](size_type index) noexcept { return small[index]; }
  [[nodiscard]] constexpr const Contained &operator[](size_type index) const noexcept { return small[index]; }
  [[nodiscard]] constexpr auto size() const noexcept { return small_size_used; }
  [[nodiscard]] constexpr auto begin() const noexcept { return small.begin(); }
  [[nodiscard]] constexpr auto begin() noexcept { return small.begin(); }

  [[nodiscard]] constexpr auto end() const noexcept
  {
    return std::next(small.begin(), static_cast<std::ptrdiff_t>(small_size_used));
  }

  [[nodiscard]] constexpr auto end() noexcept
  {
    return std::next(small.begin(), static_cast<std::ptrdiff_t>(small_size_used));
  }

  [[nodiscard]] constexpr SpanType view(KeyType range) const noexcept
  {
    return SpanType{ std::span<const Contained>(small).subspan(range.start, range.size) };
  }
  [[nodiscard]] constexpr auto operator[](KeyType span) const noexcept { return view(span); }

  constexpr void push_back(auto &&param) noexcept { insert(param); }
  constexpr size_type emplace_back(auto &&...param) noexcept { return insert(Contained{ param... }); }

  constexpr void resize(SizeType new_size) noexcept
  {
    small_size_used = std::min(new_size, SmallSize);
    if (new_size > SmallSize) { error_state = true; }
  }

  constexpr size_type insert(Contained obj) noexcept
  {
    if (small_size_used < small_capacity) {
      small[small_size_used] = std::move(obj);
      return small_size_used++;
    } else {
      error_state = true;
      return small_size_used;
    }
  }


  constexpr KeyType insert_or_find(SpanType values) noexcept
  {
    if (const auto small_found = std::search(begin(), end(), values.begin(), values.end()); small_found != end()) {
      return KeyType{ static_cast<size_type>(std::distance(begin(), small_found)),
        static_cast<size_type>(values.size()) };
    } else {
      return insert(values);
    }
  }

  // all or nothing, an empty key when the values do not fit
  constexpr KeyType insert(SpanType values) noexcept
  {
    if (values.size() > static_cast<std::size_t>(small_capacity - small_size_used)) {
      error_state = true;
      return KeyType{};
    }

    size_type last = 0;
    for (const auto &value : values) { last = insert(value); }
    return KeyType{ static_cast<size_type>(last - values.size() + 1), static_cast<size_type>(values.size()) };
  }
};

template<typename T>
concept not_bool_or_ptr = !std::same_as<std::remove_cvref_t<T>, bool> && !std::is_pointer_v<std::remove_cvref_t<T>>;

// clang-format off
template<typename T> concept addable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs + rhs; };
template<typename T> concept multipliable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs *rhs; };
template<typename T> concept dividable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs / rhs; };
template<typename T> concept subtractable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs - rhs; };
template<typename T> concept lt_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs < rhs; };
template<typename T> concept gt_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs > rhs; };
template<typename T> concept lt_eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs <= rhs; };
template<typename T> concept gt_eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs >= rhs; };
template<typename T> concept eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs == rhs; };
template<typename T> concept not_eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs != rhs; };
// clang-format on

enum struct ArithmeticError : std::uint8_t { overflow, division_by_zero };

// integral results are checked, the fold reports a failure instead of overflowing
inline constexpr auto adds = []<addable T>(const T &lhs, const T &rhs) -> std::expected<T, ArithmeticError> {
  if constexpr (std::is_integral_v<T>) {
    constexpr auto max = std::numeric_limits<T>::max();
    constexpr auto min = std::numeric_limits<T>::min();
    if ((rhs > 0 && lhs > max - rhs) || (rhs < 0 && lhs < min - rhs)) {
      return std::unexpected(ArithmeticError::overflow);
    }
  }
  return lhs + rhs;
};

inline constexpr auto subtracts = []<subtractable T>(const T &lhs, const T &rhs) -> std::expected<T, ArithmeticError> {
  if constexpr (std::is_integral_v<T>) {
    constexpr auto max = std::numeric_limits<T>::max();
    constexpr auto min = std::numeric_limits<T>::min();
    if ((rhs < 0 && lhs > max + rhs) || (rhs > 0 && lhs < min + rhs)) {
      return std::unexpected(ArithmeticError::overflow);
    }
  }
  return lhs - rhs;
};

inline constexpr auto multiplies = []<multipliable T>(const T &lhs, const T &rhs) -> std::expected<T, ArithmeticError> {
  if constexpr (std::is_integral_v<T>) {
    constexpr auto max = std::numeric_limits<T>::max();
    constexpr auto min = std::numeric_limits<T>::min();
    const bool overflows = lhs > 0 ? (rhs > 0 ? lhs > max / rhs : rhs < min / lhs)
                                   : (rhs > 0 ? lhs < min / rhs : lhs != 0 && rhs < max / lhs);
    if (overflows) { return std::unexpected(ArithmeticError::overflow); }
  }
  return lhs * rhs;
};

// dividing by zero is not a constant expression even for floating point
inline constexpr auto divides = []<dividable T>(const T &lhs, const T &rhs) -> std::expected<T, ArithmeticError> {
  if constexpr (std::is_arithmetic_v<T>) {
    if (rhs == T{}) { return std::unexpected(ArithmeticError::division_by_zero); }
  }
  if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    if (lhs == std::numeric_limits<T>::min() && rhs == T{ -1 }) { return std::unexpected(ArithmeticError::overflow); }
  }
  return lhs / rhs;
};
inline constexpr auto less_than = []<lt_comparable T>(const T &lhs, const T &rhs) { return lhs < rhs; };
inline constexpr auto greater_than = []<gt_comparable T>(const T &lhs, const T &rhs) { return lhs > rhs; };
inline constexpr auto lt_equal = []<lt_eq_comparable T>(const T &lhs, const T &rhs) { return lhs <= rhs; };
inline constexpr auto gt_equal = []<gt_eq_comparable T>(const T &lhs, const T &rhs) { return lhs >= rhs; };
inline constexpr auto equal = []<eq_comparable T>(const T &lhs, const T &rhs) -> bool { return lhs == rhs; };
inline constexpr auto not_equal = []<not_eq_comparable T>(const T &lhs, const T &rhs) -> bool { return lhs != rhs; };
inline constexpr bool logical_not(bool lhs) { return !lhs; }

template<typename CharType> struct Token
{
  using char_type = CharType;
  using string_view_type = std::basic_string_view<char_type>;
  string_view_type parsed;
  string_view_type remaining;
};

template<typename CharType>
Token(std::basic_string_view<CharType>, std::basic_string_view<CharType>) -> Token<CharType>;

template<typename T, typename CharType>
[[nodiscard]] constexpr std::pair<bool, T> parse_number(std::basic_string_view<CharType> input) noexcept
{
  constexpr std::pair<bool, T> failure{ false, 0 };
  if (input == chars<CharType>::str("-")) { return failure; }

  enum struct State : std::uint8_t {
    Start,
    IntegerPart,
    FractionPart,
    ExponentPart,
    ExponentStart,
  };

  // floating point literals accumulate in T, so long digit strings only lose precision
  using accumulator = std::conditional_t<std::is_integral_v<T>, long long, T>;

  State state = State::Start;
  T value_sign = 1;
  accumulator value{};
  accumulator frac{};
  bool overflowed = false;
  long long frac_exp = 0LL;
  long long exp_sign = 1LL;
  long long exp = 0LL;

  constexpr auto pow_10 = [](long long power) noexcept {
    auto result = T{ 1 };
    if (power > 0) {
      for (int iteration = 0; iteration < power; ++iteration) { result *= T{ 10 }; }
    } else if (power < 0) {
      for (int iteration = 0; iteration > power; --iteration) { result /= T{ 10 }; }
    }
    return result;
  };

  const auto parse_digit = [&overflowed](auto &cur_value, auto ch) {
    if (ch >= chars<CharType>::ch('0') && ch <= chars<CharType>::ch('9')) {
      const auto digit = static_cast<int>(ch - chars<CharType>::ch('0'));
      if constexpr (std::is_integral_v<std::remove_cvref_t<decltype(cur_value)>>) {
        if (cur_value > (std::numeric_limits<long long>::max() - digit) / 10) {
          overflowed = true;
          return true;
        }
      }
      cur_value = cur_value * 10 + digit;
      return true;
    } else {
      return false;
    }
  };

  for (const auto ch : input) {
    switch (state) {
    case State::Start:
      if (ch == chars<CharType>::ch('-')) {
        value_sign = -1;
      } else if (!parse_digit(value, ch)) {
        return failure;
      }
      state = State::IntegerPart;
      break;
    case State::IntegerPart:
      if (ch == chars<CharType>::ch('.')) {
        state = State::FractionPart;
      } else if (ch == chars<CharType>::ch('e') || ch == chars<CharType>::ch('E')) {
        state = State::ExponentPart;
      } else if (!parse_digit(value, ch)) {
        return failure;
      }
      break;
    case State::FractionPart:
      if (parse_digit(frac, ch)) {
        frac_exp--;
      } else if (ch == chars<CharType>::ch('e') || ch == chars<CharType>::ch('E')) {
        state = State::ExponentStart;
      } else {
        return failure;
      }
      break;
    case State::ExponentStart:
      if (ch == chars<CharType>::ch('-')) {
        exp_sign = -1;
      } else if (!parse_digit(exp, ch)) {
        return failure;
      }
      state = State::ExponentPart;
      break;
    case State::ExponentPart:
      if (!parse_digit(exp, ch)) { return failure; }
    }
  }

  if constexpr (std::is_integral_v<T>) {
    if (state != State::IntegerPart) { return failure; }
    // out of range integers are read as floating point instead
    if (overflowed || value > static_cast<long long>(std::numeric_limits<T>::max())) { return failure; }
    return { true, value_sign * static_cast<T>(value) };
  } else {
    if (state == State::Start || state == State::ExponentStart || overflowed) { return { false, 0 }; }

    return { true,
      (static_cast<T>(value_sign) * (static_cast<T>(value) + static_cast<T>(frac) * pow_10(frac_exp))
        * pow_10(exp_sign * exp)) };
  }
}


template<typename CharType> [[nodiscard]] constexpr Token<CharType> next_token(std::basic_string_view<CharType> input)
{
  using chars = quasi::chars<CharType>;

  constexpr auto is_eol = [](auto ch) { return ch == chars::ch('\n') || ch == chars::ch('\r'); };
  constexpr auto is_whitespace = [=](auto ch) { return ch == chars::ch(' ') || ch == chars::ch('\t') || is_eol(ch); };

  constexpr auto consume = [=](auto ws_input, auto predicate) {
    auto begin = ws_input.begin();
    while (begin != ws_input.end() && predicate(*begin)) { ++begin; }
    return std::basic_string_view<CharType>{ begin, ws_input.end() };
  };

  constexpr auto make_token = [=](std::basic_string_view<CharType> token_input, std::size_t size) {
    return Token{ token_input.substr(0, size), consume(token_input.substr(size), is_whitespace) };
  };

  input = consume(input, is_whitespace);

  // comments
  while (input.starts_with(chars::ch(';'))) {
    input = consume(input, [=](auto ch) { return not is_eol(ch); });
    input = consume(input, is_whitespace);
  }

  // call
  if (input.starts_with(chars::ch('(')) || input.starts_with(chars::ch(')'))) { return make_token(input, 1); }

  // escape markers, longest first
  if (input.starts_with(chars::str("!!!"))) { return make_token(input, 3); }
  if (input.starts_with(chars::str("!!"))) { return make_token(input, 2); }

  // quoted string
  if (input.starts_with(chars::ch('"'))) {
    bool in_escape = false;
    auto location = std::next(input.begin());
    while (location != input.end()) {
      if (*location == chars::ch('\\')) {
        in_escape = true;
      } else if (*location == chars::ch('"') && !in_escape) {
        ++location;
        break;
      } else {
        in_escape = false;
      }
      ++location;
    }

    return make_token(input, static_cast<std::size_t>(std::distance(input.begin(), location)));
  }

  // everything else
  const auto value =
    consume(input, [=](auto ch) { return !is_whitespace(ch) && ch != chars::ch(')') && ch != chars::ch('('); });

  return make_token(input, static_cast<std::size_t>(std::distance(input.begin(), value.begin())));
}

template<std::unsigned_integral SizeType> struct IndexedString
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedString &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
};

template<std::unsigned_integral SizeType> struct IndexedList
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedList &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
  [[nodiscard]] constexpr auto front() const noexcept { return start; }
  [[nodiscard]] constexpr size_type operator[](size_type index) const noexcept { return start + index; }
  [[nodiscard]] constexpr auto sublist(const size_type from) const noexcept
  {
    return IndexedList{ static_cast<size_type>(start + from), static_cast<size_type>(size - from) };
  }
};


template<std::unsigned_integral SizeType> struct Symbol
{
  using size_type = SizeType;
  IndexedString<size_type> name;
  [[nodiscard]] constexpr bool operator==(const Symbol &) const noexcept = default;
};

template<std::unsigned_integral SizeType> Symbol(IndexedString<SizeType>) -> Symbol<SizeType>;

// head and operands are indices into the values arena, args into the arguments arena
template<std::unsigned_integral SizeType> struct Call
{
  using size_type = SizeType;
  size_type head{ 0 };
  IndexedList<size_type> args;
  [[nodiscard]] constexpr bool operator==(const Call &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct Unquote
{
  using size_type = SizeType;
  size_type operand{ 0 };
  [[nodiscard]] constexpr bool operator==(const Unquote &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct UnquoteSplice
{
  using size_type = SizeType;
  size_type operand{ 0 };
  [[nodiscard]] constexpr bool operator==(const UnquoteSplice &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct Define
{
  using size_type = SizeType;
  size_type name{ 0 };
  size_type value{ 0 };
  [[nodiscard]] constexpr bool operator==(const Define &) const noexcept = default;
};

// ordered, optionally named, sequence of values
template<std::unsigned_integral SizeType> struct List
{
  using size_type = SizeType;
  IndexedList<size_type> items;
  [[nodiscard]] constexpr bool operator==(const List &) const noexcept = default;
};

template<std::unsigned_integral SizeType> List(IndexedList<SizeType>) -> List<SizeType>;

template<std::unsigned_integral SizeType> struct Environment
{
  using size_type = SizeType;
  size_type index{ 0 };
  [[nodiscard]] constexpr bool operator==(const Environment &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct Scope
{
  using size_type = SizeType;
  size_type parent{ 0 };
  bool has_parent{ false };
};

template<std::unsigned_integral SizeType> struct QuotedClosure
{
  using size_type = SizeType;
  size_type expr{ 0 };
  Environment<size_type> env;
  [[nodiscard]] constexpr bool operator==(const QuotedClosure &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct Closure
{
  using size_type = SizeType;
  // value of each parameter is its default, or MissingArgument
  IndexedList<size_type> parameters;
  IndexedList<size_type> body;
  Environment<size_type> env;
  [[nodiscard]] constexpr bool operator==(const Closure &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct PromiseRef
{
  using size_type = SizeType;
  size_type index{ 0 };
  [[nodiscard]] constexpr bool operator==(const PromiseRef &) const noexcept = default;
};

struct MissingArgument
{
  [[nodiscard]] constexpr bool operator==(const MissingArgument &) const noexcept = default;
};

enum struct PromiseState : std::uint8_t { unforced, forcing, forced, failed };

enum struct ErrorKind : std::uint8_t {
  unbound_symbol,
  missing_argument,
  recursive_promise,
  splice_context,
  define_name,
  syntax,
  type_mismatch,
  invalid_call,
  arithmetic,
  capacity
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) noexcept
{
  switch (kind) {
  case ErrorKind::unbound_symbol:
    return "unbound symbol";
  case ErrorKind::missing_argument:
    return "missing argument";
  case ErrorKind::recursive_promise:
    return "recursive promise";
  case ErrorKind::splice_context:
    return "splice context";
  case ErrorKind::define_name:
    return "define name";
  case ErrorKind::syntax:
    return "syntax";
  case ErrorKind::type_mismatch:
    return "type mismatch";
  case ErrorKind::invalid_call:
    return "invalid call";
  case ErrorKind::arithmetic:
    return "arithmetic";
  case ErrorKind::capacity:
    return "capacity";
  }
  return "unknown";
}

template<std::unsigned_integral SizeType> struct Error
{
  using size_type = SizeType;
  ErrorKind kind{ ErrorKind::syntax };
  IndexedString<size_type> description;
  IndexedList<size_type> context;
  [[nodiscard]] constexpr bool operator==(const Error &) const noexcept = default;
};


template<std::unsigned_integral SizeType = std::uint16_t,
  typename CharType = char,
  std::signed_integral IntegralType = int,
  std::floating_point FloatType = double,
  SizeType BuiltInStringsSize = 2048,
  SizeType BuiltInValuesSize = 768,
  SizeType BuiltInArgumentsSize = 768,
  SizeType BuiltInBindingsSize = 192,
  SizeType BuiltInPromisesSize = 160,
  SizeType BuiltInEnvironmentsSize = 96,
  typename... UserTypes>
struct quasi_expr
{
  using char_type = CharType;
  using size_type = SizeType;
  using int_type = IntegralType;
  using float_type = FloatType;
  using string_type = IndexedString<size_type>;
  using string_view_type = std::basic_string_view<char_type>;
  using range_type = IndexedList<size_type>;
  using symbol_type = Symbol<size_type>;
  using call_type = Call<size_type>;
  using unquote_type = Unquote<size_type>;
  using splice_type = UnquoteSplice<size_type>;
  using define_type = Define<size_type>;
  using list_type = List<size_type>;
  using environment_type = Environment<size_type>;
  using quosure_type = QuotedClosure<size_type>;
  using closure_type = Closure<size_type>;
  using promise_ref_type = PromiseRef<size_type>;
  using error_type = Error<size_type>;

  struct SExpr;
  struct FunctionPtr;

  template<std::size_t Size>
  [[nodiscard]] static consteval auto str(char const (&input)[Size]) noexcept// NOLINT(modernize-avoid-c-arrays)
  {
    return chars<char_type>::str(input);
  }

  template<typename Type>
  [[nodiscard]] static constexpr bool visit_helper(SExpr &result, auto Func, auto &variant) noexcept
  {
    if (auto *value = std::get_if<Type>(&variant); value != nullptr) {
      result = Func(*value);
      return true;
    }
    return false;
  }

  template<typename... Type> static constexpr SExpr visit(auto visitor, const std::variant<Type...> &value) noexcept
  {
    SExpr result{};
    // || will make this short circuit and stop on first matching function
    ((visit_helper<Type>(result, visitor, value) || ...));
    return result;
  }

  using function_ptr = SExpr (*)(quasi_expr &, environment_type, range_type);
  using Atom = std::variant<std::monostate, bool, int_type, float_type, string_type, UserTypes...>;

  struct FunctionPtr
  {
    function_ptr ptr{ nullptr };
    string_type name;

    [[nodiscard]] constexpr bool operator==(const FunctionPtr &other) const
    {
      // comparing function pointers is unreliable during constant evaluation,
      // builtins are unique by their registered name
      if consteval {
        return name == other.name;
      } else {
        return ptr == other.ptr;
      }
    }
  };

  template<typename T>
  inline static constexpr bool is_sexpr_type_v =
    std::is_same_v<T, Atom> || std::is_same_v<T, symbol_type> || std::is_same_v<T, call_type>
    || std::is_same_v<T, unquote_type> || std::is_same_v<T, splice_type> || std::is_same_v<T, define_type>
    || std::is_same_v<T, list_type> || std::is_same_v<T, closure_type> || std::is_same_v<T, quosure_type>
    || std::is_same_v<T, FunctionPtr> || std::is_same_v<T, environment_type> || std::is_same_v<T, promise_ref_type>
    || std::is_same_v<T, MissingArgument> || std::is_same_v<T, error_type>;


  struct SExpr
  {
    std::variant<Atom,
      symbol_type,
      call_type,
      unquote_type,
      splice_type,
      define_type,
      list_type,
      closure_type,
      quosure_type,
      FunctionPtr,
      environment_type,
      promise_ref_type,
      MissingArgument,
      error_type>
      value;

    [[nodiscard]] constexpr bool operator==(const SExpr &) const noexcept = default;
  };

  static_assert(std::is_trivially_copyable_v<SExpr> && std::is_trivially_destructible_v<SExpr>,
    "quasi_expr does not work with non-trivial types");

  // an empty name means the argument is positional
  struct Argument
  {
    string_type name;
    SExpr value;

    [[nodiscard]] constexpr bool has_name() const noexcept { return !name.empty(); }
    [[nodiscard]] constexpr bool operator==(const Argument &) const noexcept = default;
  };

  struct Binding
  {
    size_type env{ 0 };
    string_type name;
    SExpr value;
  };

  struct Promise
  {
    SExpr expr;
    environment_type env;
    PromiseState state{ PromiseState::unforced };
    SExpr value;
  };

  template<typename Result> [[nodiscard]] constexpr const Result *get_if(const SExpr *sexpr) const noexcept
  {
    if (sexpr == nullptr) { return nullptr; }

    if constexpr (is_sexpr_type_v<Result>) {
      return std::get_if<Result>(&sexpr->value);
    } else {
      if (const auto *atom = std::get_if<Atom>(&sexpr->value)) {
        return std::get_if<Result>(atom);
      } else {
        return nullptr;
      }
    }
  }

  [[nodiscard]] static constexpr bool is_error(const SExpr &expr) noexcept
  {
    return std::holds_alternative<error_type>(expr.value);
  }

  [[nodiscard]] static constexpr bool is_null(const SExpr &expr) noexcept
  {
    const auto *atom = std::get_if<Atom>(&expr.value);
    return atom != nullptr && std::holds_alternative<std::monostate>(*atom);
  }

  [[nodiscard]] static constexpr bool is_marker(const SExpr &expr) noexcept
  {
    return std::holds_alternative<unquote_type>(expr.value) || std::holds_alternative<splice_type>(expr.value)
           || std::holds_alternative<define_type>(expr.value);
  }

  SmallVector<size_type, char_type, BuiltInStringsSize, string_type, string_view_type> strings{};
  // every interned string, so equal text always has the same handle
  SmallVector<size_type, string_type, BuiltInStringsSize, range_type> names{};
  SmallVector<size_type, SExpr, BuiltInValuesSize, range_type> values{};
  SmallVector<size_type, Argument, BuiltInArgumentsSize, range_type> arguments{};
  SmallVector<size_type, Scope<size_type>, BuiltInEnvironmentsSize, range_type> environments{};
  SmallVector<size_type, Binding, BuiltInBindingsSize, range_type> bindings{};
  SmallVector<size_type, Promise, BuiltInPromisesSize, range_type> promises{};

  SmallVector<size_type, Argument, 128, range_type> argument_scratch{};
  SmallVector<size_type, char_type, 256, string_type, string_view_type> char_scratch{};

  environment_type global_env{};
  string_type dots_name{};

  template<typename ScratchTo> struct Scratch
  {
    constexpr explicit Scratch(ScratchTo &t_data) noexcept : data(&t_data) {}
    Scratch(const Scratch &) = delete;
    constexpr Scratch(Scratch &&other) noexcept
      : data{ std::exchange(other.data, nullptr) }, initial_size{ other.initial_size },
        current_size{ other.current_size }
    {}
    auto &operator=(Scratch &&) = delete;
    auto &operator=(const Scratch &&) = delete;
    constexpr ~Scratch() noexcept
    {
      if (data != nullptr) { data->resize(initial_size); }
    }
    [[nodiscard]] constexpr auto begin() const noexcept { return std::next(data->begin(), initial_size); }
    [[nodiscard]] constexpr auto end() const noexcept { return std::next(data->begin(), current_size); }
    [[nodiscard]] constexpr size_type size() const noexcept
    {
      return static_cast<size_type>(current_size - initial_size);
    }
    constexpr void emplace_back(auto &&...param) noexcept
    {
      assert(data->size() == current_size);
      data->emplace_back(param...);
      current_size = data->size();
    }
    constexpr void push_back(auto obj) noexcept
    {
      assert(data->size() == current_size);
      data->push_back(obj);
      current_size = data->size();
    }

  private:
    ScratchTo *data;
    size_type initial_size = data->size();
    size_type current_size = data->size();
  };

  //
  // expression model
  //
  // an empty handle when the strings arena is full
  [[nodiscard]] constexpr string_type intern(string_view_type name)
  {
    if (name.empty()) { return string_type{}; }

    for (const auto &known : names) {
      if (view(known) == name) { return known; }
    }

    if (names.size() == names.small_capacity) {
      names.error_state = true;
      return string_type{};
    }

    const auto result = strings.insert(name);
    if (!result.empty()) { names.push_back(result); }
    return result;
  }

  [[nodiscard]] constexpr string_view_type view(string_type name) const noexcept { return strings.view(name); }

  // values[0] is reserved for this error, so a full arena stores a reference to it
  [[nodiscard]] constexpr SExpr capacity_error() const noexcept { return values[0]; }

  [[nodiscard]] constexpr size_type store(const SExpr &expr)
  {
    const auto stored = values.insert_or_find(std::array<SExpr, 1>{ expr });
    return stored.empty() ? size_type{ 0 } : stored.start;
  }

  [[nodiscard]] constexpr std::expected<range_type, SExpr> store_arguments(std::span<const Argument> args)
  {
    const auto stored = arguments.insert_or_find(args);
    if (stored.size != args.size()) { return std::unexpected(capacity_error()); }
    return stored;
  }

  [[nodiscard]] constexpr SExpr make_symbol(string_view_type name)
  {
    const auto id = intern(name);
    if (id.empty() && !name.empty()) { return capacity_error(); }
    return SExpr{ symbol_type{ id } };
  }

  [[nodiscard]] constexpr SExpr make_string(string_view_type text)
  {
    const auto string = intern(text);
    if (string.empty() && !text.empty()) { return capacity_error(); }
    return SExpr{ Atom{ string } };
  }

  [[nodiscard]] constexpr Argument make_argument(string_view_type name, const SExpr &value)
  {
    return Argument{ intern(name), value };
  }

  [[nodiscard]] static constexpr Argument make_argument(const SExpr &value) { return Argument{ {}, value }; }

  [[nodiscard]] constexpr SExpr make_call(const SExpr &head, std::span<const Argument> args)
  {
    const auto stored = store_arguments(args);
    if (!stored) { return stored.error(); }
    return SExpr{ call_type{ store(head), *stored } };
  }

  [[nodiscard]] constexpr SExpr make_unquote(const SExpr &operand) { return SExpr{ unquote_type{ store(operand) } }; }

  [[nodiscard]] constexpr SExpr make_unquote_splice(const SExpr &operand)
  {
    return SExpr{ splice_type{ store(operand) } };
  }

  [[nodiscard]] constexpr SExpr make_define(const SExpr &name, const SExpr &value)
  {
    return SExpr{ define_type{ store(name), store(value) } };
  }

  [[nodiscard]] constexpr SExpr make_list(std::span<const Argument> items)
  {
    const auto stored = store_arguments(items);
    if (!stored) { return stored.error(); }
    return SExpr{ list_type{ *stored } };
  }

  [[nodiscard]] constexpr SExpr make_quosure(const SExpr &expr, environment_type env)
  {
    return SExpr{ quosure_type{ store(expr), env } };
  }

  [[nodiscard]] constexpr bool equal_atoms(const Atom &lhs, const Atom &rhs) const noexcept
  {
    const auto *lhs_string = std::get_if<string_type>(&lhs);
    const auto *rhs_string = std::get_if<string_type>(&rhs);
    if (lhs_string != nullptr && rhs_string != nullptr) { return view(*lhs_string) == view(*rhs_string); }
    return lhs == rhs;
  }

  // structural equality, independent of where in the arenas either tree lives
  [[nodiscard]] constexpr bool equivalent(const SExpr &lhs, const SExpr &rhs) const
  {
    if (lhs.value.index() != rhs.value.index()) { return false; }

    if (const auto *atom = get_if<Atom>(&lhs); atom != nullptr) {
      return equal_atoms(*atom, *get_if<Atom>(&rhs));
    } else if (const auto *symbol = get_if<symbol_type>(&lhs); symbol != nullptr) {
      return view(symbol->name) == view(get_if<symbol_type>(&rhs)->name);
    } else if (const auto *call = get_if<call_type>(&lhs); call != nullptr) {
      const auto *other = get_if<call_type>(&rhs);
      return equivalent(values[call->head], values[other->head]) && equivalent(call->args, other->args);
    } else if (const auto *unquote = get_if<unquote_type>(&lhs); unquote != nullptr) {
      return equivalent(values[unquote->operand], values[get_if<unquote_type>(&rhs)->operand]);
    } else if (const auto *splice = get_if<splice_type>(&lhs); splice != nullptr) {
      return equivalent(values[splice->operand], values[get_if<splice_type>(&rhs)->operand]);
    } else if (const auto *define = get_if<define_type>(&lhs); define != nullptr) {
      const auto *other = get_if<define_type>(&rhs);
      return equivalent(values[define->name], values[other->name])
             && equivalent(values[define->value], values[other->value]);
    } else if (const auto *list = get_if<list_type>(&lhs); list != nullptr) {
      return equivalent(list->items, get_if<list_type>(&rhs)->items);
    } else if (const auto *quosure = get_if<quosure_type>(&lhs); quosure != nullptr) {
      const auto *other = get_if<quosure_type>(&rhs);
      return quosure->env == other->env && equivalent(values[quosure->expr], values[other->expr]);
    } else if (const auto *error = get_if<error_type>(&lhs); error != nullptr) {
      const auto *other = get_if<error_type>(&rhs);
      return error->kind == other->kind && view(error->description) == view(other->description);
    }

    return lhs == rhs;
  }

  [[nodiscard]] constexpr bool equivalent(range_type lhs, range_type rhs) const
  {
    if (lhs.size != rhs.size) { return false; }
    for (size_type index = 0; index < lhs.size; ++index) {
      const auto &left = arguments[lhs[index]];
      const auto &right = arguments[rhs[index]];
      if (view(left.name) != view(right.name) || !equivalent(left.value, right.value)) { return false; }
    }
    return true;
  }

  // depth-first, pre-order
  constexpr void walk(const SExpr &expr, auto &&visitor) const
  {
    visitor(expr);

    if (const auto *call = get_if<call_type>(&expr); call != nullptr) {
      walk(values[call->head], visitor);
      for (const auto &arg : arguments[call->args]) { walk(arg.value, visitor); }
    } else if (const auto *unquote = get_if<unquote_type>(&expr); unquote != nullptr) {
      walk(values[unquote->operand], visitor);
    } else if (const auto *splice = get_if<splice_type>(&expr); splice != nullptr) {
      walk(values[splice->operand], visitor);
    } else if (const auto *define = get_if<define_type>(&expr); define != nullptr) {
      walk(values[define->name], visitor);
      walk(values[define->value], visitor);
    } else if (const auto *list = get_if<list_type>(&expr); list != nullptr) {
      for (const auto &item : arguments[list->items]) { walk(item.value, visitor); }
    }
  }

  [[nodiscard]] constexpr bool has_markers(const SExpr &expr) const
  {
    bool found = false;
    walk(expr, [&found](const SExpr &node) { found = found || is_marker(node); });
    return found;
  }

  [[nodiscard]] constexpr SExpr make_error(ErrorKind kind, string_view_type description, range_type context)
  {
    return SExpr{ error_type{ kind, intern(description), context } };
  }

  [[nodiscard]] constexpr SExpr make_error(ErrorKind kind, string_view_type description, auto... value)
  {
    return make_error(kind, description, values.insert_or_find(std::array<SExpr, sizeof...(value)>{ SExpr{ value }... }));
  }

  // errors pass through untouched, anything else is reported as the wrong type
  [[nodiscard]] constexpr SExpr expected_error(string_view_type expected, const SExpr &got)
  {
    if (is_error(got)) { return got; }
    return make_error(ErrorKind::type_mismatch, expected, got);
  }

  //
  // environments
  //
  [[nodiscard]] constexpr std::expected<environment_type, SExpr> extend(environment_type parent,
    std::span<const Argument> initial = {})
  {
    if (environments.size() == environments.small_capacity) {
      environments.error_state = true;
      return std::unexpected(capacity_error());
    }

    const environment_type env{ environments.insert(Scope<size_type>{ parent.index, true }) };
    for (const auto &binding : initial) {
      if (const auto defined = define(env, binding.name, binding.value); !defined) {
        return std::unexpected(defined.error());
      }
    }
    return env;
  }

  // an error value is reported instead of bound
  [[nodiscard]] constexpr std::expected<void, SExpr> define(environment_type env, string_type name, const SExpr &value)
  {
    if (is_error(value)) { return std::unexpected(value); }
    if (bindings.size() == bindings.small_capacity) {
      bindings.error_state = true;
      return std::unexpected(capacity_error());
    }

    bindings.emplace_back(env.index, name, value);
    return {};
  }

  [[nodiscard]] constexpr const Binding *find_local(environment_type env, string_type name) const noexcept
  {
    for (const auto &binding : bindings | std::views::reverse) {
      if (binding.env == env.index && binding.name == name) { return &binding; }
    }
    return nullptr;
  }

  [[nodiscard]] constexpr const Binding *find(environment_type env, string_type name) const noexcept
  {
    auto current = env;
    while (true) {
      if (const auto *binding = find_local(current, name); binding != nullptr) { return binding; }
      const auto &scope = environments[current.index];
      if (!scope.has_parent) { return nullptr; }
      current = environment_type{ scope.parent };
    }
  }

  // the raw binding, promises are not forced
  [[nodiscard]] constexpr SExpr lookup(environment_type env, string_type name)
  {
    if (const auto *binding = find(env, name); binding != nullptr) { return binding->value; }
    return make_error(ErrorKind::unbound_symbol, str("object not found"), symbol_type{ name });
  }

  //
  // promises
  //
  [[nodiscard]] constexpr SExpr make_promise(const SExpr &expr, environment_type env)
  {
    if (promises.size() == promises.small_capacity) {
      promises.error_state = true;
      return capacity_error();
    }
    return SExpr{ promise_ref_type{ promises.insert(Promise{ expr, env, PromiseState::unforced, SExpr{} }) } };
  }

  // forwarded arguments already are promises and are shared, not wrapped again
  [[nodiscard]] constexpr SExpr as_promise(const SExpr &expr, environment_type env)
  {
    if (std::holds_alternative<promise_ref_type>(expr.value)) { return expr; }
    return make_promise(expr, env);
  }

  [[nodiscard]] constexpr SExpr force(promise_ref_type ref)
  {
    auto &promise = promises[ref.index];

    switch (promise.state) {
    case PromiseState::forced:
    case PromiseState::failed:
      return promise.value;
    case PromiseState::forcing:
      return make_error(ErrorKind::recursive_promise, str("promise already under evaluation"), promise.expr);
    case PromiseState::unforced:
      break;
    }

    promise.state = PromiseState::forcing;
    const auto result = eval(promise.env, promise.expr);
    promise.value = result;
    promise.state = is_error(result) ? PromiseState::failed : PromiseState::forced;
    return result;
  }

  //
  // capture
  //
  struct Captured
  {
    SExpr expr;
    environment_type env;
  };

  [[nodiscard]] constexpr std::expected<Captured, SExpr> captured(environment_type frame, string_type name)
  {
    const auto *binding = find_local(frame, name);
    if (binding == nullptr) {
      return std::unexpected(
        make_error(ErrorKind::missing_argument, str("not an argument of this call frame"), symbol_type{ name }));
    }

    if (const auto *ref = get_if<promise_ref_type>(&binding->value); ref != nullptr) {
      const auto &promise = promises[ref->index];
      return Captured{ promise.expr, promise.env };
    } else if (get_if<MissingArgument>(&binding->value) != nullptr) {
      return std::unexpected(
        make_error(ErrorKind::missing_argument, str("argument was not supplied"), symbol_type{ name }));
    }

    // a plain value, for instance from a frame built with env()
    return Captured{ binding->value, frame };
  }

  [[nodiscard]] constexpr std::expected<range_type, SExpr> dots_of(environment_type frame)
  {
    const auto *binding = find_local(frame, dots_name);
    if (binding == nullptr) {
      return std::unexpected(make_error(ErrorKind::missing_argument, str("call frame has no `...`"), frame));
    }

    const auto *items = get_if<list_type>(&binding->value);
    if (items == nullptr) {
      return std::unexpected(
        make_error(ErrorKind::invalid_call, str("`...` is not bound to the arguments of a call"), binding->value));
    }
    return items->items;
  }

  [[nodiscard]] constexpr SExpr capture_one(environment_type frame, string_view_type name)
  {
    const auto result = captured(frame, intern(name));
    if (!result) { return result.error(); }
    return result->expr;
  }

  [[nodiscard]] constexpr SExpr capture_scoped(environment_type frame, string_view_type name)
  {
    const auto result = captured(frame, intern(name));
    if (!result) { return result.error(); }
    return make_quosure(result->expr, result->env);
  }

  [[nodiscard]] constexpr SExpr capture_all(environment_type frame)
  {
    const auto items = dots_of(frame);
    if (!items) { return items.error(); }

    Scratch result{ argument_scratch };
    for (const auto &item : arguments[*items]) {
      if (const auto *ref = get_if<promise_ref_type>(&item.value); ref != nullptr) {
        result.push_back(Argument{ item.name, promises[ref->index].expr });
      } else {
        result.push_back(item);
      }
    }
    return make_list(result);
  }

  //
  // quasiquotation
  //
  [[nodiscard]] constexpr std::expected<string_type, SExpr> define_name(environment_type env, const SExpr &operand)
  {
    // (:= !!name value) and (:= name value) mean the same
    const auto *unquote = get_if<unquote_type>(&operand);
    const auto name = eval(env, unquote == nullptr ? operand : values[unquote->operand]);
    if (is_error(name)) { return std::unexpected(name); }

    if (const auto *string = get_if<string_type>(&name); string != nullptr && !string->empty()) {
      return *string;
    } else if (const auto *symbol = get_if<symbol_type>(&name); symbol != nullptr) {
      return symbol->name;
    }

    return std::unexpected(make_error(ErrorKind::define_name, str("name of `:=` must be a non-empty string"), name));
  }

  // one level only, nested lists stay whole
  template<typename Out> [[nodiscard]] constexpr std::expected<void, SExpr> splice_into(const SExpr &value, Out &result)
  {
    if (const auto *list = get_if<list_type>(&value); list != nullptr) {
      for (const auto &item : arguments[list->items]) { result.push_back(item); }
    } else if (get_if<Atom>(&value) != nullptr) {
      if (!is_null(value)) { result.push_back(make_argument(value)); }
    } else {
      return std::unexpected(expected_error(str("`!!!` operand to evaluate to a list"), value));
    }
    return {};
  }

  template<typename Out>
  [[nodiscard]] constexpr std::expected<void, SExpr>
    resolve_argument(environment_type env, const Argument &arg, Out &result)
  {
    if (const auto *splice = get_if<splice_type>(&arg.value); splice != nullptr) {
      if (arg.has_name()) {
        return std::unexpected(
          make_error(ErrorKind::splice_context, str("`!!!` can not be given an argument name"), arg.value));
      }
      const auto spliced = eval(env, values[splice->operand]);
      if (is_error(spliced)) { return std::unexpected(spliced); }
      return splice_into(spliced, result);
    } else if (const auto *define = get_if<define_type>(&arg.value); define != nullptr) {
      if (arg.has_name()) {
        return std::unexpected(make_error(ErrorKind::syntax, str("`:=` can not be given an argument name"), arg.value));
      }
      const auto name = define_name(env, values[define->name]);
      if (!name) { return std::unexpected(name.error()); }
      const auto value = resolve(env, values[define->value]);
      if (is_error(value)) { return std::unexpected(value); }
      result.push_back(Argument{ *name, value });
    } else {
      const auto value = resolve(env, arg.value);
      if (is_error(value)) { return std::unexpected(value); }
      result.push_back(Argument{ arg.name, value });
    }
    return {};
  }

  [[nodiscard]] constexpr std::expected<range_type, SExpr> resolve_arguments(environment_type env, range_type args)
  {
    Scratch result{ argument_scratch };
    for (const auto &arg : arguments[args]) {
      if (const auto resolved = resolve_argument(env, arg, result); !resolved) {
        return std::unexpected(resolved.error());
      }
    }
    return store_arguments(result);
  }

  // every marker operand is evaluated in `env`, everything else stays quoted
  [[nodiscard]] constexpr SExpr resolve(environment_type env, const SExpr &expr)
  {
    if (const auto *unquote = get_if<unquote_type>(&expr); unquote != nullptr) {
      return eval(env, values[unquote->operand]);
    } else if (const auto *splice = get_if<splice_type>(&expr); splice != nullptr) {
      return eval(env, values[splice->operand]);
    } else if (get_if<define_type>(&expr) != nullptr) {
      return make_error(ErrorKind::syntax, str("`:=` can only be used as an argument"), expr);
    } else if (const auto *call = get_if<call_type>(&expr); call != nullptr) {
      if (!has_markers(expr)) { return expr; }

      const auto &head = values[call->head];
      if (get_if<splice_type>(&head) != nullptr) {
        return make_error(ErrorKind::splice_context, str("`!!!` can not be used as a call head"), head);
      } else if (get_if<define_type>(&head) != nullptr) {
        return make_error(ErrorKind::syntax, str("`:=` can not be used as a call head"), head);
      }

      const auto new_head = resolve(env, head);
      if (is_error(new_head)) { return new_head; }

      const auto new_args = resolve_arguments(env, call->args);
      if (!new_args) { return new_args.error(); }

      return SExpr{ call_type{ store(new_head), *new_args } };
    } else if (const auto *list = get_if<list_type>(&expr); list != nullptr) {
      // the reader makes lists of forms like (a: !!x), their items are resolved as arguments
      if (!has_markers(expr)) { return expr; }

      const auto new_items = resolve_arguments(env, list->items);
      if (!new_items) { return new_items.error(); }
      return SExpr{ list_type{ *new_items } };
    }

    return expr;
  }

  // the items of the `...` of `frame`, each resolved where its caller wrote it
  template<typename Out>
  [[nodiscard]] constexpr std::expected<void, SExpr> resolve_dots(environment_type frame, Out &result)
  {
    const auto items = dots_of(frame);
    if (!items) { return std::unexpected(items.error()); }

    for (const auto &item : arguments[*items]) {
      if (const auto *ref = get_if<promise_ref_type>(&item.value); ref != nullptr) {
        const auto promise = promises[ref->index];
        if (const auto resolved = resolve_argument(promise.env, Argument{ item.name, promise.expr }, result);
            !resolved) {
          return std::unexpected(resolved.error());
        }
      } else {
        result.push_back(item);
      }
    }
    return {};
  }

  //
  // tidy evaluation
  //
  [[nodiscard]] constexpr std::expected<environment_type, SExpr> make_data_mask(environment_type parent,
    const SExpr &mask)
  {
    if (const auto *list = get_if<list_type>(&mask); list != nullptr) {
      for (const auto &item : arguments[list->items]) {
        if (!item.has_name()) {
          return std::unexpected(make_error(ErrorKind::type_mismatch, str("data mask items must be named"), mask));
        }
      }
      return extend(parent, arguments[list->items]);
    } else if (const auto *env = get_if<environment_type>(&mask); env != nullptr) {
      // copied, so the mask's own parent is never consulted
      const auto masked = extend(parent);
      if (!masked) { return masked; }
      const auto count = bindings.size();
      for (size_type index = 0; index < count; ++index) {
        const auto binding = bindings[index];
        if (binding.env != env->index) { continue; }
        if (const auto defined = define(*masked, binding.name, binding.value); !defined) {
          return std::unexpected(defined.error());
        }
      }
      return masked;
    }

    return std::unexpected(expected_error(str("data mask to be a named list or an environment"), mask));
  }

  [[nodiscard]] constexpr SExpr eval_tidy(const SExpr &target, environment_type env, const std::optional<SExpr> &mask)
  {
    auto expr = target;
    auto scope = env;
    if (const auto *quosure = get_if<quosure_type>(&target); quosure != nullptr) {
      expr = values[quosure->expr];
      scope = quosure->env;
    }

    if (mask.has_value() && !is_null(*mask)) {
      const auto masked = make_data_mask(scope, *mask);
      if (!masked) { return masked.error(); }
      scope = *masked;
    }

    const auto promise = make_promise(expr, scope);
    if (is_error(promise)) { return promise; }
    return force(std::get<promise_ref_type>(promise.value));
  }

  [[nodiscard]] constexpr SExpr eval_tidy(const quosure_type &quosure,
    std::optional<environment_type> mask = std::nullopt)
  {
    if (mask.has_value()) { return eval_tidy(SExpr{ quosure }, quosure.env, SExpr{ *mask }); }
    return eval_tidy(SExpr{ quosure }, quosure.env, std::nullopt);
  }

  //
  // reader
  //
  [[nodiscard]] static constexpr bool is_keyword(string_view_type token) noexcept
  {
    return token.size() > 1 && token.ends_with(chars<char_type>::ch(':'))
           && !token.starts_with(chars<char_type>::ch('"'));
  }

  [[nodiscard]] constexpr std::pair<SExpr, Token<CharType>> parse_expression(Token<CharType> token)
  {
    const auto next = [](Token<CharType> current) { return next_token(current.remaining); };

    if (token.parsed.empty()) {
      return { make_error(ErrorKind::syntax, str("unexpected end of input")), token };
    } else if (token.parsed == str("(")) {
      auto [items, closing] = parse_arguments(next(token));
      if (!items) { return { items.error(), closing }; }
      if (closing.parsed != str(")")) {
        return { make_error(ErrorKind::syntax, str("unterminated call")), closing };
      }

      const auto remaining = next(closing);
      if (items->empty()) { return { SExpr{ list_type{} }, remaining }; }

      // a named first element can not be a call head, the form is read as a list
      const auto &head = arguments[items->front()];
      if (head.has_name()) { return { SExpr{ list_type{ *items } }, remaining }; }

      if (const auto *id = get_if<symbol_type>(&head.value); id != nullptr && view(id->name) == str(":=")) {
        if (items->size != 3 || arguments[(*items)[1]].has_name() || arguments[(*items)[2]].has_name()) {
          return { make_error(ErrorKind::syntax, str("(:= name value)")), remaining };
        }
        return { make_define(arguments[(*items)[1]].value, arguments[(*items)[2]].value), remaining };
      }

      return { SExpr{ call_type{ store(head.value), items->sublist(1) } }, remaining };
    } else if (token.parsed == str(")")) {
      return { make_error(ErrorKind::syntax, str("unexpected `)`")), next(token) };
    } else if (token.parsed == str("!!") || token.parsed == str("!!!")) {
      const auto operand_token = next(token);
      if (is_keyword(operand_token.parsed)) {
        return { make_error(ErrorKind::syntax,
                   str("escape markers can not name an argument, use (:= name value)"),
                   SExpr{ Atom{ intern(operand_token.parsed) } }),
          next(operand_token) };
      }
      auto [operand, remaining] = parse_expression(operand_token);
      if (is_error(operand)) { return { operand, remaining }; }
      if (token.parsed == str("!!")) { return { make_unquote(operand), remaining }; }
      return { make_unquote_splice(operand), remaining };
    } else if (is_keyword(token.parsed)) {
      return { make_error(ErrorKind::syntax, str("named argument outside of a call"), SExpr{ Atom{ intern(token.parsed) } }),
        next(token) };
    } else if (token.parsed == str("true")) {
      return { SExpr{ Atom{ true } }, next(token) };
    } else if (token.parsed == str("false")) {
      return { SExpr{ Atom{ false } }, next(token) };
    } else if (token.parsed == str("null")) {
      return { SExpr{ Atom{ std::monostate{} } }, next(token) };
    } else if (token.parsed.starts_with(chars<char_type>::ch('"'))) {
      // note that this doesn't remove escaped characters
      if (token.parsed.size() > 1 && token.parsed.ends_with(chars<char_type>::ch('"'))) {
        return { make_string(token.parsed.substr(1, token.parsed.size() - 2)), next(token) };
      }
      return { make_error(ErrorKind::syntax, str("unterminated string"), SExpr{ Atom{ intern(token.parsed) } }),
        next(token) };
    } else if (auto [int_did_parse, int_value] = parse_number<int_type>(token.parsed); int_did_parse) {
      return { SExpr{ Atom{ int_value } }, next(token) };
    } else if (auto [float_did_parse, float_value] = parse_number<float_type>(token.parsed); float_did_parse) {
      return { SExpr{ Atom{ float_value } }, next(token) };
    }

    return { make_symbol(token.parsed), next(token) };
  }

  // stops at `)` or end of input, which is returned as the token
  [[nodiscard]] constexpr std::pair<std::expected<range_type, SExpr>, Token<CharType>> parse_arguments(
    Token<CharType> token)
  {
    Scratch retval{ argument_scratch };

    while (!token.parsed.empty() && token.parsed != str(")")) {
      string_type name{};
      if (is_keyword(token.parsed)) {
        name = intern(token.parsed.substr(0, token.parsed.size() - 1));
        token = next_token(token.remaining);
        if (token.parsed.empty() || token.parsed == str(")")) {
          return { std::unexpected(make_error(ErrorKind::syntax, str("named argument without a value"))), token };
        }
      }

      auto [parsed, remaining] = parse_expression(token);
      if (is_error(parsed)) { return { std::unexpected(parsed), remaining }; }
      retval.push_back(Argument{ name, parsed });
      token = remaining;
    }

    return { store_arguments(retval), token };
  }

  // a list of every top level expression in input
  [[nodiscard]] constexpr std::pair<SExpr, Token<CharType>> parse(string_view_type input)
  {
    auto [items, token] = parse_arguments(next_token(input));
    if (!items) { return { items.error(), token }; }
    if (!token.parsed.empty()) { return { make_error(ErrorKind::syntax, str("unexpected `)`")), token }; }
    return { SExpr{ list_type{ *items } }, token };
  }

  // Guaranteed to be initialized at compile time
  consteval quasi_expr() noexcept
  {
    values.insert(make_error(ErrorKind::capacity, str("arena exhausted")));
    global_env = environment_type{ environments.insert(Scope<size_type>{}) };
    dots_name = intern(str("..."));

    add(str("quote"), quoter);
    add(str("expr"), quasiquoter);
    add(str("exprs"), multi_quasiquoter);
    add(str("quo"), quosure_quasiquoter);
    add(str("enexpr"), expr_capturer);
    add(str("enexprs"), exprs_capturer);
    add(str("enquo"), quosure_capturer);
    add(str("enquos"), quosures_capturer);
    add(str("eval_tidy"), tidy_evaler);
    add(str("eval"), evaler);
    add(str("call2"), call_builder);
    add(str("sym"), symbol_builder);
    add(str("list"), list);
    add(str("env"), environment_builder);
    add(str("current_env"), current_environment);
    add(str("function"), lambda);
    add(str("lambda"), lambda);
    add(str("define"), definer);
    add(str("if"), ifer);
    add(str("and"), logical_and);
    add(str("or"), logical_or);
    add(str("not"), make_evaluator<logical_not>());
    add(str("+"), binary_left_fold<adds>);
    add(str("*"), binary_left_fold<multiplies>);
    add(str("-"), binary_left_fold<subtracts>);
    add(str("/"), binary_left_fold<divides>);
    add(str("<="), binary_boolean_apply_pairwise<lt_equal>);
    add(str(">="), binary_boolean_apply_pairwise<gt_equal>);
    add(str("<"), binary_boolean_apply_pairwise<less_than>);
    add(str(">"), binary_boolean_apply_pairwise<greater_than>);
    add(str("=="), binary_boolean_apply_pairwise<equal>);
    add(str("!="), binary_boolean_apply_pairwise<not_equal>);
    add(str("paste"), paster);
    add(str("length"), length);
  }

  //
  // evaluation
  //
  [[nodiscard]] constexpr SExpr sequence(environment_type env, range_type statements)
  {
    auto result = SExpr{ Atom{ std::monostate{} } };
    for (const auto &statement : arguments[statements]) {
      result = eval(env, statement.value);
      if (is_error(result)) { return result; }
    }
    return result;
  }

  [[nodiscard]] constexpr SExpr eval(environment_type env, const SExpr expr)
  {
    if (const auto *call = get_if<call_type>(&expr); call != nullptr) {
      return invoke_function(env, values[call->head], call->args);
    } else if (const auto *id = get_if<symbol_type>(&expr); id != nullptr) {
      if (id->name == dots_name) {
        return make_error(ErrorKind::invalid_call, str("`...` used in an incorrect context"), expr);
      }

      const auto value = lookup(env, id->name);
      if (const auto *ref = get_if<promise_ref_type>(&value); ref != nullptr) {
        return force(*ref);
      } else if (get_if<MissingArgument>(&value) != nullptr) {
        return make_error(ErrorKind::missing_argument, str("argument is missing, with no default"), expr);
      }
      return value;
    } else if (const auto *ref = get_if<promise_ref_type>(&expr); ref != nullptr) {
      return force(*ref);
    } else if (const auto *quosure = get_if<quosure_type>(&expr); quosure != nullptr) {
      return eval(quosure->env, values[quosure->expr]);
    } else if (is_marker(expr)) {
      return make_error(ErrorKind::syntax, str("escape marker used outside of quasiquotation"), expr);
    }

    return expr;
  }

  [[nodiscard]] constexpr SExpr invoke_function(environment_type env, const SExpr &head, range_type params)
  {
    const SExpr function = eval(env, head);
    if (is_error(function)) { return function; }

    if (const auto *closure = get_if<closure_type>(&function); closure != nullptr) {
      return apply_closure(env, *closure, params);
    } else if (const auto *func = get_if<FunctionPtr>(&function); func != nullptr) {
      return (func->ptr)(*this, env, params);
    }

    return make_error(ErrorKind::invalid_call, str("attempt to apply non-function"), head);
  }

  [[nodiscard]] constexpr bool is_dots(const Argument &arg) const noexcept
  {
    const auto *id = get_if<symbol_type>(&arg.value);
    return !arg.has_name() && id != nullptr && id->name == dots_name;
  }

  // replaces a `...` argument with the arguments it stands for
  [[nodiscard]] constexpr std::expected<range_type, SExpr> expand_dots(environment_type env, range_type args)
  {
    const auto params = arguments[args];
    if (std::ranges::none_of(params, [this](const auto &arg) { return is_dots(arg); })) { return args; }

    Scratch result{ argument_scratch };
    for (const auto &arg : params) {
      if (!is_dots(arg)) {
        result.push_back(arg);
        continue;
      }

      const auto *binding = find(env, dots_name);
      const auto *items = binding == nullptr ? nullptr : get_if<list_type>(&binding->value);
      if (items == nullptr) {
        return std::unexpected(
          make_error(ErrorKind::invalid_call, str("`...` used in an incorrect context"), arg.value));
      }
      for (const auto &item : arguments[items->items]) { result.push_back(item); }
    }
    return store_arguments(result);
  }

  [[nodiscard]] constexpr SExpr apply_closure(environment_type caller, const closure_type &closure, range_type params)
  {
    const auto args = expand_dots(caller, params);
    if (!args) { return args.error(); }

    const auto extended = extend(closure.env);
    if (!extended) { return extended.error(); }
    const auto frame = *extended;
    const auto parameters = arguments[closure.parameters];
    const bool has_dots =
      std::ranges::any_of(parameters, [this](const auto &parameter) { return parameter.name == dots_name; });

    const auto matches_parameter = [&](string_type name) {
      return name != dots_name
             && std::ranges::any_of(parameters, [name](const auto &parameter) { return parameter.name == name; });
    };

    {
      Scratch dots{ argument_scratch };

      // exact names first, so positional arguments skip the parameters they bind
      for (const auto &arg : arguments[*args]) {
        if (!arg.has_name() || !matches_parameter(arg.name)) { continue; }
        if (find_local(frame, arg.name) != nullptr) {
          return make_error(
            ErrorKind::invalid_call, str("parameter matched by multiple arguments"), symbol_type{ arg.name });
        }
        if (const auto defined = define(frame, arg.name, as_promise(arg.value, caller)); !defined) {
          return defined.error();
        }
      }

      size_type next_parameter = 0;
      for (const auto &arg : arguments[*args]) {
        if (arg.has_name()) {
          if (matches_parameter(arg.name)) { continue; }
          if (!has_dots) {
            return make_error(ErrorKind::invalid_call, str("unused argument"), symbol_type{ arg.name });
          }
          const auto promise = as_promise(arg.value, caller);
          if (is_error(promise)) { return promise; }
          dots.push_back(Argument{ arg.name, promise });
          continue;
        }

        while (next_parameter < parameters.size() && parameters[next_parameter].name != dots_name
               && find_local(frame, parameters[next_parameter].name) != nullptr) {
          ++next_parameter;
        }

        if (next_parameter < parameters.size() && parameters[next_parameter].name != dots_name) {
          if (const auto defined = define(frame, parameters[next_parameter].name, as_promise(arg.value, caller));
              !defined) {
            return defined.error();
          }
          ++next_parameter;
        } else if (has_dots) {
          const auto promise = as_promise(arg.value, caller);
          if (is_error(promise)) { return promise; }
          dots.push_back(Argument{ {}, promise });
        } else {
          return make_error(ErrorKind::invalid_call, str("unused argument"), arg.value);
        }
      }

      if (has_dots) {
        if (const auto defined = define(frame, dots_name, make_list(dots)); !defined) { return defined.error(); }
      }
    }

    for (const auto &parameter : parameters) {
      if (parameter.name == dots_name || find_local(frame, parameter.name) != nullptr) { continue; }
      // defaults are evaluated lazily inside the new frame
      const auto value = get_if<MissingArgument>(&parameter.value) != nullptr ? SExpr{ MissingArgument{} }
                                                                              : make_promise(parameter.value, frame);
      if (const auto defined = define(frame, parameter.name, value); !defined) { return defined.error(); }
    }

    return sequence(frame, closure.body);
  }


  template<auto Func, typename Ret, typename... Param> [[nodiscard]] constexpr static function_ptr make_evaluator()
  {
    return function_ptr{ [](quasi_expr &engine, environment_type env, range_type params) -> SExpr {
      if (params.size != sizeof...(Param)) {
        return engine.make_error(ErrorKind::invalid_call, str("wrong param count for function"), list_type{ params });
      }

      auto impl = [&]<size_type... Idx>(std::integer_sequence<size_type, Idx...>) {
        std::tuple evaled_params{ engine.eval_to<std::remove_cvref_t<Param>>(
          env, engine.arguments[params[Idx]].value)... };

        SExpr error;

        // See if any parameter evaluations errored
        const bool errored = !([&] {
          if (std::get<Idx>(evaled_params).has_value()) {
            return true;
          } else {
            error = std::get<Idx>(evaled_params).error();
            return false;
          }
        }() && ...);

        if (errored) { return engine.expected_error(str("parameter type mismatch"), error); }

        // types have already been verified, so I can just `*` the expected safely to avoid exception checks
        if constexpr (std::is_same_v<void, Ret>) {
          std::invoke(Func, *std::get<Idx>(evaled_params)...);
          return SExpr{ Atom{ std::monostate{} } };
        } else {
          return SExpr{ Atom{ std::invoke(Func, *std::get<Idx>(evaled_params)...) } };
        }
      };

      return impl(std::make_integer_sequence<size_type, static_cast<size_type>(sizeof...(Param))>{});
    } };
  }

  template<auto Func, typename Ret, typename... Param>
  [[maybe_unused]] [[nodiscard]] constexpr static function_ptr make_evaluator(Ret (*)(Param...))
  {
    return make_evaluator<Func, Ret, Param...>();
  }

  template<auto Func, typename Ret, typename Type, typename... Param>
  [[nodiscard]] constexpr static function_ptr make_evaluator(Ret (Type::*)(Param...) const)
  {
    return make_evaluator<Func, Ret, Type *, Param...>();
  }

  template<auto Func, typename Ret, typename Type, typename... Param>
  [[maybe_unused]] [[nodiscard]] constexpr static function_ptr make_evaluator(Ret (Type::*)(Param...))
  {
    return make_evaluator<Func, Ret, Type *, Param...>();
  }

  template<auto Func> [[nodiscard]] constexpr static function_ptr make_evaluator()
  {
    return make_evaluator<Func>(Func);
  }

  // a full arena is left in its error state, which the host checks
  constexpr void add(string_view_type name, SExpr value)
  {
    [[maybe_unused]] const auto defined = define(global_env, intern(name), value);
  }

  constexpr void add(string_view_type name, function_ptr func)
  {
    const auto id = intern(name);
    [[maybe_unused]] const auto defined = define(global_env, id, SExpr{ FunctionPtr{ func, id } });
  }

  template<auto Func> constexpr void add(string_view_type name) { add(name, make_evaluator<Func>()); }

  template<typename Value> constexpr void add(string_view_type name, Value value)
  {
    add(name, SExpr{ Atom{ value } });
  }

  // converts an already evaluated value
  template<typename Type> [[nodiscard]] constexpr std::expected<Type, SExpr> to(const SExpr &value)
  {
    if constexpr (std::is_same_v<Type, SExpr>) {
      return value;
    } else if constexpr (is_sexpr_type_v<Type>) {
      if (const auto *obj = std::get_if<Type>(&value.value); obj != nullptr) { return *obj; }
    } else if constexpr (std::is_same_v<Type, string_view_type>) {
      if (const auto *string = get_if<string_type>(&value); string != nullptr) { return view(*string); }
    } else {
      if (const auto *obj = get_if<Type>(&value); obj != nullptr) { return *obj; }
    }
    return std::unexpected(value);
  }

  template<typename Type>
  [[nodiscard]] constexpr std::expected<Type, SExpr> eval_to(environment_type env, const SExpr &expr)
  {
    const auto value = eval(env, expr);
    if (is_error(value)) { return std::unexpected(value); }
    return to<Type>(value);
  }

  template<typename Type>
  [[nodiscard]] constexpr std::expected<Type, SExpr>
    eval_to(environment_type env, range_type params, string_view_type expected)
  {
    if (params.size != 1) { return std::unexpected(make_error(ErrorKind::invalid_call, expected, list_type{ params })); }
    auto first = eval_to<Type>(env, arguments[params[0]].value);
    if (!first) { return std::unexpected(expected_error(expected, first.error())); }

    return *first;
  }

  // the sole argument, unevaluated
  [[nodiscard]] constexpr std::expected<SExpr, SExpr> single_argument(range_type params, string_view_type expected)
  {
    if (params.size != 1 || arguments[params[0]].has_name()) {
      return std::unexpected(make_error(ErrorKind::invalid_call, expected, list_type{ params }));
    }
    return arguments[params[0]].value;
  }

  [[nodiscard]] constexpr std::expected<string_type, SExpr> single_symbol(range_type params, string_view_type expected)
  {
    const auto arg = single_argument(params, expected);
    if (!arg) { return std::unexpected(arg.error()); }
    if (const auto *id = get_if<symbol_type>(&*arg); id != nullptr) { return id->name; }
    return std::unexpected(make_error(ErrorKind::type_mismatch, expected, *arg));
  }

  // dynamic dots: arguments are evaluated, `!!!` splices and `:=` names
  [[nodiscard]] constexpr std::expected<range_type, SExpr> collect_dots(environment_type env, range_type params)
  {
    const auto args = expand_dots(env, params);
    if (!args) { return std::unexpected(args.error()); }

    Scratch result{ argument_scratch };
    for (const auto &arg : arguments[*args]) {
      auto scope = env;
      auto value = arg.value;

      // markers forwarded through `...` belong to the caller that wrote them
      if (const auto *ref = get_if<promise_ref_type>(&value); ref != nullptr && is_marker(promises[ref->index].expr)) {
        scope = promises[ref->index].env;
        value = promises[ref->index].expr;
      }

      if (const auto *splice = get_if<splice_type>(&value); splice != nullptr) {
        if (arg.has_name()) {
          return std::unexpected(
            make_error(ErrorKind::splice_context, str("`!!!` can not be given an argument name"), value));
        }
        const auto spliced = eval(scope, values[splice->operand]);
        if (is_error(spliced)) { return std::unexpected(spliced); }
        if (const auto done = splice_into(spliced, result); !done) { return std::unexpected(done.error()); }
      } else if (const auto *define = get_if<define_type>(&value); define != nullptr) {
        if (arg.has_name()) {
          return std::unexpected(make_error(ErrorKind::syntax, str("`:=` can not be given an argument name"), value));
        }
        const auto name = define_name(scope, values[define->name]);
        if (!name) { return std::unexpected(name.error()); }
        const auto evaled = eval(scope, values[define->value]);
        if (is_error(evaled)) { return std::unexpected(evaled); }
        result.push_back(Argument{ *name, evaled });
      } else {
        const auto evaled = eval(scope, value);
        if (is_error(evaled)) { return std::unexpected(evaled); }
        result.push_back(Argument{ arg.name, evaled });
      }
    }
    return store_arguments(result);
  }

  template<typename ValueType>
  [[nodiscard]] static constexpr SExpr error_or_else(const std::expected<ValueType, SExpr> &obj, auto callable)
  {
    if (obj) {
      return callable(*obj);
    } else {
      return obj.error();
    }
  }

  //
  // built-ins
  //
  [[nodiscard]] static constexpr SExpr quoter(quasi_expr &engine, environment_type, range_type params)
  {
    return error_or_else(engine.single_argument(params, str("(quote Expression)")), [](const auto &arg) { return arg; });
  }

  [[nodiscard]] static constexpr SExpr quasiquoter(quasi_expr &engine, environment_type env, range_type params)
  {
    return error_or_else(engine.single_argument(params, str("(expr Expression)")),
      [&](const auto &arg) { return engine.resolve(env, arg); });
  }

  [[nodiscard]] static constexpr SExpr quosure_quasiquoter(quasi_expr &engine, environment_type env, range_type params)
  {
    return error_or_else(engine.single_argument(params, str("(quo Expression)")), [&](const auto &arg) {
      const auto resolved = engine.resolve(env, arg);
      if (is_error(resolved)) { return resolved; }
      return engine.make_quosure(resolved, env);
    });
  }

  [[nodiscard]] static constexpr SExpr multi_quasiquoter(quasi_expr &engine, environment_type env, range_type params)
  {
    Scratch result{ engine.argument_scratch };
    for (const auto &arg : engine.arguments[params]) {
      // `...` captures what the callers wrote, the rest is quoted here
      const auto resolved =
        engine.is_dots(arg) ? engine.resolve_dots(env, result) : engine.resolve_argument(env, arg, result);
      if (!resolved) { return resolved.error(); }
    }
    return engine.make_list(result);
  }

  [[nodiscard]] static constexpr SExpr expr_capturer(quasi_expr &engine, environment_type env, range_type params)
  {
    const auto name = engine.single_symbol(params, str("(enexpr Symbol)"));
    if (!name) { return name.error(); }

    const auto capture = engine.captured(env, *name);
    if (!capture) { return capture.error(); }
    return engine.resolve(capture->env, capture->expr);
  }

  [[nodiscard]] static constexpr SExpr quosure_capturer(quasi_expr &engine, environment_type env, range_type params)
  {
    const auto name = engine.single_symbol(params, str("(enquo Symbol)"));
    if (!name) { return name.error(); }

    const auto capture = engine.captured(env, *name);
    if (!capture) { return capture.error(); }

    const auto resolved = engine.resolve(capture->env, capture->expr);
    if (is_error(resolved)) { return resolved; }
    return engine.make_quosure(resolved, capture->env);
  }

  [[nodiscard]] static constexpr SExpr exprs_capturer(quasi_expr &engine, environment_type env, range_type params)
  {
    if (params.size != 1 || !engine.is_dots(engine.arguments[params[0]])) {
      return engine.make_error(ErrorKind::invalid_call, str("(enexprs ...)"), list_type{ params });
    }

    Scratch result{ engine.argument_scratch };
    if (const auto resolved = engine.resolve_dots(env, result); !resolved) { return resolved.error(); }
    return engine.make_list(result);
  }

  [[nodiscard]] static constexpr SExpr quosures_capturer(quasi_expr &engine, environment_type env, range_type params)
  {
    if (params.size != 1 || !engine.is_dots(engine.arguments[params[0]])) {
      return engine.make_error(ErrorKind::invalid_call, str("(enquos ...)"), list_type{ params });
    }

    const auto items = engine.dots_of(env);
    if (!items) { return items.error(); }

    Scratch result{ engine.argument_scratch };
    for (const auto &item : engine.arguments[*items]) {
      const auto *ref = engine.get_if<promise_ref_type>(&item.value);
      if (ref == nullptr) {
        result.push_back(item);
        continue;
      }

      const auto promise = engine.promises[ref->index];
      const auto first = result.size();
      if (const auto resolved = engine.resolve_argument(promise.env, Argument{ item.name, promise.expr }, result);
          !resolved) {
        return resolved.error();
      }

      for (auto current = std::next(result.begin(), first); current != result.end(); ++current) {
        current->value = engine.make_quosure(current->value, promise.env);
      }
    }
    return engine.make_list(result);
  }

  [[nodiscard]] static constexpr SExpr tidy_evaler(quasi_expr &engine, environment_type env, range_type params)
  {
    if (params.empty() || params.size > 2) {
      return engine.make_error(ErrorKind::invalid_call, str("(eval_tidy Expression [DataMask])"), list_type{ params });
    }

    const auto target = engine.eval(env, engine.arguments[params[0]].value);
    if (is_error(target)) { return target; }

    std::optional<SExpr> mask;
    if (params.size == 2) {
      mask = engine.eval(env, engine.arguments[params[1]].value);
      if (is_error(*mask)) { return *mask; }
    }

    return engine.eval_tidy(target, env, mask);
  }

  [[nodiscard]] static constexpr SExpr evaler(quasi_expr &engine, environment_type env, range_type params)
  {
    if (params.empty() || params.size > 2) {
      return engine.make_error(ErrorKind::invalid_call, str("(eval Expression [Environment])"), list_type{ params });
    }

    const auto expr = engine.eval(env, engine.arguments[params[0]].value);
    if (is_error(expr)) { return expr; }

    if (params.size == 2) {
      const auto target = engine.eval_to<environment_type>(env, engine.arguments[params[1]].value);
      if (!target) { return engine.expected_error(str("(eval Expression Environment)"), target.error()); }
      return engine.eval(*target, expr);
    }
    return engine.eval(env, expr);
  }

  [[nodiscard]] static constexpr SExpr call_builder(quasi_expr &engine, environment_type env, range_type params)
  {
    const auto args = engine.collect_dots(env, params);
    if (!args) { return args.error(); }
    if (args->empty() || engine.arguments[args->front()].has_name()) {
      return engine.make_error(ErrorKind::invalid_call, str("(call2 Function Argument...)"), list_type{ params });
    }

    auto head = engine.arguments[args->front()].value;
    if (const auto *name = engine.get_if<string_type>(&head); name != nullptr) { head = SExpr{ symbol_type{ *name } }; }

    return SExpr{ call_type{ engine.store(head), args->sublist(1) } };
  }

  [[nodiscard]] static constexpr SExpr symbol_builder(quasi_expr &engine, environment_type env, range_type params)
  {
    return error_or_else(engine.eval_to<string_type>(env, params, str("(sym String)")),
      [](const auto &name) { return SExpr{ symbol_type{ name } }; });
  }

  [[nodiscard]] static constexpr SExpr list(quasi_expr &engine, environment_type env, range_type params)
  {
    return error_or_else(engine.collect_dots(env, params), [](const auto &items) { return SExpr{ list_type{ items } }; });
  }

  [[nodiscard]] static constexpr SExpr environment_builder(quasi_expr &engine, environment_type env, range_type params)
  {
    const auto items = engine.collect_dots(env, params);
    if (!items) { return items.error(); }

    for (const auto &item : engine.arguments[*items]) {
      if (!item.has_name()) {
        return engine.make_error(ErrorKind::invalid_call, str("(env name: value ...)"), item.value);
      } else if (item.name == engine.dots_name) {
        return engine.make_error(ErrorKind::invalid_call, str("`...` can not be bound by env"), item.value);
      }
    }
    return error_or_else(engine.extend(env, engine.arguments[*items]), [](const auto &scope) { return SExpr{ scope }; });
  }

  [[nodiscard]] static constexpr SExpr current_environment(quasi_expr &engine, environment_type env, range_type params)
  {
    if (!params.empty()) { return engine.make_error(ErrorKind::invalid_call, str("(current_env)"), list_type{ params }); }
    return SExpr{ env };
  }

  [[nodiscard]] constexpr std::expected<range_type, SExpr> get_parameters(const SExpr &parameters)
  {
    Scratch retval{ argument_scratch };
    range_type rest{};

    if (const auto *list = get_if<list_type>(&parameters); list != nullptr) {
      rest = list->items;
    } else if (const auto *call = get_if<call_type>(&parameters); call != nullptr) {
      const auto *first = get_if<symbol_type>(&values[call->head]);
      if (first == nullptr) {
        return std::unexpected(make_error(ErrorKind::syntax, str("parameter name"), parameters));
      }
      retval.push_back(Argument{ first->name, SExpr{ MissingArgument{} } });
      rest = call->args;
    } else {
      return std::unexpected(make_error(ErrorKind::syntax, str("(parameter...)"), parameters));
    }

    for (const auto &param : arguments[rest]) {
      if (param.has_name()) {
        retval.push_back(param);
      } else if (const auto *id = get_if<symbol_type>(&param.value); id != nullptr) {
        retval.push_back(Argument{ id->name, SExpr{ MissingArgument{} } });
      } else {
        return std::unexpected(make_error(ErrorKind::syntax, str("parameter name"), param.value));
      }
    }

    return store_arguments(retval);
  }

  [[nodiscard]] static constexpr SExpr lambda(quasi_expr &engine, environment_type env, range_type params)
  {
    if (params.size < 2) {
      return engine.make_error(ErrorKind::invalid_call, str("(function (parameter...) statement...)"), list_type{ params });
    }

    return error_or_else(engine.get_parameters(engine.arguments[params[0]].value),
      [&](const auto &parameters) { return SExpr{ closure_type{ parameters, params.sublist(1), env } }; });
  }

  [[nodiscard]] static constexpr SExpr definer(quasi_expr &engine, environment_type env, range_type params)
  {
    if (params.size != 2) {
      return engine.make_error(ErrorKind::invalid_call, str("(define Symbol Expression)"), list_type{ params });
    }

    const auto *id = engine.get_if<symbol_type>(&engine.arguments[params[0]].value);
    if (id == nullptr) {
      return engine.make_error(ErrorKind::type_mismatch, str("(define Symbol Expression)"), list_type{ params });
    }

    if (id->name == engine.dots_name) {
      return engine.make_error(ErrorKind::invalid_call, str("`...` can only be bound by a call"), *id);
    }

    const auto value = engine.eval(env, engine.arguments[params[1]].value);
    if (is_error(value)) { return value; }

    if (const auto defined = engine.define(env, id->name, value); !defined) { return defined.error(); }
    return SExpr{ Atom{ std::monostate{} } };
  }

  [[nodiscard]] static constexpr SExpr ifer(quasi_expr &engine, environment_type env, range_type params)
  {
    // need to be careful to not execute unexecuted branches
    if (params.size != 3) { return engine.make_error(ErrorKind::invalid_call, str("(if bool-cond then else)"), list_type{ params }); }

    const auto condition = engine.eval_to<bool>(env, engine.arguments[params[0]].value);

    if (!condition) { return engine.expected_error(str("boolean condition"), condition.error()); }

    if (*condition) {
      return engine.eval(env, engine.arguments[params[1]].value);
    } else {
      return engine.eval(env, engine.arguments[params[2]].value);
    }
  }

  template<typename Out> static constexpr void append_integer(Out &out, int_type value)
  {
    std::array<char_type, std::numeric_limits<unsigned long long>::digits10 + 2> digits{};
    std::size_t used = 0;
    auto magnitude =
      value < 0 ? 0ULL - static_cast<unsigned long long>(value) : static_cast<unsigned long long>(value);
    do {
      digits[used++] = static_cast<char_type>(chars<char_type>::ch('0') + static_cast<int>(magnitude % 10));
      magnitude /= 10;
    } while (magnitude != 0);

    if (value < 0) { out.push_back(chars<char_type>::ch('-')); }
    while (used != 0) { out.push_back(digits[--used]); }
  }

  [[nodiscard]] static constexpr SExpr paster(quasi_expr &engine, environment_type env, range_type params)
  {
    const auto items = engine.collect_dots(env, params);
    if (!items) { return items.error(); }

    Scratch result{ engine.char_scratch };
    const auto append = [&](string_view_type text) {
      for (const auto ch : text) { result.push_back(ch); }
    };

    for (const auto &item : engine.arguments[*items]) {
      if (const auto *string = engine.get_if<string_type>(&item.value); string != nullptr) {
        append(engine.view(*string));
      } else if (const auto *id = engine.get_if<symbol_type>(&item.value); id != nullptr) {
        append(engine.view(id->name));
      } else if (const auto *integer = engine.get_if<int_type>(&item.value); integer != nullptr) {
        append_integer(result, *integer);
      } else if (const auto *boolean = engine.get_if<bool>(&item.value); boolean != nullptr) {
        append(*boolean ? string_view_type{ str("true") } : string_view_type{ str("false") });
      } else {
        return engine.make_error(ErrorKind::type_mismatch, str("(paste String-Symbol-or-Integer...)"), item.value);
      }
    }

    return engine.make_string(string_view_type{ result.begin(), result.end() });
  }

  [[nodiscard]] static constexpr SExpr length(quasi_expr &engine, environment_type env, range_type params)
  {
    return error_or_else(engine.eval_to<SExpr>(env, params, str("(length List-or-Call)")), [&](const auto &value) {
      if (const auto *items = engine.get_if<list_type>(&value); items != nullptr) {
        return SExpr{ Atom{ static_cast<int_type>(items->items.size) } };
      } else if (const auto *call = engine.get_if<call_type>(&value); call != nullptr) {
        return SExpr{ Atom{ static_cast<int_type>(call->args.size) } };
      }
      return engine.make_error(ErrorKind::type_mismatch, str("(length List-or-Call)"), value);
    });
  }

  // take a string_view and return a C++ function object
  // of unspecified type.
  template<typename Signature>
  [[nodiscard]] constexpr auto make_callable(SExpr callable) noexcept
    requires std::is_function_v<Signature>
  {
    auto impl = [callable]<typename Ret, typename... Params>(Ret (*)(Params...)) {
      return [callable](quasi_expr &engine, Params... params) {
        std::array<Argument, sizeof...(Params)> args{ Argument{ {}, SExpr{ Atom{ params } } }... };
        const auto call = engine.make_call(callable, args);
        if constexpr (std::is_same_v<void, Ret>) {
          [[maybe_unused]] const auto result = engine.eval(engine.global_env, call);
        } else {
          return engine.eval_to<Ret>(engine.global_env, call);
        }
      };
    };

    return impl(std::add_pointer_t<Signature>{ nullptr });
  }

  template<typename Signature>
  [[nodiscard]] constexpr auto make_callable(string_view_type function) noexcept
    requires std::is_function_v<Signature>
  {
    // this is fragile, we need to check parsing better
    const auto parsed = parse(function).first;
    const auto *items = get_if<list_type>(&parsed);
    if (items == nullptr || items->items.empty()) { return make_callable<Signature>(parsed); }
    return make_callable<Signature>(eval(global_env, arguments[items->items.front()].value));
  }

  template<auto Op>
  [[nodiscard]] static constexpr SExpr binary_left_fold(quasi_expr &engine, environment_type env, range_type params)
  {
    auto fold = [&engine, env, params]<typename Param>(Param first) -> SExpr {
      if constexpr (requires(Param p1, Param p2) { Op(p1, p2); }) {
        for (const auto &elem : engine.arguments[params.sublist(1)]) {
          const auto &next = engine.eval_to<Param>(env, elem.value);
          if (!next) {
            return engine.is_error(next.error())
                     ? next.error()
                     : engine.make_error(ErrorKind::type_mismatch, str("same types for operator"), SExpr{ Atom{ first } }, next.error());
          }
          const auto result = Op(first, *next);
          if (!result) {
            return engine.make_error(ErrorKind::arithmetic,
              result.error() == ArithmeticError::division_by_zero ? string_view_type{ str("division by zero") }
                                                                  : string_view_type{ str("integer overflow") },
              SExpr{ Atom{ first } },
              SExpr{ Atom{ *next } });
          }
          first = *result;
        }

        return SExpr{ Atom{ first } };
      } else {
        return engine.make_error(ErrorKind::type_mismatch, str("operator not supported for types"), list_type{ params });
      }
    };

    if (params.size > 1) {
      const auto param1 = engine.eval(env, engine.arguments[params[0]].value);
      if (is_error(param1)) { return param1; }
      if (const auto *atom = std::get_if<Atom>(&param1.value); atom != nullptr) {
        return visit(fold, *atom);
      } else {
        return engine.make_error(ErrorKind::type_mismatch, str("operator not supported for types"), list_type{ params });
      }
    }

    return engine.make_error(ErrorKind::invalid_call, str("operator requires at east two parameters"), list_type{ params });
  }

  [[nodiscard]] static constexpr SExpr logical_and(quasi_expr &engine, environment_type env, range_type params)
  {
    for (const auto &arg : engine.arguments[params]) {
      const auto next = engine.eval_to<bool>(env, arg.value);
      if (!next) { return engine.expected_error(str("parameter not boolean"), next.error()); }
      if (!(*next)) { return SExpr{ Atom{ false } }; }
    }

    return SExpr{ Atom{ true } };
  }

  [[nodiscard]] static constexpr SExpr logical_or(quasi_expr &engine, environment_type env, range_type params)
  {
    for (const auto &arg : engine.arguments[params]) {
      const auto next = engine.eval_to<bool>(env, arg.value);
      if (!next) { return engine.expected_error(str("parameter not boolean"), next.error()); }
      if (*next) { return SExpr{ Atom{ true } }; }
    }

    return SExpr{ Atom{ false } };
  }

  template<auto Op>
  [[nodiscard]] static constexpr SExpr
    binary_boolean_apply_pairwise(quasi_expr &engine, environment_type env, range_type params)
  {
    auto sum = [&engine, env, params]<typename Param>(Param next) -> SExpr {
      if constexpr (requires(Param p1, Param p2) { Op(p1, p2); }) {
        for (const auto &elem : engine.arguments[params.sublist(1)]) {
          const auto &result = engine.eval_to<Param>(env, elem.value);
          if (!result) {
            return engine.is_error(result.error())
                     ? result.error()
                     : engine.make_error(ErrorKind::type_mismatch, str("same types for operator"), SExpr{ Atom{ next } }, result.error());
          }
          const auto prev = std::exchange(next, *result);
          if (!Op(prev, next)) { return SExpr{ Atom{ false } }; }
        }

        return SExpr{ Atom{ true } };
      } else {
        return engine.make_error(ErrorKind::type_mismatch, str("supported types"), list_type{ params });
      }
    };

    if (params.size < 2) { return engine.make_error(ErrorKind::invalid_call, str("at least 2 parameters"), list_type{ params }); }
    const auto first_param = engine.eval(env, engine.arguments[params[0]].value);
    if (is_error(first_param)) { return first_param; }

    if (const auto *atom = std::get_if<Atom>(&first_param.value); atom != nullptr) { return visit(sum, *atom); }

    return engine.make_error(ErrorKind::type_mismatch, str("supported types"), list_type{ params });
  }

  [[nodiscard]] constexpr SExpr evaluate(string_view_type input)
  {
    const auto result = parse(input).first;
    const auto *list = get_if<list_type>(&result);

    if (list != nullptr) { return sequence(global_env, list->items); }
    return result;
  }

  template<typename Result> [[nodiscard]] constexpr std::expected<Result, SExpr> evaluate_to(string_view_type input)
  {
    const auto result = evaluate(input);
    if (is_error(result)) { return std::unexpected(result); }
    return to<Result>(result);
  }
};


}// namespace quasi

#endif
