#ifndef QUASI_EXPR_UTILITY_HPP
#define QUASI_EXPR_UTILITY_HPP

#include "quasi_expr.hpp"

#include <fmt/format.h>

#include <string>

namespace quasi {
template<typename> inline constexpr bool is_quasi_expr_v = false;

template<std::unsigned_integral SizeType,
  typename CharType,
  std::signed_integral IntegralType,
  std::floating_point FloatType,
  SizeType BuiltInStringsSize,
  SizeType BuiltInValuesSize,
  SizeType BuiltInArgumentsSize,
  SizeType BuiltInBindingsSize,
  SizeType BuiltInPromisesSize,
  SizeType BuiltInEnvironmentsSize,
  typename... UserTypes>
inline constexpr bool is_quasi_expr_v<quasi::quasi_expr<SizeType,
  CharType,
  IntegralType,
  FloatType,
  BuiltInStringsSize,
  BuiltInValuesSize,
  BuiltInArgumentsSize,
  BuiltInBindingsSize,
  BuiltInPromisesSize,
  BuiltInEnvironmentsSize,
  UserTypes...>> = true;

template<typename T>
concept QuasiExpr = is_quasi_expr_v<T> && std::is_same_v<typename T::char_type, char>;

// Renders values back in the reader's syntax where one exists, so a printed
// expression can be parsed again. `annotate` prefixes each node with its kind.
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::SExpr &input);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Atom &input);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const std::monostate &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const bool input);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::int_type input);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::float_type input);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::string_type &string);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::symbol_type &id);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::call_type &call);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::unquote_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::splice_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::define_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::list_type &list);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::closure_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::quosure_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::FunctionPtr &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::environment_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::promise_ref_type &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const quasi::MissingArgument &);
template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::error_type &);


template<QuasiExpr Eval>
std::string arguments_to_string(const Eval &engine, bool annotate, const typename Eval::range_type &args)
{
  std::string result;
  for (const auto &arg : engine.arguments[args]) {
    if (!result.empty()) { result += ' '; }
    if (arg.has_name()) { result += fmt::format("{}: ", engine.view(arg.name)); }
    result += to_string(engine, annotate, arg.value);
  }
  return result;
}

template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const std::monostate &)
{
  return annotate ? "[null] null" : "null";
}

template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const bool input)
{
  std::string result;
  if (annotate) { result = "[bool] "; }
  if (input) {
    return result + "true";
  } else {
    return result + "false";
  }
}

template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::int_type input)
{
  std::string result;
  if (annotate) { result = "[int] "; }
  return result + fmt::format("{}", input);
}

template<QuasiExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::float_type input)
{
  std::string result;
  if (annotate) { result = "[float] "; }

  return result + fmt::format("{}", input);
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::string_type &string)
{
  if (annotate) {
    return fmt::format("[string] {{{}, {}}} \"{}\"", string.start, string.size, engine.view(string));
  } else {
    return fmt::format("\"{}\"", engine.view(string));
  }
}

template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Atom &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input);
}

template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::symbol_type &id)
{
  if (annotate) {
    return fmt::format("[symbol] {{{}, {}}} {}", id.name.start, id.name.size, engine.view(id.name));
  } else {
    return std::string{ engine.view(id.name) };
  }
}

template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::call_type &call)
{
  std::string result;
  if (annotate) { result += fmt::format("[call] {{{}, {}}} ", call.args.start, call.args.size); }

  result += "(" + to_string(engine, false, engine.values[call.head]);
  if (!call.args.empty()) { result += ' ' + arguments_to_string(engine, false, call.args); }
  return result + ")";
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::unquote_type &unquote)
{
  return std::string{ annotate ? "[unquote] " : "" } + "!!" + to_string(engine, false, engine.values[unquote.operand]);
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::splice_type &splice)
{
  return std::string{ annotate ? "[unquote splice] " : "" } + "!!!"
         + to_string(engine, false, engine.values[splice.operand]);
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::define_type &define)
{
  return fmt::format("{}(:= {} {})",
    annotate ? "[define] " : "",
    to_string(engine, false, engine.values[define.name]),
    to_string(engine, false, engine.values[define.value]));
}

// printed as the call that would build it
template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::list_type &list)
{
  std::string result;
  if (annotate) { result += fmt::format("[list] {{{}, {}}} ", list.items.start, list.items.size); }

  result += "(list";
  if (!list.items.empty()) { result += ' ' + arguments_to_string(engine, false, list.items); }
  return result + ")";
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::closure_type &closure)
{
  std::string parameters;
  for (const auto &parameter : engine.arguments[closure.parameters]) {
    if (!parameters.empty()) { parameters += ' '; }
    if (std::holds_alternative<quasi::MissingArgument>(parameter.value.value)) {
      parameters += engine.view(parameter.name);
    } else {
      parameters += fmt::format("{}: {}", engine.view(parameter.name), to_string(engine, false, parameter.value));
    }
  }

  if (annotate) {
    return fmt::format("[closure] {{{}, {}}} environment {} ({})",
      closure.body.start,
      closure.body.size,
      closure.env.index,
      parameters);
  }
  return fmt::format("[closure ({})]", parameters);
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::quosure_type &quosure)
{
  if (annotate) {
    return fmt::format(
      "[quosure] environment {} ^{}", quosure.env.index, to_string(engine, false, engine.values[quosure.expr]));
  }
  return "^" + to_string(engine, false, engine.values[quosure.expr]);
}

template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool, const typename Eval::FunctionPtr &func)
{
  return fmt::format("[builtin {}]", engine.view(func.name));
}

template<QuasiExpr Eval> std::string to_string(const Eval &, bool, const typename Eval::environment_type &env)
{
  return fmt::format("[environment {}]", env.index);
}

template<QuasiExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::promise_ref_type &ref)
{
  const auto &promise = engine.promises[ref.index];
  if (annotate) {
    return fmt::format("[promise {}] {}", ref.index, to_string(engine, false, promise.expr));
  }
  return fmt::format("[promise {}]", ref.index);
}

template<QuasiExpr Eval> std::string to_string(const Eval &, bool, const quasi::MissingArgument &)
{
  return "[missing]";
}

template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool, const typename Eval::error_type &error)
{
  std::string result =
    fmt::format("[error: {}] {}", quasi::error_kind_name(error.kind), engine.view(error.description));

  for (const auto &context : engine.values[error.context]) { result += ' ' + to_string(engine, false, context); }
  return result;
}

template<QuasiExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::SExpr &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input.value);
}
}// namespace quasi

#endif
