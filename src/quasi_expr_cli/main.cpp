#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <quasi_expr/quasi_expr.hpp>
#include <quasi_expr/utility.hpp>

#include <internal_use_only/config.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using quasi_expr_type = quasi::quasi_expr<>;

void display(quasi_expr_type::int_type i) { fmt::print("{}\n", i); }

namespace {
bool exhausted(const quasi_expr_type &evaluator)
{
  return evaluator.strings.error_state || evaluator.values.error_state || evaluator.arguments.error_state
         || evaluator.environments.error_state || evaluator.bindings.error_state || evaluator.promises.error_state
         || evaluator.argument_scratch.error_state || evaluator.char_scratch.error_state;
}

// prints the result, returns false if it is an error
bool report(const quasi_expr_type &evaluator, const quasi_expr_type::SExpr &result, bool annotate)
{
  if (quasi_expr_type::is_error(result)) {
    spdlog::error("{}", quasi::to_string(evaluator, annotate, result));
    return false;
  }

  fmt::print("{}\n", quasi::to_string(evaluator, annotate, result));
  return true;
}
}// namespace

int main(int argc, const char **argv)
{
  try {
    CLI::App app{ fmt::format("{} version {}", quasi_expr::cmake::project_name, quasi_expr::cmake::project_version) };

    std::optional<std::string> script;
    std::optional<std::string> quasiquotation;
    bool annotate = false;
    bool show_version = false;
    app.add_flag("--version", show_version, "Show version information");
    app.add_flag("--annotate", annotate, "Annotate printed values with their kind");
    app.add_option("--exec", script, "Script to execute");
    app.add_option("--resolve", quasiquotation, "Expression to resolve without evaluating it");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
      fmt::print("{}\n", quasi_expr::cmake::project_version);
      return EXIT_SUCCESS;
    }

    quasi_expr_type evaluator;

    evaluator.add<display>("display");

    bool succeeded = true;

    if (script) {
      spdlog::debug("executing {} bytes of script", script->size());
      succeeded = report(evaluator, evaluator.evaluate(*script), annotate) && succeeded;
    }

    if (quasiquotation) {
      const auto parsed = evaluator.parse(*quasiquotation).first;
      const auto *expressions = evaluator.get_if<quasi_expr_type::list_type>(&parsed);

      if (expressions == nullptr) {
        succeeded = report(evaluator, parsed, annotate) && succeeded;
      } else {
        for (const auto &expression : evaluator.arguments[expressions->items]) {
          succeeded = report(evaluator, evaluator.resolve(evaluator.global_env, expression.value), annotate) && succeeded;
        }
      }
    }

    if (exhausted(evaluator)) {
      spdlog::warn("evaluator storage capacity was exhausted, results may be incomplete");
      succeeded = false;
    }

    return succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }
}
