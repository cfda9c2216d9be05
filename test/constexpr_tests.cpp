#include <catch2/catch_test_macros.hpp>

#include <internal_use_only/config.hpp>
#include <quasi_expr/quasi_expr.hpp>

using quasi_expr_type = quasi::quasi_expr<>;

static_assert(std::is_trivially_copyable_v<quasi_expr_type::SExpr>);

constexpr auto evaluate(std::string_view input)
{
  quasi_expr_type evaluator;

  return evaluator.evaluate(input);
}

template<typename Result> constexpr Result evaluate_to(std::string_view input)
{
  quasi_expr_type evaluator;
  return evaluator.evaluate_to<Result>(input).value();
}

constexpr quasi::ErrorKind error_kind(std::string_view input)
{
  return std::get<quasi_expr_type::error_type>(evaluate(input).value).kind;
}

// both scripts run in the same engine, so `expected` sees the definitions of `input`
constexpr bool same_result(std::string_view input, std::string_view expected)
{
  quasi_expr_type evaluator;
  const auto result = evaluator.evaluate(input);
  const auto wanted = evaluator.evaluate(expected);
  return !quasi_expr_type::is_error(result) && evaluator.equivalent(result, wanted);
}

TEST_CASE("Operator identifiers", "[operators]")
{
  STATIC_CHECK(evaluate_to<int>("((if false + *) 3 4)") == 12);
  STATIC_CHECK(evaluate_to<int>("((if true + *) 3 4)") == 7);
}

TEST_CASE("basic float operators", "[operators]")
{
  STATIC_CHECK(evaluate_to<double>("(+ 1.0 0.1)") == 1.1);
  STATIC_CHECK(evaluate_to<double>("(+ 0.0 1.0e-1)") == 1.0e-1);
}

TEST_CASE("basic integer operators", "[operators]")
{
  STATIC_CHECK(evaluate_to<int>("(+ 1 2)") == 3);
  STATIC_CHECK(evaluate_to<int>("(/ 2 2)") == 1);
  STATIC_CHECK(evaluate_to<int>("(- 2 2)") == 0);
  STATIC_CHECK(evaluate_to<int>("(* 2 2)") == 4);
  STATIC_CHECK(evaluate_to<int>("(+ 1 2 3 -6)") == 0);
}

TEST_CASE("arithmetic errors", "[operators]")
{
  STATIC_CHECK(evaluate_to<int>("(/ 7 2)") == 3);
  STATIC_CHECK(evaluate_to<int>("(* -3 4)") == -12);
  STATIC_CHECK(error_kind("(/ 1 0)") == quasi::ErrorKind::arithmetic);
  STATIC_CHECK(error_kind("(/ 1.0 0.0)") == quasi::ErrorKind::arithmetic);
  STATIC_CHECK(error_kind("(* 65536 65536)") == quasi::ErrorKind::arithmetic);
  STATIC_CHECK(error_kind("(- -2147483647 2)") == quasi::ErrorKind::arithmetic);
  STATIC_CHECK(error_kind("(+ 1 2147483647)") == quasi::ErrorKind::arithmetic);
}

TEST_CASE("integer literals out of range", "[parsing]")
{
  STATIC_CHECK(evaluate_to<int>("2147483647") == 2147483647);
  STATIC_CHECK(evaluate_to<double>("99999999999") == 99999999999.0);
  STATIC_CHECK(error_kind("(+ 0 99999999999)") == quasi::ErrorKind::type_mismatch);
}

TEST_CASE("names that overlap earlier names", "[parsing]")
{
  STATIC_CHECK(evaluate_to<int>("(define xa 1) (define aa 2) aa") == 2);
  STATIC_CHECK(evaluate_to<int>("(define ab 1) (define ba 2) (define bab 3) (+ ab ba bab)") == 6);
  STATIC_CHECK(evaluate_to<bool>("(== 1 1)") == true);
}

TEST_CASE("basic comparisons and logic", "[operators]")
{
  STATIC_CHECK(evaluate_to<bool>("(< 1 2 3)") == true);
  STATIC_CHECK(evaluate_to<bool>("(>= 1 2)") == false);
  STATIC_CHECK(evaluate_to<bool>(R"((== "hello" "hello"))") == true);
  STATIC_CHECK(evaluate_to<bool>("(and true (not false))") == true);
  STATIC_CHECK(evaluate_to<bool>("(or false false)") == false);
}

TEST_CASE("comments and named arguments", "[parsing]")
{
  STATIC_CHECK(evaluate_to<int>(R"(
; one comment
; and another
(+ 1 2) ; trailing
)") == 3);

  STATIC_CHECK(evaluate_to<int>("(length (quote (f x y: 2)))") == 2);
  STATIC_CHECK(same_result("(quote ())", "(list)"));
}

TEST_CASE("parse errors", "[parsing]")
{
  STATIC_CHECK(error_kind("(f !!y: 10)") == quasi::ErrorKind::syntax);
  STATIC_CHECK(error_kind("(f x") == quasi::ErrorKind::syntax);
  STATIC_CHECK(error_kind("(f x))") == quasi::ErrorKind::syntax);
  STATIC_CHECK(error_kind(R"((f "unterminated))") == quasi::ErrorKind::syntax);
  STATIC_CHECK(error_kind("(f y:)") == quasi::ErrorKind::syntax);
}

TEST_CASE("quote never evaluates", "[quotation]")
{
  STATIC_CHECK(same_result("(quote (undefined-function 1 2))", "(call2 \"undefined-function\" 1 2)"));
  STATIC_CHECK(same_result("(quote x)", "(sym \"x\")"));
  STATIC_CHECK(same_result("(quote (f !!x))", "(quote (f !!x))"));
  STATIC_CHECK(evaluate_to<int>("(quote 42)") == 42);
}

TEST_CASE("unquote", "[quasiquotation]")
{
  STATIC_CHECK(same_result("(define x 2) (expr (f !!x y))", "(quote (f 2 y))"));
  STATIC_CHECK(same_result("(expr (f !!(quote (g z)) y))", "(quote (f (g z) y))"));
  STATIC_CHECK(same_result("(expr (f (g !!(+ 1 2))))", "(quote (f (g 3)))"));
  STATIC_CHECK(same_result("(define name (quote g)) (expr (!!name 1))", "(quote (g 1))"));
  STATIC_CHECK(same_result("(expr !!(+ 1 2))", "3"));
}

TEST_CASE("unquote deep inside a call", "[quasiquotation]")
{
  STATIC_CHECK(same_result("(define x 3) (expr (f (g (h (i (j !!x))))))", "(quote (f (g (h (i (j 3))))))"));
  STATIC_CHECK(same_result("(define x 3) (expr (f (a: !!x b)))", "(quote (f (a: 3 b)))"));
  STATIC_CHECK(same_result("(define xs (list 1 2)) (expr (f (a: 0 !!!xs)))", "(quote (f (a: 0 1 2)))"));
}

TEST_CASE("unquote operands see the ambient environment", "[quasiquotation]")
{
  STATIC_CHECK(same_result("(define f (function (x) (expr (g !!x)))) (f 5)", "(quote (g 5))"));
}

TEST_CASE("unquote splice", "[quasiquotation]")
{
  STATIC_CHECK(same_result("(define args (list 1 2 3)) (expr (f !!!args))", "(quote (f 1 2 3))"));
  STATIC_CHECK(same_result("(define args (list a: 1 b: 2)) (expr (f x !!!args))", "(quote (f x a: 1 b: 2))"));
  STATIC_CHECK(same_result("(expr (f !!!null))", "(quote (f))"));
  STATIC_CHECK(same_result("(expr (f !!!5))", "(quote (f 5))"));
  STATIC_CHECK(same_result("(expr (f !!!(list 1 (list 2 3))))", "(call2 \"f\" 1 (list 2 3))"));
}

TEST_CASE("computed argument names", "[quasiquotation]")
{
  STATIC_CHECK(same_result(R"((define n "x") (expr (f (:= !!n 10))))", "(quote (f x: 10))"));
  STATIC_CHECK(same_result(R"((define n "x") (expr (f (:= n (+ 1 !!n)))))", R"((quote (f x: (+ 1 "x"))))"));
  STATIC_CHECK(same_result("(expr (f (:= (quote k) 1)))", "(quote (f k: 1))"));
}

TEST_CASE("quasiquotation errors", "[quasiquotation]")
{
  STATIC_CHECK(error_kind("(define args (list 1)) (expr (!!!args x))") == quasi::ErrorKind::splice_context);
  STATIC_CHECK(error_kind("(define args (list 1)) (expr (f y: !!!args))") == quasi::ErrorKind::splice_context);
  STATIC_CHECK(error_kind("(expr (f !!!(function (x) x)))") == quasi::ErrorKind::type_mismatch);
  STATIC_CHECK(error_kind("(expr (f (:= 5 10)))") == quasi::ErrorKind::define_name);
  STATIC_CHECK(error_kind(R"((expr (f (:= "" 10))))") == quasi::ErrorKind::define_name);
  STATIC_CHECK(error_kind("(expr (f !!undefined))") == quasi::ErrorKind::unbound_symbol);
  STATIC_CHECK(error_kind("(expr (:= a 1))") == quasi::ErrorKind::syntax);
  STATIC_CHECK(error_kind("(define x 1) (+ !!x 1)") == quasi::ErrorKind::syntax);
  STATIC_CHECK(error_kind(R"((list a: (:= "b" 1)))") == quasi::ErrorKind::syntax);
}

TEST_CASE("argument capture", "[capture]")
{
  STATIC_CHECK(same_result("(define capture (function (x) (enexpr x))) (capture (a + b))", "(quote (a + b))"));
  STATIC_CHECK(same_result("(define capture (function (x) (enexpr x))) (capture (undefined 1))", "(quote (undefined 1))"));
  STATIC_CHECK(same_result("(define v 5) (define capture (function (x) (enexpr x))) (capture (g !!v))", "(quote (g 5))"));
}

TEST_CASE("variadic capture", "[capture]")
{
  STATIC_CHECK(same_result("(define capture (function (...) (enexprs ...))) (capture x y: (f z))",
    "(list (quote x) y: (quote (f z)))"));

  STATIC_CHECK(same_result(R"(
(define inner (function (...) (enexprs ...)))
(define outer (function (...) (inner ...)))
(outer (a b) c: d)
)",
    "(list (quote (a b)) c: (quote d))"));

  STATIC_CHECK(same_result(R"(
(define capture (function (...) (enexprs ...)))
(define rest (list 2 3))
(capture 1 !!!rest)
)",
    "(list 1 2 3)"));
}

TEST_CASE("exprs", "[quasiquotation]")
{
  STATIC_CHECK(same_result("(exprs a b: (c d))", "(list (quote a) b: (quote (c d)))"));
  STATIC_CHECK(same_result("(define xs (list 1 2)) (exprs 0 !!!xs)", "(list 0 1 2)"));
}

TEST_CASE("capture errors", "[capture]")
{
  STATIC_CHECK(error_kind("(define f (function (x) (enexpr y))) (f 1)") == quasi::ErrorKind::missing_argument);
  STATIC_CHECK(error_kind("(define f (function (x) (enexpr x))) (f)") == quasi::ErrorKind::missing_argument);
  STATIC_CHECK(error_kind("(define f (function (x) (enexpr 5))) (f 1)") == quasi::ErrorKind::type_mismatch);
  STATIC_CHECK(error_kind("(define f (function (x) (enexprs ...))) (f 1)") == quasi::ErrorKind::missing_argument);
  STATIC_CHECK(error_kind("(eval_tidy (quote (enexprs ...)) (list ...: 1))") == quasi::ErrorKind::invalid_call);
  STATIC_CHECK(error_kind("(eval_tidy (quote (exprs ...)) (list ...: 1))") == quasi::ErrorKind::invalid_call);
}

TEST_CASE("tidy evaluation", "[quosures]")
{
  STATIC_CHECK(evaluate_to<int>("(define make (function (a) (quo (+ a 1)))) (eval_tidy (make 5))") == 6);
  STATIC_CHECK(evaluate_to<int>("(define make (function (a) (quo (+ a 1)))) (eval_tidy (make 5) (list a: 100))") == 101);
  STATIC_CHECK(evaluate_to<int>("(define make (function (a) (quo (+ a 1)))) (eval_tidy (make 5) (env a: 10))") == 11);
  STATIC_CHECK(evaluate_to<int>("(define a 2) (eval_tidy (quote (* a b)) (list b: 4))") == 8);
}

TEST_CASE("captured quosures", "[quosures]")
{
  STATIC_CHECK(evaluate_to<int>(R"(
(define f (function (x) (enquo x)))
(define y 3)
(eval_tidy (f (* y 2)))
)") == 6);

  STATIC_CHECK(evaluate_to<int>(R"(
(define f (function (x) (enquo x)))
(define y 3)
(eval_tidy (f (* y 2)) (list y: 10))
)") == 20);

  STATIC_CHECK(evaluate_to<int>(R"(
(define f (function (...) (enquos ...)))
(define y 3)
(length (f (* y 2) y))
)") == 2);
}

TEST_CASE("nested quosures keep their own environment", "[quosures]")
{
  STATIC_CHECK(evaluate_to<int>(R"(
(define a 1)
(define inner (quo a))
(define g (function (a) (quo (+ !!inner a))))
(eval_tidy (g 10))
)") == 11);
}

TEST_CASE("lazy arguments", "[promises]")
{
  STATIC_CHECK(evaluate_to<int>("((function (x) 1) (undefined))") == 1);
  STATIC_CHECK(evaluate_to<int>("((function (x y: (* x 2)) y) 5)") == 10);
  STATIC_CHECK(evaluate_to<int>("((function (x y: (* x 2)) y) 5 y: 1)") == 1);
  STATIC_CHECK(evaluate_to<int>("((function (x y) (- x y)) y: 1 10)") == 9);
}

TEST_CASE("argument matching errors", "[promises]")
{
  STATIC_CHECK(error_kind("((function (x) x))") == quasi::ErrorKind::missing_argument);
  STATIC_CHECK(error_kind("((function (x: x) x))") == quasi::ErrorKind::recursive_promise);
  STATIC_CHECK(error_kind("((function (x) x) 1 2)") == quasi::ErrorKind::invalid_call);
  STATIC_CHECK(error_kind("((function (x) x) y: 1)") == quasi::ErrorKind::invalid_call);
  STATIC_CHECK(error_kind("((function (x) x) x: 1 x: 2)") == quasi::ErrorKind::invalid_call);
  STATIC_CHECK(error_kind("(undefined 1)") == quasi::ErrorKind::unbound_symbol);
  STATIC_CHECK(error_kind("(1 2)") == quasi::ErrorKind::invalid_call);
}

TEST_CASE("dynamic dots", "[builtins]")
{
  STATIC_CHECK(same_result(R"((define xs (list 1 2)) (define n "k") (list 0 !!!xs (:= n 3)))", "(list 0 1 2 k: 3)"));
  STATIC_CHECK(same_result("(define f (function (...) (list ...))) (f 1 b: (+ 1 1))", "(list 1 b: 2)"));
  STATIC_CHECK(same_result("(define xs (list 2 3)) (define f (function (...) (list ...))) (f 1 !!!xs)", "(list 1 2 3)"));
}

TEST_CASE("building calls", "[builtins]")
{
  STATIC_CHECK(same_result("(call2 \"f\" 1 b: 2)", "(quote (f 1 b: 2))"));
  STATIC_CHECK(same_result("(call2 (quote f) !!!(list 1 2))", "(quote (f 1 2))"));
  STATIC_CHECK(evaluate_to<int>("(eval (call2 \"+\" 1 2))") == 3);
  STATIC_CHECK(evaluate_to<int>("(define x 5) (eval (sym \"x\"))") == 5);
}

TEST_CASE("environments", "[builtins]")
{
  STATIC_CHECK(evaluate_to<int>("(define e (env a: 3)) (eval (quote (+ a 1)) e)") == 4);
  STATIC_CHECK(evaluate_to<int>("(define a 7) ((function () (eval (quote a) (current_env))))") == 7);
  STATIC_CHECK(error_kind("(env 1)") == quasi::ErrorKind::invalid_call);
  STATIC_CHECK(error_kind("(env ...: 1)") == quasi::ErrorKind::invalid_call);
  STATIC_CHECK(error_kind("(define ... 5) (enexprs ...)") == quasi::ErrorKind::invalid_call);
}

TEST_CASE("strings and lengths", "[builtins]")
{
  STATIC_CHECK(evaluate_to<bool>(R"((== (paste "a" (quote b) 1 -20) "ab1-20"))") == true);
  STATIC_CHECK(evaluate_to<int>("(length (list 1 2 3))") == 3);
  STATIC_CHECK(evaluate_to<int>("(length (quote (f a b)))") == 2);
}

TEST_CASE("basic define usage", "[define]")
{
  STATIC_CHECK(evaluate_to<int>("(define x 32) x") == 32);
  STATIC_CHECK(evaluate_to<int>(R"(
(define x 1)
(define f (function (x) (define x 10) x))
(+ (f 5) x)
)") == 11);
}

TEST_CASE("closures", "[lambdas]")
{
  STATIC_CHECK(evaluate_to<int>("(define make-adder (function (a) (function (b) (+ a b)))) ((make-adder 2) 3)") == 5);
  STATIC_CHECK(evaluate_to<int>("((lambda (x) (* x x)) 11)") == 121);
}

TEST_CASE("check version number", "[system]")
{
  STATIC_CHECK(quasi::quasi_expr_version_major == quasi_expr::cmake::project_version_major);
  STATIC_CHECK(quasi::quasi_expr_version_minor == quasi_expr::cmake::project_version_minor);
  STATIC_CHECK(quasi::quasi_expr_version_patch == quasi_expr::cmake::project_version_patch);
  STATIC_CHECK(quasi::quasi_expr_version_tweak == quasi_expr::cmake::project_version_tweak);
}
