#include <lox/lang/interpreter.hpp>
#include <lox/lang/pretty.hpp>
#include <lox/log.hpp>
#include <ostream>

namespace lox {

namespace {

LoxError runtime_error(const Expr& at, std::string msg) {
    return LoxError{LoxError::Runtime, std::move(msg), at.line};
}

Result<Value> numeric(const Expr& at, const Value& a, const Value& b,
                      const char* verb, float (*fn)(float, float)) {
    if (a.is_number() && b.is_number()) {
        return Result<Value>::ok(Value::number(fn(a.as_number(), b.as_number())));
    }
    return runtime_error(at, std::string("can only ") + verb + " numbers");
}

Result<Value> compare(const Expr& at, const Value& a, const Value& b,
                      bool (*fn)(float, float)) {
    if (a.is_number() && b.is_number()) {
        return Result<Value>::ok(Value::boolean(fn(a.as_number(), b.as_number())));
    }
    return runtime_error(at, "can only compare numbers");
}

Result<Value> add(const Expr& at, const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        return Result<Value>::ok(Value::number(a.as_number() + b.as_number()));
    }
    if (a.is_string() && b.is_string()) {
        return Result<Value>::ok(Value::string(a.as_string() + b.as_string()));
    }
    return runtime_error(at, "can only add numbers or strings");
}

Result<Value> eval_binary(const Expr& expr, const Environment& env) {
    auto lhs = evaluate(*expr.left, env);
    LOX_TRY(lhs);
    auto rhs = evaluate(*expr.right, env);
    LOX_TRY(rhs);

    const Value& a = lhs.value();
    const Value& b = rhs.value();

    switch (expr.binary_op) {
    case BinaryOp::Eq:
        return Result<Value>::ok(Value::boolean(a == b));
    case BinaryOp::Neq:
        return Result<Value>::ok(Value::boolean(a != b));

    case BinaryOp::Gt:
        return compare(expr, a, b, [](float x, float y) { return x > y; });
    case BinaryOp::GtEq:
        return compare(expr, a, b, [](float x, float y) { return x >= y; });
    case BinaryOp::Lt:
        return compare(expr, a, b, [](float x, float y) { return x < y; });
    case BinaryOp::LtEq:
        return compare(expr, a, b, [](float x, float y) { return x <= y; });

    case BinaryOp::Add:
        return add(expr, a, b);
    case BinaryOp::Sub:
        return numeric(expr, a, b, "subtract", [](float x, float y) { return x - y; });
    case BinaryOp::Div:
        return numeric(expr, a, b, "divide", [](float x, float y) { return x / y; });
    case BinaryOp::Mult:
        return numeric(expr, a, b, "multiply", [](float x, float y) { return x * y; });
    }
    return runtime_error(expr, "unknown binary operator");
}

Result<Value> eval_unary(const Expr& expr, const Environment& env) {
    auto operand = evaluate(expr.operand(), env);
    LOX_TRY(operand);
    const Value& v = operand.value();

    switch (expr.unary_op) {
    case UnaryOp::Negative:
        if (v.is_number()) return Result<Value>::ok(Value::number(-v.as_number()));
        return runtime_error(expr, "- can only be applied to numbers");
    case UnaryOp::Inverse:
        if (v.is_boolean()) return Result<Value>::ok(Value::boolean(!v.as_boolean()));
        return runtime_error(expr, "! can only be applied to booleans");
    }
    return runtime_error(expr, "unknown unary operator");
}

} // anonymous namespace

Result<Value> evaluate(const Expr& expr, const Environment& env) {
    switch (expr.kind) {
    case ExprKind::Binary:
        return eval_binary(expr, env);
    case ExprKind::Unary:
        return eval_unary(expr, env);
    case ExprKind::Number:
        return Result<Value>::ok(Value::number(expr.number));
    case ExprKind::String:
        return Result<Value>::ok(Value::string(expr.text));
    case ExprKind::True:
        return Result<Value>::ok(Value::boolean(true));
    case ExprKind::False:
        return Result<Value>::ok(Value::boolean(false));
    case ExprKind::Nil:
        return Result<Value>::ok(Value::nil());
    case ExprKind::Identifier: {
        const Value* v = env.lookup(expr.text);
        if (!v) {
            return runtime_error(expr, "undefined variable '" + expr.text + "'");
        }
        return Result<Value>::ok(*v);
    }
    }
    return runtime_error(expr, "unknown expression");
}

// ---------------------------------------------------------------------------
// Interpreter
// ---------------------------------------------------------------------------

Interpreter::Interpreter(std::ostream& out) : out_(out) {}

Status Interpreter::execute(const Program& program) {
    for (const auto& decl : program) {
        LOX_TRY(execute(decl));
    }
    return ok_status();
}

Status Interpreter::execute(const Decl& decl) {
    if (debug_ast_) {
        out_ << pretty(decl);
    }

    auto value = evaluate(*decl.expr, env_);
    if (value.is_err()) {
        log::debug("runtime error on line %d, aborting", decl.line);
        return std::move(value).error();
    }

    switch (decl.kind) {
    case DeclKind::Var:
        log::trace("line %d: define %s", decl.line, decl.name->text.c_str());
        env_.define(decl.name->text, std::move(value).value());
        break;
    case DeclKind::PrintStmt:
        log::trace("line %d: print", decl.line);
        out_ << value.value().to_string() << "\n";
        break;
    case DeclKind::ExprStmt:
        log::trace("line %d: expression discarded", decl.line);
        break;
    }
    return ok_status();
}

} // namespace lox
