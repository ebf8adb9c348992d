#include <lox/lang/ast.hpp>

namespace lox {

const char* binary_op_symbol(BinaryOp op) {
    switch (op) {
    case BinaryOp::Eq:   return "==";
    case BinaryOp::Neq:  return "!=";
    case BinaryOp::Gt:   return ">";
    case BinaryOp::GtEq: return ">=";
    case BinaryOp::Lt:   return "<";
    case BinaryOp::LtEq: return "<=";
    case BinaryOp::Add:  return "+";
    case BinaryOp::Sub:  return "-";
    case BinaryOp::Div:  return "/";
    case BinaryOp::Mult: return "*";
    }
    return "?";
}

const char* unary_op_symbol(UnaryOp op) {
    switch (op) {
    case UnaryOp::Negative: return "-";
    case UnaryOp::Inverse:  return "!";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Expression factories
// ---------------------------------------------------------------------------

static ExprPtr make(ExprKind kind, int line) {
    auto e = std::make_unique<Expr>();
    e->kind = kind;
    e->line = line;
    return e;
}

ExprPtr Expr::binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs, int line) {
    auto e = make(ExprKind::Binary, line);
    e->binary_op = op;
    e->left = std::move(lhs);
    e->right = std::move(rhs);
    return e;
}

ExprPtr Expr::unary(UnaryOp op, ExprPtr operand, int line) {
    auto e = make(ExprKind::Unary, line);
    e->unary_op = op;
    e->left = std::move(operand);
    return e;
}

ExprPtr Expr::number_literal(float n, int line) {
    auto e = make(ExprKind::Number, line);
    e->number = n;
    return e;
}

ExprPtr Expr::string_literal(std::string s, int line) {
    auto e = make(ExprKind::String, line);
    e->text = std::move(s);
    return e;
}

ExprPtr Expr::identifier(std::string name, int line) {
    auto e = make(ExprKind::Identifier, line);
    e->text = std::move(name);
    return e;
}

ExprPtr Expr::boolean(bool b, int line) {
    return make(b ? ExprKind::True : ExprKind::False, line);
}

ExprPtr Expr::nil(int line) {
    return make(ExprKind::Nil, line);
}

bool structurally_equal(const Expr& a, const Expr& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
    case ExprKind::Binary:
        return a.binary_op == b.binary_op &&
               structurally_equal(*a.left, *b.left) &&
               structurally_equal(*a.right, *b.right);
    case ExprKind::Unary:
        return a.unary_op == b.unary_op &&
               structurally_equal(*a.left, *b.left);
    case ExprKind::Number:
        return a.number == b.number;
    case ExprKind::String:
    case ExprKind::Identifier:
        return a.text == b.text;
    case ExprKind::True:
    case ExprKind::False:
    case ExprKind::Nil:
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

Decl Decl::var(ExprPtr name, ExprPtr init, int line) {
    Decl d;
    d.kind = DeclKind::Var;
    d.line = line;
    d.name = std::move(name);
    d.expr = std::move(init);
    return d;
}

Decl Decl::expression(ExprPtr e, int line) {
    Decl d;
    d.kind = DeclKind::ExprStmt;
    d.line = line;
    d.expr = std::move(e);
    return d;
}

Decl Decl::print(ExprPtr e, int line) {
    Decl d;
    d.kind = DeclKind::PrintStmt;
    d.line = line;
    d.expr = std::move(e);
    return d;
}

bool structurally_equal(const Decl& a, const Decl& b) {
    if (a.kind != b.kind) return false;
    if (a.kind == DeclKind::Var && !structurally_equal(*a.name, *b.name)) {
        return false;
    }
    return structurally_equal(*a.expr, *b.expr);
}

} // namespace lox
