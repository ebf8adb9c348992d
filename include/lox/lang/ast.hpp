#pragma once

#include <memory>
#include <string>
#include <vector>

namespace lox {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class BinaryOp {
    Eq,
    Neq,
    Gt,
    GtEq,
    Lt,
    LtEq,
    Add,
    Sub,
    Div,
    Mult
};

enum class UnaryOp {
    Negative,   // -x
    Inverse     // !x
};

enum class ExprKind {
    Binary,
    Unary,
    Number,
    String,
    Identifier,
    True,
    False,
    Nil
};

const char* binary_op_symbol(BinaryOp op);
const char* unary_op_symbol(UnaryOp op);

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

// Immutable once built. `line` is the line of the node's leftmost token.
struct Expr {
    ExprKind kind = ExprKind::Nil;
    int line = 0;

    BinaryOp binary_op = BinaryOp::Eq;  // Binary
    UnaryOp unary_op = UnaryOp::Negative; // Unary
    float number = 0.0f;                // Number
    std::string text;                   // String, Identifier
    ExprPtr left;                       // Binary lhs, Unary operand
    ExprPtr right;                      // Binary rhs

    static ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs, int line);
    static ExprPtr unary(UnaryOp op, ExprPtr operand, int line);
    static ExprPtr number_literal(float n, int line);
    static ExprPtr string_literal(std::string s, int line);
    static ExprPtr identifier(std::string name, int line);
    static ExprPtr boolean(bool b, int line);
    static ExprPtr nil(int line);

    const Expr& operand() const { return *left; }
};

// Same shape and payloads; line numbers are ignored
bool structurally_equal(const Expr& a, const Expr& b);

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

enum class DeclKind {
    Var,        // var NAME = init;
    ExprStmt,   // expr;
    PrintStmt   // print expr;
};

struct Decl {
    DeclKind kind = DeclKind::ExprStmt;
    int line = 0;
    ExprPtr name;   // Var only: an Identifier expression
    ExprPtr expr;   // initializer for Var, inner expression for statements

    static Decl var(ExprPtr name, ExprPtr init, int line);
    static Decl expression(ExprPtr e, int line);
    static Decl print(ExprPtr e, int line);

    bool is_statement() const { return kind != DeclKind::Var; }
};

bool structurally_equal(const Decl& a, const Decl& b);

using Program = std::vector<Decl>;

} // namespace lox
