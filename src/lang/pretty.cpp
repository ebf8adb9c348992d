#include <lox/lang/pretty.hpp>
#include <lox/lang/value.hpp>

namespace lox {

static void line_at(std::string& out, int indent, const std::string& text) {
    out.append(static_cast<size_t>(indent), ' ');
    out += text;
    out += '\n';
}

static void render(std::string& out, const Expr& e, int indent) {
    switch (e.kind) {
    case ExprKind::Binary:
        render(out, *e.left, indent + 4);
        line_at(out, indent, binary_op_symbol(e.binary_op));
        render(out, *e.right, indent + 4);
        break;
    case ExprKind::Unary:
        line_at(out, indent, unary_op_symbol(e.unary_op));
        render(out, e.operand(), indent + 4);
        break;
    case ExprKind::Number:     line_at(out, indent, format_number(e.number)); break;
    case ExprKind::String:     line_at(out, indent, e.text); break;
    case ExprKind::Identifier: line_at(out, indent, e.text); break;
    case ExprKind::True:       line_at(out, indent, "true"); break;
    case ExprKind::False:      line_at(out, indent, "false"); break;
    case ExprKind::Nil:        line_at(out, indent, "nil"); break;
    }
}

std::string pretty(const Expr& expr, int indent) {
    std::string out;
    render(out, expr, indent);
    return out;
}

std::string pretty(const Decl& decl) {
    std::string out;
    switch (decl.kind) {
    case DeclKind::Var:
        line_at(out, 0, "var " + decl.name->text);
        render(out, *decl.expr, 4);
        break;
    case DeclKind::PrintStmt:
        line_at(out, 0, "print");
        render(out, *decl.expr, 4);
        break;
    case DeclKind::ExprStmt:
        render(out, *decl.expr, 0);
        break;
    }
    return out;
}

} // namespace lox
