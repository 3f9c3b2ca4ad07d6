#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case eof:
            return ostream << "eof";
        case asterisk:
            return ostream << "*";
        case colon:
            return ostream << ":";
        case comma:
            return ostream << ",";
        case dot:
            return ostream << ".";
        case lparen:
            return ostream << "(";
        case lsquirly:
            return ostream << "{";
        case minus:
            return ostream << "-";
        case plus:
            return ostream << "+";
        case question:
            return ostream << "?";
        case rparen:
            return ostream << ")";
        case rsquirly:
            return ostream << "}";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case assign:
            return ostream << "=";
        case equals:
            return ostream << "==";
        case exclamation:
            return ostream << "!";
        case not_equals:
            return ostream << "!=";
        case greater_than:
            return ostream << ">";
        case greater_equal:
            return ostream << ">=";
        case less_than:
            return ostream << "<";
        case less_equal:
            return ostream << "<=";
        case ident:
            return ostream << "identifier";
        case number:
            return ostream << "number";
        case string:
            return ostream << "string";
        case logical_and:
            return ostream << "and";
        case klass:
            return ostream << "class";
        case elze:
            return ostream << "else";
        case fals:
            return ostream << "false";
        case fore:
            return ostream << "for";
        case fun:
            return ostream << "fun";
        case eef:
            return ostream << "if";
        case nil:
            return ostream << "nil";
        case logical_or:
            return ostream << "or";
        case print:
            return ostream << "print";
        case ret:
            return ostream << "return";
        case super:
            return ostream << "super";
        case thiz:
            return ostream << "this";
        case tru:
            return ostream << "true";
        case var:
            return ostream << "var";
        case hwile:
            return ostream << "while";
        case brake:
            return ostream << "break";
    }
    throw std::invalid_argument("invalid token_type");
}
