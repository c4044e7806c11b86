#pragma once

#include "shaderplus/expression.hpp"
#include "shaderplus/result.hpp"

#include <string_view>

namespace shaderplus
{
    // Parses a single expression. All whitespace is discarded before scanning,
    // so spacing inside an expression is free-form ("B IT_1" reads as "BIT_1").
    //
    //   expr    := term ( binop expr )?
    //   term    := ('-' | '!' | '~') term
    //            | '(' expr ')'
    //            | NUMBER | 'true' | 'false' | IDENT
    //   binop   := '+' | '-' | '*' | '/' | '&' | '|' | '&&' | '||'
    //            | '<' | '<=' | '>' | '>=' | '==' | '!='
    //
    // There is no operator precedence: the right-hand side of every binary
    // operator is the whole remaining expression, so "a - b - c" is
    // "a - (b - c)" and "a * b + c" is "a * (b + c)". Unary operators bind
    // to a single term. Use parentheses to group explicitly.
    //
    // NUMBER: decimal digits with at most one '.', or an integer with a
    // 0b / 0o / 0x prefix; '_' separators are ignored.
    //
    // The whole input must be consumed (eLeftoverChars otherwise).
    Result<Expression> parse_expression(std::string_view source);
} // namespace shaderplus
