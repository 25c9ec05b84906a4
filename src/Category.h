/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef CATEGORY_H
#define CATEGORY_H

#include <QString>

/*
    Language independent classification attached to every parsed node by the
    assignment stage. The values here are shared by all grammars, per language
    tables map grammar production names onto them.
*/
enum class Category
{
    Program,
    ParseError,
    Empty,
    Other,

    Comment,
    Identifier,
    Constant,

    Boolean,
    IntegerLiteral,
    FloatLiteral,
    NumberLiteral,
    StringLiteral,
    SymbolLiteral,
    TemplateString,
    Regex,
    ArrayLiteral,
    DictionaryLiteral,
    Pair,
    Object,

    Operator,
    Binary,
    Unary,
    BooleanOperator,
    MathOperator,
    RelationalOperator,
    BitwiseOperator,
    RangeExpression,
    ScopeOperator,
    CommaOperator,

    Assignment,
    MathAssignment,
    OperatorAssignment,
    VarAssignment,
    VarDecl,
    MemberAccess,
    SubscriptAccess,
    FunctionCall,
    MethodCall,
    Args,
    Params,

    If,
    Else,
    Ternary,
    Switch,
    Case,
    DefaultCase,
    While,
    DoWhile,
    For,
    Return,
    Yield,
    Throw,
    Break,
    Continue,
    Try,
    Catch,
    Finally,

    Function,
    Method,
    Class,
    Module,
    Import,
    Export,
    ExpressionStatements,
};

[[nodiscard]] QString categoryName(Category category);

// Binary, unary, boolean, arithmetic, relational, bitwise, range, scope and comma operators.
[[nodiscard]] bool isOperatorCategory(Category category);

/*
    Two categories are compatible when they are equal or both belong to the operator family.
    The matcher never pairs nodes with incompatible categories.
*/
[[nodiscard]] bool categoriesCompatible(Category a, Category b);

#endif // !CATEGORY_H
