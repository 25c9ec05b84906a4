/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Category.h"

#include <cassert>

#include <QString>
#include <QStringLiteral>

QString categoryName(Category category)
{
    switch(category)
    {
        case Category::Program:
            return QStringLiteral("Program");
        case Category::ParseError:
            return QStringLiteral("ParseError");
        case Category::Empty:
            return QStringLiteral("Empty");
        case Category::Other:
            return QStringLiteral("Other");
        case Category::Comment:
            return QStringLiteral("Comment");
        case Category::Identifier:
            return QStringLiteral("Identifier");
        case Category::Constant:
            return QStringLiteral("Constant");
        case Category::Boolean:
            return QStringLiteral("Boolean");
        case Category::IntegerLiteral:
            return QStringLiteral("IntegerLiteral");
        case Category::FloatLiteral:
            return QStringLiteral("FloatLiteral");
        case Category::NumberLiteral:
            return QStringLiteral("NumberLiteral");
        case Category::StringLiteral:
            return QStringLiteral("StringLiteral");
        case Category::SymbolLiteral:
            return QStringLiteral("SymbolLiteral");
        case Category::TemplateString:
            return QStringLiteral("TemplateString");
        case Category::Regex:
            return QStringLiteral("Regex");
        case Category::ArrayLiteral:
            return QStringLiteral("ArrayLiteral");
        case Category::DictionaryLiteral:
            return QStringLiteral("DictionaryLiteral");
        case Category::Pair:
            return QStringLiteral("Pair");
        case Category::Object:
            return QStringLiteral("Object");
        case Category::Operator:
            return QStringLiteral("Operator");
        case Category::Binary:
            return QStringLiteral("Binary");
        case Category::Unary:
            return QStringLiteral("Unary");
        case Category::BooleanOperator:
            return QStringLiteral("BooleanOperator");
        case Category::MathOperator:
            return QStringLiteral("MathOperator");
        case Category::RelationalOperator:
            return QStringLiteral("RelationalOperator");
        case Category::BitwiseOperator:
            return QStringLiteral("BitwiseOperator");
        case Category::RangeExpression:
            return QStringLiteral("RangeExpression");
        case Category::ScopeOperator:
            return QStringLiteral("ScopeOperator");
        case Category::CommaOperator:
            return QStringLiteral("CommaOperator");
        case Category::Assignment:
            return QStringLiteral("Assignment");
        case Category::MathAssignment:
            return QStringLiteral("MathAssignment");
        case Category::OperatorAssignment:
            return QStringLiteral("OperatorAssignment");
        case Category::VarAssignment:
            return QStringLiteral("VarAssignment");
        case Category::VarDecl:
            return QStringLiteral("VarDecl");
        case Category::MemberAccess:
            return QStringLiteral("MemberAccess");
        case Category::SubscriptAccess:
            return QStringLiteral("SubscriptAccess");
        case Category::FunctionCall:
            return QStringLiteral("FunctionCall");
        case Category::MethodCall:
            return QStringLiteral("MethodCall");
        case Category::Args:
            return QStringLiteral("Args");
        case Category::Params:
            return QStringLiteral("Params");
        case Category::If:
            return QStringLiteral("If");
        case Category::Else:
            return QStringLiteral("Else");
        case Category::Ternary:
            return QStringLiteral("Ternary");
        case Category::Switch:
            return QStringLiteral("Switch");
        case Category::Case:
            return QStringLiteral("Case");
        case Category::DefaultCase:
            return QStringLiteral("DefaultCase");
        case Category::While:
            return QStringLiteral("While");
        case Category::DoWhile:
            return QStringLiteral("DoWhile");
        case Category::For:
            return QStringLiteral("For");
        case Category::Return:
            return QStringLiteral("Return");
        case Category::Yield:
            return QStringLiteral("Yield");
        case Category::Throw:
            return QStringLiteral("Throw");
        case Category::Break:
            return QStringLiteral("Break");
        case Category::Continue:
            return QStringLiteral("Continue");
        case Category::Try:
            return QStringLiteral("Try");
        case Category::Catch:
            return QStringLiteral("Catch");
        case Category::Finally:
            return QStringLiteral("Finally");
        case Category::Function:
            return QStringLiteral("Function");
        case Category::Method:
            return QStringLiteral("Method");
        case Category::Class:
            return QStringLiteral("Class");
        case Category::Module:
            return QStringLiteral("Module");
        case Category::Import:
            return QStringLiteral("Import");
        case Category::Export:
            return QStringLiteral("Export");
        case Category::ExpressionStatements:
            return QStringLiteral("ExpressionStatements");
    }

    //should never get here
    assert(false);
    return QString();
}

bool isOperatorCategory(Category category)
{
    switch(category)
    {
        case Category::Operator:
        case Category::Binary:
        case Category::Unary:
        case Category::BooleanOperator:
        case Category::MathOperator:
        case Category::RelationalOperator:
        case Category::BitwiseOperator:
        case Category::RangeExpression:
        case Category::ScopeOperator:
        case Category::CommaOperator:
            return true;
        default:
            return false;
    }
}

bool categoriesCompatible(Category a, Category b)
{
    return a == b || (isOperatorCategory(a) && isOperatorCategory(b));
}
