/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TREEFIXTURES_H
#define TREEFIXTURES_H

#include "../SyntaxTree.h"

#include <utility>

#include <QRandomGenerator>
#include <QString>
#include <QStringList>

namespace TreeFixtures {

inline Annotation annotate(Category category, qint64 start = 0, qint64 end = 0)
{
    return Annotation(ByteRange{start, end}, SourceSpan(), category);
}

template <typename... Nodes>
SyntaxNodeList list(Nodes&&... nodes)
{
    SyntaxNodeList result;
    (result.push_back(std::forward<Nodes>(nodes)), ...);
    return result;
}

inline SyntaxNodePtr leaf(const QString& text, Category category = Category::Identifier)
{
    return SyntaxNode::create(annotate(category), Syntax::Leaf{text});
}

inline SyntaxNodePtr comment(const QString& text)
{
    return SyntaxNode::create(annotate(Category::Comment), Syntax::Comment{text});
}

inline SyntaxNodePtr fixed(Category category, SyntaxNodeList&& children)
{
    return SyntaxNode::create(annotate(category), Syntax::Fixed{std::move(children)});
}

inline SyntaxNodePtr indexed(Category category, SyntaxNodeList&& children)
{
    return SyntaxNode::create(annotate(category), Syntax::Indexed{std::move(children)});
}

inline SyntaxNodePtr program(SyntaxNodeList&& statements)
{
    return indexed(Category::Program, std::move(statements));
}

// lhs + rhs
inline SyntaxNodePtr binary(const QString& lhs, const QString& rhs)
{
    return fixed(Category::MathOperator, list(leaf(lhs), leaf(rhs)));
}

inline SyntaxNodePtr call(const QString& callee, SyntaxNodeList&& arguments)
{
    return SyntaxNode::create(annotate(Category::FunctionCall), Syntax::FunctionCall{leaf(callee), std::move(arguments)});
}

inline SyntaxNodePtr parseError(SyntaxNodeList&& recovered)
{
    return SyntaxNode::create(annotate(Category::ParseError), Syntax::ParseError{std::move(recovered)});
}

inline SyntaxNodePtr object(const QStringList& keys, const QStringList& values)
{
    Syntax::Keyed keyed;
    for(qint32 i = 0; i < keys.size(); ++i)
        keyed.entries.emplace_back(keys[i], leaf(values[i], Category::StringLiteral));
    return SyntaxNode::create(annotate(Category::Object), std::move(keyed));
}

// Nested Return nodes, built without recursion.
inline SyntaxNodePtr chain(qint32 depth)
{
    SyntaxNodePtr node = leaf(QStringLiteral("x"));
    for(qint32 i = 0; i < depth; ++i)
        node = SyntaxNode::create(annotate(Category::Return), Syntax::Return{list(std::move(node))});
    return node;
}

inline QString randomText(QRandomGenerator& rng)
{
    static const char* const texts[] = {"a", "b", "c", "x", "y", "1", "2", "foo"};
    return QString::fromLatin1(texts[rng.bounded(8)]);
}

inline SyntaxNodeList randomList(QRandomGenerator& rng, qint32 depth, qint32 maxLength);

inline SyntaxNodePtr randomTree(QRandomGenerator& rng, qint32 depth)
{
    if(depth <= 0)
        return leaf(randomText(rng), rng.bounded(4) == 0 ? Category::IntegerLiteral : Category::Identifier);

    switch(rng.bounded(9))
    {
        case 0:
        case 1:
            return leaf(randomText(rng), rng.bounded(4) == 0 ? Category::IntegerLiteral : Category::Identifier);
        case 2:
            return indexed(Category::ExpressionStatements, randomList(rng, depth - 1, 4));
        case 3:
        {
            static const Category operators[] = {Category::MathOperator, Category::BooleanOperator, Category::RelationalOperator};
            return fixed(operators[rng.bounded(3)], list(randomTree(rng, depth - 1), randomTree(rng, depth - 1)));
        }
        case 4:
            return call(randomText(rng), randomList(rng, depth - 1, 3));
        case 5:
            return SyntaxNode::create(annotate(Category::If), Syntax::If{randomTree(rng, depth - 1), randomList(rng, depth - 1, 2)});
        case 6:
        {
            Syntax::Keyed keyed;
            const qint32 count = rng.bounded(3);
            for(qint32 i = 0; i < count; ++i)
                keyed.entries.emplace_back(QStringLiteral("k%1").arg(i), randomTree(rng, depth - 1));
            return SyntaxNode::create(annotate(Category::Object), std::move(keyed));
        }
        case 7:
            return SyntaxNode::create(annotate(Category::Function),
                                      Syntax::Function{rng.bounded(2) == 0 ? nullptr : leaf(randomText(rng)), nullptr, randomTree(rng, depth - 1)});
        default:
            return parseError(randomList(rng, depth - 1, 2));
    }
}

inline SyntaxNodeList randomList(QRandomGenerator& rng, qint32 depth, qint32 maxLength)
{
    SyntaxNodeList result;
    const qint32 length = rng.bounded(maxLength + 1);
    for(qint32 i = 0; i < length; ++i)
        result.push_back(randomTree(rng, depth));
    return result;
}

inline SyntaxNodePtr randomProgram(QRandomGenerator& rng, qint32 depth = 4)
{
    return program(randomList(rng, depth, 6));
}

/*
    Returns an edited copy: renames some leaves, replaces some subtrees and, inside
    statement lists, drops, inserts and swaps entries.
*/
inline SyntaxNodePtr mutate(const SyntaxNode& node, QRandomGenerator& rng)
{
    if(node.kind() == SyntaxKind::Leaf)
    {
        if(rng.bounded(5) == 0)
            return leaf(randomText(rng), node.category());
        return node.clone();
    }

    if(rng.bounded(12) == 0)
        return randomTree(rng, 2);

    if(const Syntax::Indexed* statements = std::get_if<Syntax::Indexed>(&node.syntax()))
    {
        SyntaxNodeList children;
        for(const SyntaxNodePtr& child: statements->children)
        {
            const quint32 roll = rng.bounded(10);
            if(roll == 0)
                continue;
            if(roll == 1)
                children.push_back(randomTree(rng, 2));
            children.push_back(mutate(*child, rng));
        }
        if(children.size() >= 2 && rng.bounded(3) == 0)
            std::swap(children.front(), children.back());
        return SyntaxNode::create(node.annotation(), Syntax::Indexed{std::move(children)});
    }

    return node.rebuild([&rng](const SyntaxNode& child) { return mutate(child, rng); });
}

} // namespace TreeFixtures

#endif // !TREEFIXTURES_H
