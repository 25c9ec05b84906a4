/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef SYNTAXTREE_H
#define SYNTAXTREE_H

#include "Category.h"
#include "SourceSpan.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <QString>
#include <QStringList>

class SyntaxNode;

using SyntaxNodePtr = std::unique_ptr<SyntaxNode>;
using SyntaxNodeList = std::vector<SyntaxNodePtr>;

/*
    One struct per shape a node may take. Optional children are null pointers.
    Every algorithm dispatches over all of these with std::visit, adding a case here
    without handling it everywhere is a compile error.
*/
namespace Syntax {

// Identifier or literal text.
struct Leaf
{
    QString text;
};

// Variable length list, e.g. a statement list or uncurried parameters.
struct Indexed
{
    SyntaxNodeList children;
};

// Fixed arity list, e.g. a binary operator and its operands.
struct Fixed
{
    SyntaxNodeList children;
};

// Children addressed by name, e.g. members of a class scope. Insertion order is kept.
struct Keyed
{
    std::vector<std::pair<QString, SyntaxNodePtr>> entries;
};

struct FunctionCall
{
    SyntaxNodePtr function;
    SyntaxNodeList arguments;
};

struct Function
{
    SyntaxNodePtr id;     // optional
    SyntaxNodePtr params; // optional
    SyntaxNodePtr body;
};

struct Assignment
{
    SyntaxNodePtr target;
    SyntaxNodePtr value;
};

// x.y
struct MemberAccess
{
    SyntaxNodePtr object;
    SyntaxNodePtr property;
};

// console.log('hello')
struct MethodCall
{
    SyntaxNodePtr target;
    SyntaxNodePtr method;
    SyntaxNodeList arguments;
};

struct Args
{
    SyntaxNodeList arguments;
};

struct If
{
    SyntaxNodePtr condition;
    SyntaxNodeList branches;
};

struct Operator
{
    SyntaxNodeList operands;
};

struct Comment
{
    QString text;
};

struct Pair
{
    SyntaxNodePtr key;
    SyntaxNodePtr value;
};

struct Switch
{
    SyntaxNodePtr expression;
    SyntaxNodeList cases;
};

struct Case
{
    SyntaxNodePtr expression;
    SyntaxNodeList body;
};

struct While
{
    SyntaxNodePtr condition;
    SyntaxNodeList body;
};

struct Return
{
    SyntaxNodeList values;
};

struct Yield
{
    SyntaxNodeList values;
};

struct Throw
{
    SyntaxNodePtr expression;
};

struct Break
{
    SyntaxNodePtr label; // optional
};

struct Continue
{
    SyntaxNodePtr label; // optional
};

// Whatever the parser managed to recover. Not fatal, matched like any other node.
struct ParseError
{
    SyntaxNodeList children;
};

} // namespace Syntax

//Order must match SyntaxKind.
using SyntaxVariant = std::variant<
    Syntax::Leaf,
    Syntax::Indexed,
    Syntax::Fixed,
    Syntax::Keyed,
    Syntax::FunctionCall,
    Syntax::Function,
    Syntax::Assignment,
    Syntax::MemberAccess,
    Syntax::MethodCall,
    Syntax::Args,
    Syntax::If,
    Syntax::Operator,
    Syntax::Comment,
    Syntax::Pair,
    Syntax::Switch,
    Syntax::Case,
    Syntax::While,
    Syntax::Return,
    Syntax::Yield,
    Syntax::Throw,
    Syntax::Break,
    Syntax::Continue,
    Syntax::ParseError>;

enum class SyntaxKind
{
    Leaf,
    Indexed,
    Fixed,
    Keyed,
    FunctionCall,
    Function,
    Assignment,
    MemberAccess,
    MethodCall,
    Args,
    If,
    Operator,
    Comment,
    Pair,
    Switch,
    Case,
    While,
    Return,
    Yield,
    Throw,
    Break,
    Continue,
    ParseError,
    Count
};

static_assert(std::variant_size<SyntaxVariant>::value == static_cast<size_t>(SyntaxKind::Count), "SyntaxKind and SyntaxVariant are out of sync.");

[[nodiscard]] QString kindName(SyntaxKind kind);

enum class ChildAlignment
{
    Positional, // pair children slot by slot
    Keyed,      // pair children with the same key
    Sequence    // pair children by best match among siblings
};

/*
    A run of children that are aligned the same way when two nodes are matched.
    Positional groups keep a nullptr for an absent optional slot so positions stay comparable.
*/
struct ChildGroup
{
    ChildAlignment alignment = ChildAlignment::Sequence;
    std::vector<const SyntaxNode*> nodes;
    QStringList keys; // Keyed groups only, parallel to nodes
};

class SyntaxNode
{
  public:
    SyntaxNode(const Annotation& annotation, SyntaxVariant&& syntax);
    ~SyntaxNode();

    SyntaxNode(SyntaxNode&&) noexcept = default;
    SyntaxNode& operator=(SyntaxNode&&) noexcept = default;

    template <typename Case>
    [[nodiscard]] static SyntaxNodePtr create(const Annotation& annotation, Case&& syntax)
    {
        return std::make_unique<SyntaxNode>(annotation, SyntaxVariant(std::forward<Case>(syntax)));
    }

    [[nodiscard]] inline const Annotation& annotation() const { return mAnnotation; }
    [[nodiscard]] inline Category category() const { return mAnnotation.category(); }
    [[nodiscard]] inline SyntaxKind kind() const { return static_cast<SyntaxKind>(mSyntax.index()); }
    [[nodiscard]] inline const SyntaxVariant& syntax() const { return mSyntax; }

    // Text of Leaf and Comment nodes, empty for every other kind.
    [[nodiscard]] QString text() const;

    // Calls f(const SyntaxNode&) once per present child in declared order.
    template <typename F>
    void forEachChild(F&& f) const;

    [[nodiscard]] std::vector<const SyntaxNode*> children() const;
    [[nodiscard]] qint32 childCount() const;
    [[nodiscard]] inline bool isLeaf() const { return childCount() == 0; }

    [[nodiscard]] std::vector<ChildGroup> childGroups() const;

    /*
        Returns a new node with this node's annotation and shape whose children are
        transform(child). Absent optional children stay absent.
    */
    [[nodiscard]] SyntaxNodePtr rebuild(const std::function<SyntaxNodePtr(const SyntaxNode&)>& transform) const;
    [[nodiscard]] SyntaxNodePtr clone() const;

    // Node local content: kind, category, text and keys. Children are not compared.
    [[nodiscard]] bool sameLabel(const SyntaxNode& other) const;
    [[nodiscard]] std::size_t labelHash() const;

    [[nodiscard]] bool equals(const SyntaxNode& other, bool compareAnnotations) const;

    bool operator==(const SyntaxNode& other) const { return equals(other, true); }
    bool operator!=(const SyntaxNode& other) const { return !(*this == other); }

  private:
    Annotation mAnnotation;
    SyntaxVariant mSyntax;

    Q_DISABLE_COPY(SyntaxNode)
};

template <typename F>
class SyntaxChildVisitor
{
  public:
    explicit SyntaxChildVisitor(F& func): mFunc(func) {}

    void operator()(const Syntax::Leaf&) const {}
    void operator()(const Syntax::Indexed& s) const { visitList(s.children); }
    void operator()(const Syntax::Fixed& s) const { visitList(s.children); }
    void operator()(const Syntax::Keyed& s) const
    {
        for(const auto& entry: s.entries)
            visit(entry.second);
    }
    void operator()(const Syntax::FunctionCall& s) const
    {
        visit(s.function);
        visitList(s.arguments);
    }
    void operator()(const Syntax::Function& s) const
    {
        visit(s.id);
        visit(s.params);
        visit(s.body);
    }
    void operator()(const Syntax::Assignment& s) const
    {
        visit(s.target);
        visit(s.value);
    }
    void operator()(const Syntax::MemberAccess& s) const
    {
        visit(s.object);
        visit(s.property);
    }
    void operator()(const Syntax::MethodCall& s) const
    {
        visit(s.target);
        visit(s.method);
        visitList(s.arguments);
    }
    void operator()(const Syntax::Args& s) const { visitList(s.arguments); }
    void operator()(const Syntax::If& s) const
    {
        visit(s.condition);
        visitList(s.branches);
    }
    void operator()(const Syntax::Operator& s) const { visitList(s.operands); }
    void operator()(const Syntax::Comment&) const {}
    void operator()(const Syntax::Pair& s) const
    {
        visit(s.key);
        visit(s.value);
    }
    void operator()(const Syntax::Switch& s) const
    {
        visit(s.expression);
        visitList(s.cases);
    }
    void operator()(const Syntax::Case& s) const
    {
        visit(s.expression);
        visitList(s.body);
    }
    void operator()(const Syntax::While& s) const
    {
        visit(s.condition);
        visitList(s.body);
    }
    void operator()(const Syntax::Return& s) const { visitList(s.values); }
    void operator()(const Syntax::Yield& s) const { visitList(s.values); }
    void operator()(const Syntax::Throw& s) const { visit(s.expression); }
    void operator()(const Syntax::Break& s) const { visit(s.label); }
    void operator()(const Syntax::Continue& s) const { visit(s.label); }
    void operator()(const Syntax::ParseError& s) const { visitList(s.children); }

  private:
    void visit(const SyntaxNodePtr& child) const
    {
        if(child != nullptr)
            mFunc(static_cast<const SyntaxNode&>(*child));
    }
    void visitList(const SyntaxNodeList& list) const
    {
        for(const SyntaxNodePtr& child: list)
            visit(child);
    }

    F& mFunc;
};

template <typename F>
void SyntaxNode::forEachChild(F&& f) const
{
    using Func = std::remove_reference_t<F>;
    std::visit(SyntaxChildVisitor<Func>(f), mSyntax);
}

#endif // !SYNTAXTREE_H
