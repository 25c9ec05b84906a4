/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "SyntaxTree.h"

#include <cassert>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/functional/hash.hpp>

#include <QHash>

QString kindName(SyntaxKind kind)
{
    switch(kind)
    {
        case SyntaxKind::Leaf:
            return QStringLiteral("Leaf");
        case SyntaxKind::Indexed:
            return QStringLiteral("Indexed");
        case SyntaxKind::Fixed:
            return QStringLiteral("Fixed");
        case SyntaxKind::Keyed:
            return QStringLiteral("Keyed");
        case SyntaxKind::FunctionCall:
            return QStringLiteral("FunctionCall");
        case SyntaxKind::Function:
            return QStringLiteral("Function");
        case SyntaxKind::Assignment:
            return QStringLiteral("Assignment");
        case SyntaxKind::MemberAccess:
            return QStringLiteral("MemberAccess");
        case SyntaxKind::MethodCall:
            return QStringLiteral("MethodCall");
        case SyntaxKind::Args:
            return QStringLiteral("Args");
        case SyntaxKind::If:
            return QStringLiteral("If");
        case SyntaxKind::Operator:
            return QStringLiteral("Operator");
        case SyntaxKind::Comment:
            return QStringLiteral("Comment");
        case SyntaxKind::Pair:
            return QStringLiteral("Pair");
        case SyntaxKind::Switch:
            return QStringLiteral("Switch");
        case SyntaxKind::Case:
            return QStringLiteral("Case");
        case SyntaxKind::While:
            return QStringLiteral("While");
        case SyntaxKind::Return:
            return QStringLiteral("Return");
        case SyntaxKind::Yield:
            return QStringLiteral("Yield");
        case SyntaxKind::Throw:
            return QStringLiteral("Throw");
        case SyntaxKind::Break:
            return QStringLiteral("Break");
        case SyntaxKind::Continue:
            return QStringLiteral("Continue");
        case SyntaxKind::ParseError:
            return QStringLiteral("ParseError");
        case SyntaxKind::Count:
            break;
    }

    assert(false);
    return QString();
}

namespace {

class ChildGroupBuilder
{
  public:
    explicit ChildGroupBuilder(std::vector<ChildGroup>& groups): mGroups(groups) {}

    void operator()(const Syntax::Leaf&) const {}
    void operator()(const Syntax::Indexed& s) const { sequence(s.children); }
    void operator()(const Syntax::Fixed& s) const { positionalList(s.children); }
    void operator()(const Syntax::Keyed& s) const
    {
        ChildGroup group;
        group.alignment = ChildAlignment::Keyed;
        for(const auto& entry: s.entries)
        {
            group.keys.append(entry.first);
            group.nodes.push_back(entry.second.get());
        }
        mGroups.push_back(std::move(group));
    }
    void operator()(const Syntax::FunctionCall& s) const
    {
        positional({s.function.get()});
        sequence(s.arguments);
    }
    void operator()(const Syntax::Function& s) const { positional({s.id.get(), s.params.get(), s.body.get()}); }
    void operator()(const Syntax::Assignment& s) const { positional({s.target.get(), s.value.get()}); }
    void operator()(const Syntax::MemberAccess& s) const { positional({s.object.get(), s.property.get()}); }
    void operator()(const Syntax::MethodCall& s) const
    {
        positional({s.target.get(), s.method.get()});
        sequence(s.arguments);
    }
    void operator()(const Syntax::Args& s) const { sequence(s.arguments); }
    void operator()(const Syntax::If& s) const
    {
        positional({s.condition.get()});
        sequence(s.branches);
    }
    void operator()(const Syntax::Operator& s) const { positionalList(s.operands); }
    void operator()(const Syntax::Comment&) const {}
    void operator()(const Syntax::Pair& s) const { positional({s.key.get(), s.value.get()}); }
    void operator()(const Syntax::Switch& s) const
    {
        positional({s.expression.get()});
        sequence(s.cases);
    }
    void operator()(const Syntax::Case& s) const
    {
        positional({s.expression.get()});
        sequence(s.body);
    }
    void operator()(const Syntax::While& s) const
    {
        positional({s.condition.get()});
        sequence(s.body);
    }
    void operator()(const Syntax::Return& s) const { sequence(s.values); }
    void operator()(const Syntax::Yield& s) const { sequence(s.values); }
    void operator()(const Syntax::Throw& s) const { positional({s.expression.get()}); }
    void operator()(const Syntax::Break& s) const { positional({s.label.get()}); }
    void operator()(const Syntax::Continue& s) const { positional({s.label.get()}); }
    void operator()(const Syntax::ParseError& s) const { sequence(s.children); }

  private:
    void positional(std::vector<const SyntaxNode*>&& slots) const
    {
        ChildGroup group;
        group.alignment = ChildAlignment::Positional;
        group.nodes = std::move(slots);
        mGroups.push_back(std::move(group));
    }

    void positionalList(const SyntaxNodeList& list) const
    {
        std::vector<const SyntaxNode*> slots;
        for(const SyntaxNodePtr& child: list)
            slots.push_back(child.get());
        positional(std::move(slots));
    }

    void sequence(const SyntaxNodeList& list) const
    {
        ChildGroup group;
        group.alignment = ChildAlignment::Sequence;
        for(const SyntaxNodePtr& child: list)
        {
            if(child != nullptr)
                group.nodes.push_back(child.get());
        }
        mGroups.push_back(std::move(group));
    }

    std::vector<ChildGroup>& mGroups;
};

using Transform = std::function<SyntaxNodePtr(const SyntaxNode&)>;

class RebuildVisitor
{
  public:
    explicit RebuildVisitor(const Transform& transform): mTransform(transform) {}

    SyntaxVariant operator()(const Syntax::Leaf& s) const { return Syntax::Leaf{s.text}; }
    SyntaxVariant operator()(const Syntax::Indexed& s) const { return Syntax::Indexed{list(s.children)}; }
    SyntaxVariant operator()(const Syntax::Fixed& s) const { return Syntax::Fixed{list(s.children)}; }
    SyntaxVariant operator()(const Syntax::Keyed& s) const
    {
        Syntax::Keyed result;
        for(const auto& entry: s.entries)
            result.entries.emplace_back(entry.first, one(entry.second));
        return SyntaxVariant(std::move(result));
    }
    SyntaxVariant operator()(const Syntax::FunctionCall& s) const { return Syntax::FunctionCall{one(s.function), list(s.arguments)}; }
    SyntaxVariant operator()(const Syntax::Function& s) const { return Syntax::Function{one(s.id), one(s.params), one(s.body)}; }
    SyntaxVariant operator()(const Syntax::Assignment& s) const { return Syntax::Assignment{one(s.target), one(s.value)}; }
    SyntaxVariant operator()(const Syntax::MemberAccess& s) const { return Syntax::MemberAccess{one(s.object), one(s.property)}; }
    SyntaxVariant operator()(const Syntax::MethodCall& s) const { return Syntax::MethodCall{one(s.target), one(s.method), list(s.arguments)}; }
    SyntaxVariant operator()(const Syntax::Args& s) const { return Syntax::Args{list(s.arguments)}; }
    SyntaxVariant operator()(const Syntax::If& s) const { return Syntax::If{one(s.condition), list(s.branches)}; }
    SyntaxVariant operator()(const Syntax::Operator& s) const { return Syntax::Operator{list(s.operands)}; }
    SyntaxVariant operator()(const Syntax::Comment& s) const { return Syntax::Comment{s.text}; }
    SyntaxVariant operator()(const Syntax::Pair& s) const { return Syntax::Pair{one(s.key), one(s.value)}; }
    SyntaxVariant operator()(const Syntax::Switch& s) const { return Syntax::Switch{one(s.expression), list(s.cases)}; }
    SyntaxVariant operator()(const Syntax::Case& s) const { return Syntax::Case{one(s.expression), list(s.body)}; }
    SyntaxVariant operator()(const Syntax::While& s) const { return Syntax::While{one(s.condition), list(s.body)}; }
    SyntaxVariant operator()(const Syntax::Return& s) const { return Syntax::Return{list(s.values)}; }
    SyntaxVariant operator()(const Syntax::Yield& s) const { return Syntax::Yield{list(s.values)}; }
    SyntaxVariant operator()(const Syntax::Throw& s) const { return Syntax::Throw{one(s.expression)}; }
    SyntaxVariant operator()(const Syntax::Break& s) const { return Syntax::Break{one(s.label)}; }
    SyntaxVariant operator()(const Syntax::Continue& s) const { return Syntax::Continue{one(s.label)}; }
    SyntaxVariant operator()(const Syntax::ParseError& s) const { return Syntax::ParseError{list(s.children)}; }

  private:
    SyntaxNodePtr one(const SyntaxNodePtr& child) const
    {
        if(child == nullptr)
            return nullptr;
        return mTransform(*child);
    }

    SyntaxNodeList list(const SyntaxNodeList& children) const
    {
        SyntaxNodeList result;
        result.reserve(children.size());
        for(const SyntaxNodePtr& child: children)
            result.push_back(one(child));
        return result;
    }

    const Transform& mTransform;
};

/*
    Moves every present child out of a node, leaving the node childless. Used so that
    freeing a deep tree walks an explicit list instead of nesting destructor calls.
*/
class ChildDetacher
{
  public:
    explicit ChildDetacher(std::vector<SyntaxNodePtr>& detached): mDetached(detached) {}

    void operator()(Syntax::Leaf&) const {}
    void operator()(Syntax::Indexed& s) const { take(s.children); }
    void operator()(Syntax::Fixed& s) const { take(s.children); }
    void operator()(Syntax::Keyed& s) const
    {
        for(auto& entry: s.entries)
            take(entry.second);
    }
    void operator()(Syntax::FunctionCall& s) const
    {
        take(s.function);
        take(s.arguments);
    }
    void operator()(Syntax::Function& s) const
    {
        take(s.id);
        take(s.params);
        take(s.body);
    }
    void operator()(Syntax::Assignment& s) const
    {
        take(s.target);
        take(s.value);
    }
    void operator()(Syntax::MemberAccess& s) const
    {
        take(s.object);
        take(s.property);
    }
    void operator()(Syntax::MethodCall& s) const
    {
        take(s.target);
        take(s.method);
        take(s.arguments);
    }
    void operator()(Syntax::Args& s) const { take(s.arguments); }
    void operator()(Syntax::If& s) const
    {
        take(s.condition);
        take(s.branches);
    }
    void operator()(Syntax::Operator& s) const { take(s.operands); }
    void operator()(Syntax::Comment&) const {}
    void operator()(Syntax::Pair& s) const
    {
        take(s.key);
        take(s.value);
    }
    void operator()(Syntax::Switch& s) const
    {
        take(s.expression);
        take(s.cases);
    }
    void operator()(Syntax::Case& s) const
    {
        take(s.expression);
        take(s.body);
    }
    void operator()(Syntax::While& s) const
    {
        take(s.condition);
        take(s.body);
    }
    void operator()(Syntax::Return& s) const { take(s.values); }
    void operator()(Syntax::Yield& s) const { take(s.values); }
    void operator()(Syntax::Throw& s) const { take(s.expression); }
    void operator()(Syntax::Break& s) const { take(s.label); }
    void operator()(Syntax::Continue& s) const { take(s.label); }
    void operator()(Syntax::ParseError& s) const { take(s.children); }

  private:
    void take(SyntaxNodePtr& child) const
    {
        if(child != nullptr)
            mDetached.push_back(std::move(child));
    }

    void take(SyntaxNodeList& children) const
    {
        for(SyntaxNodePtr& child: children)
            take(child);
        children.clear();
    }

    std::vector<SyntaxNodePtr>& mDetached;
};

QStringList keysOf(const SyntaxNode& node)
{
    QStringList keys;
    if(const Syntax::Keyed* keyed = std::get_if<Syntax::Keyed>(&node.syntax()))
    {
        for(const auto& entry: keyed->entries)
            keys.append(entry.first);
    }
    return keys;
}

} // namespace

SyntaxNode::SyntaxNode(const Annotation& annotation, SyntaxVariant&& syntax):
    mAnnotation(annotation), mSyntax(std::move(syntax))
{
}

SyntaxNode::~SyntaxNode()
{
    if(mSyntax.valueless_by_exception())
        return;

    std::vector<SyntaxNodePtr> detached;
    std::visit(ChildDetacher(detached), mSyntax);
    while(!detached.empty())
    {
        //Each node is childless by the time it is destroyed.
        SyntaxNodePtr node = std::move(detached.back());
        detached.pop_back();
        std::visit(ChildDetacher(detached), node->mSyntax);
    }
}

QString SyntaxNode::text() const
{
    if(const Syntax::Leaf* leaf = std::get_if<Syntax::Leaf>(&mSyntax))
        return leaf->text;
    if(const Syntax::Comment* comment = std::get_if<Syntax::Comment>(&mSyntax))
        return comment->text;

    return QString();
}

std::vector<const SyntaxNode*> SyntaxNode::children() const
{
    std::vector<const SyntaxNode*> result;
    forEachChild([&result](const SyntaxNode& child) { result.push_back(&child); });
    return result;
}

qint32 SyntaxNode::childCount() const
{
    qint32 count = 0;
    forEachChild([&count](const SyntaxNode&) { ++count; });
    return count;
}

std::vector<ChildGroup> SyntaxNode::childGroups() const
{
    std::vector<ChildGroup> groups;
    std::visit(ChildGroupBuilder(groups), mSyntax);
    return groups;
}

SyntaxNodePtr SyntaxNode::rebuild(const std::function<SyntaxNodePtr(const SyntaxNode&)>& transform) const
{
    return std::make_unique<SyntaxNode>(mAnnotation, std::visit(RebuildVisitor(transform), mSyntax));
}

SyntaxNodePtr SyntaxNode::clone() const
{
    //Post-order with an explicit stack, so children are cloned before their parent.
    std::unordered_map<const SyntaxNode*, SyntaxNodePtr> cloned;
    std::vector<std::pair<const SyntaxNode*, bool>> stack;
    stack.emplace_back(this, false);

    while(!stack.empty())
    {
        const SyntaxNode* node = stack.back().first;
        if(!stack.back().second)
        {
            stack.back().second = true;
            node->forEachChild([&stack](const SyntaxNode& child) { stack.emplace_back(&child, false); });
            continue;
        }
        stack.pop_back();

        cloned[node] = node->rebuild([&cloned](const SyntaxNode& child) {
            const auto it = cloned.find(&child);
            assert(it != cloned.end());
            SyntaxNodePtr copy = std::move(it->second);
            cloned.erase(it);
            return copy;
        });
    }

    return std::move(cloned[this]);
}

bool SyntaxNode::sameLabel(const SyntaxNode& other) const
{
    if(kind() != other.kind() || category() != other.category())
        return false;
    if(text() != other.text())
        return false;

    return keysOf(*this) == keysOf(other);
}

std::size_t SyntaxNode::labelHash() const
{
    std::size_t seed = 0;

    boost::hash_combine(seed, static_cast<int>(kind()));
    boost::hash_combine(seed, static_cast<int>(category()));
    boost::hash_combine(seed, qHash(text(), 0));
    for(const QString& key: keysOf(*this))
        boost::hash_combine(seed, qHash(key, 0));

    return seed;
}

bool SyntaxNode::equals(const SyntaxNode& other, bool compareAnnotations) const
{
    std::vector<std::pair<const SyntaxNode*, const SyntaxNode*>> pending;
    pending.emplace_back(this, &other);

    while(!pending.empty())
    {
        const SyntaxNode* a = pending.back().first;
        const SyntaxNode* b = pending.back().second;
        pending.pop_back();

        if(!a->sameLabel(*b))
            return false;
        if(compareAnnotations && a->annotation() != b->annotation())
            return false;

        const std::vector<ChildGroup> groupsA = a->childGroups();
        const std::vector<ChildGroup> groupsB = b->childGroups();
        // Same kind implies the same number of groups.
        assert(groupsA.size() == groupsB.size());

        for(size_t g = 0; g < groupsA.size(); ++g)
        {
            const std::vector<const SyntaxNode*>& nodesA = groupsA[g].nodes;
            const std::vector<const SyntaxNode*>& nodesB = groupsB[g].nodes;
            if(nodesA.size() != nodesB.size())
                return false;

            for(size_t i = 0; i < nodesA.size(); ++i)
            {
                if((nodesA[i] == nullptr) != (nodesB[i] == nullptr))
                    return false;
                if(nodesA[i] != nullptr)
                    pending.emplace_back(nodesA[i], nodesB[i]);
            }
        }
    }

    return true;
}
