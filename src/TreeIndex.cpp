/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "TreeIndex.h"

#include <unordered_map>
#include <utility>

#include <boost/functional/hash.hpp>

TreeIndex::TreeIndex(const SyntaxNode& root)
{
    struct Pending
    {
        const SyntaxNode* node;
        NodeRef parent;
        qint32 depth;
    };

    std::vector<Pending> stack;
    std::unordered_map<const SyntaxNode*, NodeRef> refOf;

    stack.push_back({&root, NodeRef(), 0});
    while(!stack.empty())
    {
        const Pending current = stack.back();
        stack.pop_back();

        const NodeRef ref = static_cast<qint64>(mEntries.size());
        Entry newEntry;
        newEntry.node = current.node;
        newEntry.parent = current.parent;
        newEntry.depth = current.depth;
        if(current.parent.isValid())
        {
            Entry& parentEntry = mEntries[current.parent];
            newEntry.indexInParent = SafeInt<qint32>(parentEntry.children.size());
            parentEntry.children.push_back(ref);
        }
        mEntries.push_back(std::move(newEntry));
        refOf[current.node] = ref;

        const std::vector<const SyntaxNode*> kids = current.node->children();
        for(auto it = kids.rbegin(); it != kids.rend(); ++it)
            stack.push_back({*it, ref, current.depth + 1});
    }

    for(Entry& e: mEntries)
    {
        for(const ChildGroup& group: e.node->childGroups())
        {
            IndexedGroup indexed;
            indexed.alignment = group.alignment;
            indexed.keys = group.keys;
            for(const SyntaxNode* child: group.nodes)
                indexed.refs.push_back(child == nullptr ? NodeRef() : refOf.at(child));
            e.groups.push_back(std::move(indexed));
        }
    }

    //Children always have larger refs than their parent.
    for(qint32 i = size() - 1; i >= 0; --i)
    {
        Entry& e = mEntries[i];
        std::size_t seed = e.node->labelHash();
        for(const IndexedGroup& group: e.groups)
        {
            boost::hash_combine(seed, group.refs.size());
            for(const NodeRef child: group.refs)
            {
                if(child.isValid())
                {
                    e.subtreeSize += mEntries[child].subtreeSize;
                    boost::hash_combine(seed, mEntries[child].contentHash);
                }
                else
                    boost::hash_combine(seed, 0);
            }
        }
        e.contentHash = seed;
    }
}

bool TreeIndex::isAncestor(const NodeRef ancestor, const NodeRef ref) const
{
    return ancestor < ref && ref < ancestor + subtreeSize(ancestor);
}

double TreeIndex::relativePosition(const NodeRef ref) const
{
    assert(contains(ref));
    if(size() <= 1)
        return 0.0;

    return static_cast<double>(ref) / static_cast<double>(size() - 1);
}

bool TreeIndex::subtreeEqual(const NodeRef ref, const TreeIndex& other, const NodeRef otherRef) const
{
    if(subtreeSize(ref) != other.subtreeSize(otherRef) || contentHash(ref) != other.contentHash(otherRef))
        return false;

    return node(ref).equals(other.node(otherRef), false);
}
