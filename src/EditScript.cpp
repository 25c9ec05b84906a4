/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "EditScript.h"

#include "Logging.h"

#include <algorithm>
#include <cassert>

QString editTypeName(EditType type)
{
    switch(type)
    {
        case EditType::Insert:
            return QStringLiteral("Insert");
        case EditType::Delete:
            return QStringLiteral("Delete");
        case EditType::Replace:
            return QStringLiteral("Replace");
        case EditType::Copy:
            return QStringLiteral("Copy");
    }

    assert(false);
    return QString();
}

qint32 EditScript::count(EditType type) const
{
    return static_cast<qint32>(std::count_if(begin(), end(), [type](const EditOperation& op) { return op.type() == type; }));
}

qint32 EditScript::movedCount() const
{
    return static_cast<qint32>(std::count_if(begin(), end(), [](const EditOperation& op) { return op.isMoved(); }));
}

namespace {

// Marks ref and every descendant reached through nodes the mapped predicate rejects.
template <typename Mapped>
void coverUnmappedRun(const TreeIndex& tree, const NodeRef ref, std::vector<qint32>& coverage, Mapped mapped)
{
    std::vector<NodeRef> stack{ref};
    while(!stack.empty())
    {
        const NodeRef current = stack.back();
        stack.pop_back();
        ++coverage[current];

        for(const NodeRef child: tree.children(current))
        {
            if(!mapped(child))
                stack.push_back(child);
        }
    }
}

} // namespace

bool EditScript::verify(const TreeIndex& oldTree, const TreeIndex& newTree, const NodeMapping& mapping) const
{
    std::vector<qint32> oldCoverage(oldTree.size(), 0);
    std::vector<qint32> newCoverage(newTree.size(), 0);

    const auto oldMapped = [&mapping](const NodeRef ref) { return mapping.hasSrc(ref); };
    const auto newMapped = [&mapping](const NodeRef ref) { return mapping.hasDst(ref); };

    for(const EditOperation& op: *this)
    {
        switch(op.type())
        {
            case EditType::Insert:
                if(!newTree.contains(op.newRef()) || mapping.hasDst(op.newRef()))
                {
                    qCWarning(ktreediffCore) << "Insert of mapped or unknown new node" << (NodeRef::RefType)op.newRef();
                    return false;
                }
                coverUnmappedRun(newTree, op.newRef(), newCoverage, newMapped);
                break;
            case EditType::Delete:
                if(!oldTree.contains(op.oldRef()) || mapping.hasSrc(op.oldRef()))
                {
                    qCWarning(ktreediffCore) << "Delete of mapped or unknown old node" << (NodeRef::RefType)op.oldRef();
                    return false;
                }
                coverUnmappedRun(oldTree, op.oldRef(), oldCoverage, oldMapped);
                break;
            case EditType::Replace:
            case EditType::Copy:
                if(!oldTree.contains(op.oldRef()) || !newTree.contains(op.newRef()) || mapping.getDst(op.oldRef()) != op.newRef())
                {
                    qCWarning(ktreediffCore) << editTypeName(op.type()) << "of unmapped pair" << (NodeRef::RefType)op.oldRef() << (NodeRef::RefType)op.newRef();
                    return false;
                }
                if(oldTree.node(op.oldRef()).sameLabel(newTree.node(op.newRef())) != (op.type() == EditType::Copy))
                {
                    qCWarning(ktreediffCore) << editTypeName(op.type()) << "does not match the labels of" << (NodeRef::RefType)op.oldRef() << (NodeRef::RefType)op.newRef();
                    return false;
                }
                ++oldCoverage[op.oldRef()];
                ++newCoverage[op.newRef()];
                break;
        }
    }

    for(qint32 i = 0; i < oldTree.size(); ++i)
    {
        if(oldCoverage[i] != 1)
        {
            qCWarning(ktreediffCore) << "Old node" << i << "is accounted for" << oldCoverage[i] << "times";
            return false;
        }
    }
    for(qint32 i = 0; i < newTree.size(); ++i)
    {
        if(newCoverage[i] != 1)
        {
            qCWarning(ktreediffCore) << "New node" << i << "is accounted for" << newCoverage[i] << "times";
            return false;
        }
    }

    return true;
}

void EditScript::dump() const
{
    qCDebug(ktreediffCore) << "---- EditScript ----" << size() << "operations";
    for(const EditOperation& op: *this)
    {
        qCDebug(ktreediffCore).nospace() << editTypeName(op.type()) << " old=" << (NodeRef::RefType)op.oldRef()
                                         << " new=" << (NodeRef::RefType)op.newRef() << (op.isMoved() ? " moved" : "");
    }
}

EditScriptBuilder::EditScriptBuilder(const TreeIndex& oldTree, const TreeIndex& newTree, const NodeMapping& mapping, bool detectMoves):
    mOldTree(oldTree), mNewTree(newTree), mMapping(mapping), mDetectMoves(detectMoves)
{
    assert(mMapping.oldSize() == mOldTree.size() && mMapping.newSize() == mNewTree.size());
}

bool EditScriptBuilder::isMoved(const NodeRef oldRef, const NodeRef newRef) const
{
    const NodeRef oldParent = mOldTree.parent(oldRef);
    const NodeRef newParent = mNewTree.parent(newRef);

    if(!oldParent.isValid() && !newParent.isValid())
        return false;
    if(!oldParent.isValid() || !newParent.isValid() || mMapping.getDst(oldParent) != newParent)
        return true;

    //Rank among the siblings that stayed under the same parent.
    qint32 oldRank = 0;
    for(const NodeRef sibling: mOldTree.children(oldParent))
    {
        if(sibling == oldRef)
            break;
        const NodeRef dst = mMapping.getDst(sibling);
        if(dst.isValid() && mNewTree.parent(dst) == newParent)
            ++oldRank;
    }

    qint32 newRank = 0;
    for(const NodeRef sibling: mNewTree.children(newParent))
    {
        if(sibling == newRef)
            break;
        const NodeRef src = mMapping.getSrc(sibling);
        if(src.isValid() && mOldTree.parent(src) == oldParent)
            ++newRank;
    }

    return oldRank != newRank;
}

EditOperation EditScriptBuilder::pairOperation(const NodeRef oldRef, const NodeRef newRef) const
{
    if(!mOldTree.node(oldRef).sameLabel(mNewTree.node(newRef)))
        return EditOperation(EditType::Replace, oldRef, newRef);

    return EditOperation(EditType::Copy, oldRef, newRef, mDetectMoves && isMoved(oldRef, newRef));
}

EditScript EditScriptBuilder::build() const
{
    struct Step
    {
        EditType kind; // Insert visits a new node, Delete emits a Delete for an old node
        NodeRef ref;
    };

    EditScript script;
    std::vector<Step> stack;
    stack.push_back({EditType::Insert, mNewTree.root()});

    while(!stack.empty())
    {
        const Step step = stack.back();
        stack.pop_back();

        if(step.kind == EditType::Delete)
        {
            script.push_back(EditOperation::remove(step.ref));
            continue;
        }

        const NodeRef newRef = step.ref;
        const NodeRef oldRef = mMapping.getSrc(newRef);
        const std::vector<NodeRef>& newChildren = mNewTree.children(newRef);

        std::vector<Step> next;
        if(oldRef.isValid())
        {
            script.push_back(pairOperation(oldRef, newRef));

            const std::vector<NodeRef>& oldChildren = mOldTree.children(oldRef);
            const size_t count = std::max(oldChildren.size(), newChildren.size());
            for(size_t i = 0; i < count; ++i)
            {
                if(i < oldChildren.size() && !mMapping.hasSrc(oldChildren[i]))
                    next.push_back({EditType::Delete, oldChildren[i]});
                if(i < newChildren.size())
                    next.push_back({EditType::Insert, newChildren[i]});
            }
        }
        else
        {
            const NodeRef newParent = mNewTree.parent(newRef);
            if(!newParent.isValid() || mMapping.hasDst(newParent))
                script.push_back(EditOperation::insert(newRef));

            //Mapped descendants of an inserted subtree still need their Copy or Replace.
            for(const NodeRef child: newChildren)
                next.push_back({EditType::Insert, child});
        }

        for(auto it = next.rbegin(); it != next.rend(); ++it)
            stack.push_back(*it);
    }

    if(!mMapping.hasSrc(mOldTree.root()))
        script.push_back(EditOperation::remove(mOldTree.root()));

    qCDebug(ktreediffCore) << "Built edit script with" << script.size() << "operations";
    return script;
}
