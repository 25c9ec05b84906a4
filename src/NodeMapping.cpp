/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "NodeMapping.h"

#include "Logging.h"

#include <cassert>

NodeMapping::NodeMapping(qint32 oldSize, qint32 newSize):
    mOldToNew(oldSize), mNewToOld(newSize)
{
}

void NodeMapping::link(const NodeRef oldRef, const NodeRef newRef)
{
    assert(oldRef.isValid() && oldRef < oldSize());
    assert(newRef.isValid() && newRef < newSize());
    assert(!hasSrc(oldRef) && !hasDst(newRef));

    mOldToNew[oldRef] = newRef;
    mNewToOld[newRef] = oldRef;
    ++mCount;

    qCDebug(ktreediffCore) << "Linked old node" << (NodeRef::RefType)oldRef << "to new node" << (NodeRef::RefType)newRef;
}

NodeRef NodeMapping::getDst(const NodeRef oldRef) const
{
    assert(oldRef.isValid() && oldRef < oldSize());
    return mOldToNew[oldRef];
}

NodeRef NodeMapping::getSrc(const NodeRef newRef) const
{
    assert(newRef.isValid() && newRef < newSize());
    return mNewToOld[newRef];
}

std::vector<std::pair<NodeRef, NodeRef>> NodeMapping::pairs() const
{
    std::vector<std::pair<NodeRef, NodeRef>> result;
    result.reserve(size());

    for(qint32 i = 0; i < oldSize(); ++i)
    {
        if(mOldToNew[i].isValid())
            result.emplace_back(i, mOldToNew[i]);
    }

    return result;
}

void NodeMapping::dump() const
{
    qCDebug(ktreediffCore) << "---- NodeMapping ----" << size() << "of" << oldSize() << "old and" << newSize() << "new nodes mapped";
    for(const auto& pair: pairs())
        qCDebug(ktreediffCore) << (NodeRef::RefType)pair.first << "->" << (NodeRef::RefType)pair.second;
}
