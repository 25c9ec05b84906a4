/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef NODEMAPPING_H
#define NODEMAPPING_H

#include "NodeRef.h"
#include "TypeUtils.h"

#include <utility>
#include <vector>

/*
    Partial one-to-one correspondence between the nodes of an old (source) and a
    new (destination) tree, stored in both directions.
*/
class NodeMapping
{
  public:
    NodeMapping(qint32 oldSize, qint32 newSize);

    // Neither node may already be mapped.
    void link(const NodeRef oldRef, const NodeRef newRef);

    [[nodiscard]] bool hasSrc(const NodeRef oldRef) const { return getDst(oldRef).isValid(); }
    [[nodiscard]] bool hasDst(const NodeRef newRef) const { return getSrc(newRef).isValid(); }

    [[nodiscard]] NodeRef getDst(const NodeRef oldRef) const;
    [[nodiscard]] NodeRef getSrc(const NodeRef newRef) const;

    [[nodiscard]] inline qint32 size() const { return mCount; }
    [[nodiscard]] inline bool isEmpty() const { return mCount == 0; }

    [[nodiscard]] inline qint32 oldSize() const { return SafeInt<qint32>(mOldToNew.size()); }
    [[nodiscard]] inline qint32 newSize() const { return SafeInt<qint32>(mNewToOld.size()); }

    // Mapped pairs ordered by old ref.
    [[nodiscard]] std::vector<std::pair<NodeRef, NodeRef>> pairs() const;

    void dump() const;

  private:
    std::vector<NodeRef> mOldToNew;
    std::vector<NodeRef> mNewToOld;
    qint32 mCount = 0;
};

#endif // !NODEMAPPING_H
