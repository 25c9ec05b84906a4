/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef TREEINDEX_H
#define TREEINDEX_H

#include "NodeRef.h"
#include "SyntaxTree.h"

#include <cassert>
#include <cstddef>
#include <vector>

#include <QStringList>

// ChildGroup with every node replaced by its NodeRef. Absent optional slots are invalid refs.
struct IndexedGroup
{
    ChildAlignment alignment = ChildAlignment::Sequence;
    std::vector<NodeRef> refs;
    QStringList keys;
};

/*
    Flattened read only view of one syntax tree. Nodes are numbered in pre-order so the
    descendants of r are exactly the refs in [r, r + subtreeSize(r)).

    The index does not own the tree. The tree must outlive the index and must not be
    modified while the index is in use.
*/
class TreeIndex
{
  public:
    explicit TreeIndex(const SyntaxNode& root);

    [[nodiscard]] inline qint32 size() const { return SafeInt<qint32>(mEntries.size()); }
    [[nodiscard]] inline NodeRef root() const { return 0; }
    [[nodiscard]] inline bool contains(const NodeRef ref) const { return ref.isValid() && ref < size(); }

    [[nodiscard]] const SyntaxNode& node(const NodeRef ref) const { return *entry(ref).node; }
    [[nodiscard]] NodeRef parent(const NodeRef ref) const { return entry(ref).parent; }
    [[nodiscard]] const std::vector<NodeRef>& children(const NodeRef ref) const { return entry(ref).children; }
    [[nodiscard]] const std::vector<IndexedGroup>& groups(const NodeRef ref) const { return entry(ref).groups; }
    [[nodiscard]] qint32 depth(const NodeRef ref) const { return entry(ref).depth; }
    [[nodiscard]] qint32 subtreeSize(const NodeRef ref) const { return entry(ref).subtreeSize; }
    // Position among the parent's present children, 0 for the root.
    [[nodiscard]] qint32 indexInParent(const NodeRef ref) const { return entry(ref).indexInParent; }
    [[nodiscard]] bool isLeaf(const NodeRef ref) const { return entry(ref).children.empty(); }

    [[nodiscard]] bool isAncestor(const NodeRef ancestor, const NodeRef ref) const;

    // Pre-order position scaled to [0, 1].
    [[nodiscard]] double relativePosition(const NodeRef ref) const;

    // Structural hash of the subtree at ref. Annotations are not part of it.
    [[nodiscard]] std::size_t contentHash(const NodeRef ref) const { return entry(ref).contentHash; }

    // Deep structural comparison ignoring annotations.
    [[nodiscard]] bool subtreeEqual(const NodeRef ref, const TreeIndex& other, const NodeRef otherRef) const;

  private:
    struct Entry
    {
        const SyntaxNode* node = nullptr;
        NodeRef parent;
        qint32 depth = 0;
        qint32 subtreeSize = 1;
        qint32 indexInParent = 0;
        std::vector<NodeRef> children;
        std::vector<IndexedGroup> groups;
        std::size_t contentHash = 0;
    };

    const Entry& entry(const NodeRef ref) const
    {
        assert(contains(ref));
        return mEntries[ref];
    }

    std::vector<Entry> mEntries;
};

#endif // !TREEINDEX_H
