/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef EDITSCRIPT_H
#define EDITSCRIPT_H

#include "NodeMapping.h"
#include "NodeRef.h"
#include "TreeIndex.h"

#include <cassert>
#include <vector>

#include <QString>

enum class EditType
{
    Insert,  // new node and its unmapped descendants
    Delete,  // old node and its unmapped descendants
    Replace, // mapped pair whose labels differ
    Copy     // mapped pair with equal labels, possibly moved
};

[[nodiscard]] QString editTypeName(EditType type);

class EditOperation
{
  private:
    EditType mType = EditType::Copy;
    NodeRef mOld;
    NodeRef mNew;
    bool mMoved = false;

  public:
    EditOperation() = default;
    EditOperation(const EditType type, const NodeRef oldRef, const NodeRef newRef, bool moved = false):
        mType(type), mOld(oldRef), mNew(newRef), mMoved(moved)
    {
        assert(type != EditType::Insert || !oldRef.isValid());
        assert(type != EditType::Delete || !newRef.isValid());
        assert(!moved || type == EditType::Copy);
    }

    [[nodiscard]] static EditOperation insert(const NodeRef newRef) { return EditOperation(EditType::Insert, NodeRef(), newRef); }
    [[nodiscard]] static EditOperation remove(const NodeRef oldRef) { return EditOperation(EditType::Delete, oldRef, NodeRef()); }

    [[nodiscard]] inline EditType type() const { return mType; }
    [[nodiscard]] inline NodeRef oldRef() const { return mOld; }
    [[nodiscard]] inline NodeRef newRef() const { return mNew; }
    [[nodiscard]] inline bool isMoved() const { return mMoved; }

    bool operator==(const EditOperation& other) const
    {
        return mType == other.mType && mOld == other.mOld && mNew == other.mNew && mMoved == other.mMoved;
    }
    bool operator!=(const EditOperation& other) const { return !(*this == other); }
};

class EditScript: public std::vector<EditOperation>
{
  public:
    using std::vector<EditOperation>::vector;

    [[nodiscard]] qint32 count(EditType type) const;
    [[nodiscard]] qint32 movedCount() const;

    /*
        Checks that every old node is accounted for by exactly one Delete, Replace or Copy
        and every new node by exactly one Insert, Replace or Copy. A Delete or Insert also
        accounts for the descendants reached through unmapped nodes.
        Logs the first violation found.
    */
    [[nodiscard]] bool verify(const TreeIndex& oldTree, const TreeIndex& newTree, const NodeMapping& mapping) const;

    void dump() const;
};

class EditScriptBuilder
{
  public:
    EditScriptBuilder(const TreeIndex& oldTree, const TreeIndex& newTree, const NodeMapping& mapping, bool detectMoves);

    [[nodiscard]] EditScript build() const;

  private:
    [[nodiscard]] EditOperation pairOperation(const NodeRef oldRef, const NodeRef newRef) const;
    [[nodiscard]] bool isMoved(const NodeRef oldRef, const NodeRef newRef) const;

    const TreeIndex& mOldTree;
    const TreeIndex& mNewTree;
    const NodeMapping& mMapping;
    bool mDetectMoves;
};

#endif // !EDITSCRIPT_H
