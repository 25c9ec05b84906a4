// clang-format off
/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on
#ifndef NODEREF_H
#define NODEREF_H

#include "TypeUtils.h"

#include <type_traits>

#include <QtGlobal>

/*
    Identity of one node occurrence: its pre-order position inside a TreeIndex.
    Two equal subtrees at different positions have different NodeRefs.
*/
class NodeRef
{
  public:
    typedef qint32 RefType;

    static constexpr RefType invalid = -1;

    constexpr NodeRef() = default;
    constexpr NodeRef(const qint64 i)
    {
        mIndex = i;
    }

    operator RefType() const noexcept { return mIndex; }

    NodeRef& operator++()
    {
        ++mIndex;
        return *this;
    }

    [[nodiscard]] bool isValid() const { return mIndex != invalid; }

  private:
    SafeSignedRange<RefType, invalid> mIndex = invalid;
};

static_assert(std::is_convertible<NodeRef, qint64>::value, "Can not convert NodeRef to qint64.");
static_assert(std::is_convertible<qint64, NodeRef>::value, "Can not convert qint64 to NodeRef.");

#endif
