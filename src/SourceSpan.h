/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef SOURCESPAN_H
#define SOURCESPAN_H

#include "Category.h"

#include <QtGlobal>

// Half open byte range [start, end) into the source blob.
struct ByteRange
{
    qint64 start = 0;
    qint64 end = 0;

    [[nodiscard]] qint64 length() const { return end - start; }

    bool operator==(const ByteRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }
};

// 1-based line and column.
struct SourcePos
{
    qint32 line = 1;
    qint32 column = 1;

    bool operator==(const SourcePos& other) const { return line == other.line && column == other.column; }
    bool operator!=(const SourcePos& other) const { return !(*this == other); }
};

struct SourceSpan
{
    SourcePos start;
    SourcePos end;

    bool operator==(const SourceSpan& other) const { return start == other.start && end == other.end; }
    bool operator!=(const SourceSpan& other) const { return !(*this == other); }
};

/*
    Produced upstream together with the node and never modified afterwards.
*/
class Annotation
{
  public:
    Annotation() = default;
    Annotation(const ByteRange& inRange, const SourceSpan& inSpan, Category inCategory):
        mRange(inRange), mSpan(inSpan), mCategory(inCategory)
    {
    }

    [[nodiscard]] inline const ByteRange& range() const { return mRange; }
    [[nodiscard]] inline const SourceSpan& span() const { return mSpan; }
    [[nodiscard]] inline Category category() const { return mCategory; }

    bool operator==(const Annotation& other) const
    {
        return mRange == other.mRange && mSpan == other.mSpan && mCategory == other.mCategory;
    }
    bool operator!=(const Annotation& other) const { return !(*this == other); }

  private:
    ByteRange mRange;
    SourceSpan mSpan;
    Category mCategory = Category::Other;
};

#endif // !SOURCESPAN_H
