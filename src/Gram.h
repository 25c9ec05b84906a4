/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef GRAM_H
#define GRAM_H

#include "Category.h"
#include "NodeRef.h"
#include "SyntaxTree.h"
#include "TreeIndex.h"
#include "TypeUtils.h"

#include <cstddef>
#include <vector>

#include <QString>

/*
    Node label as seen by gram extraction. A default constructed label is the
    distinguished absent label used for padding.
*/
class GramLabel
{
  public:
    GramLabel() = default;
    GramLabel(Category category, SyntaxKind kind, const QString& text = QString()):
        mPresent(true), mCategory(category), mKind(kind), mText(text)
    {
    }

    [[nodiscard]] static GramLabel of(const SyntaxNode& node, bool withText);

    [[nodiscard]] inline bool isAbsent() const { return !mPresent; }
    [[nodiscard]] inline Category category() const { return mCategory; }
    [[nodiscard]] inline SyntaxKind kind() const { return mKind; }
    [[nodiscard]] inline const QString& text() const { return mText; }

    [[nodiscard]] std::size_t hash() const;

    bool operator==(const GramLabel& other) const;
    bool operator!=(const GramLabel& other) const { return !(*this == other); }

  private:
    bool mPresent = false;
    Category mCategory = Category::Other;
    SyntaxKind mKind = SyntaxKind::Leaf;
    QString mText;
};

/*
    (stem, base) pair anchored at one node. The stem is the anchor followed by its nearest
    ancestors, the base is the anchor's children followed by its following siblings.
    Both are padded with absent labels to their configured length.
*/
class Gram
{
  public:
    Gram(std::vector<GramLabel>&& stem, std::vector<GramLabel>&& base): mStem(std::move(stem)), mBase(std::move(base)) {}

    [[nodiscard]] inline const std::vector<GramLabel>& stem() const { return mStem; }
    [[nodiscard]] inline const std::vector<GramLabel>& base() const { return mBase; }
    [[nodiscard]] inline qint32 length() const { return static_cast<qint32>(mStem.size() + mBase.size()); }

    // Same value on every run of one build. Not stable across Qt or Boost versions, so never persist it.
    [[nodiscard]] std::size_t hash() const;

    bool operator==(const Gram& other) const { return mStem == other.mStem && mBase == other.mBase; }
    bool operator!=(const Gram& other) const { return !(*this == other); }

  private:
    std::vector<GramLabel> mStem;
    std::vector<GramLabel> mBase;
};

using GramBag = std::vector<Gram>;

class GramExtractor
{
  public:
    // Throws std::system_error unless both sizes are positive.
    GramExtractor(qint32 stemSize, qint32 baseSize);

    [[nodiscard]] qint32 stemSize() const { return mStemSize; }
    [[nodiscard]] qint32 baseSize() const { return mBaseSize; }

    [[nodiscard]] Gram gramAt(const TreeIndex& tree, const NodeRef ref) const;

    // One gram per node, indexed by NodeRef.
    [[nodiscard]] GramBag extract(const TreeIndex& tree) const;

    // The grams anchored in the subtree at ref. grams must come from extract(tree).
    [[nodiscard]] static GramBag subtreeGrams(const TreeIndex& tree, const GramBag& grams, const NodeRef ref);

  private:
    ContextSize mStemSize;
    ContextSize mBaseSize;
};

#endif // !GRAM_H
