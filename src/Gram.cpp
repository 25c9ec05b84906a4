/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Gram.h"

#include <cassert>

#include <boost/functional/hash.hpp>

#include <QHash>

GramLabel GramLabel::of(const SyntaxNode& node, bool withText)
{
    return GramLabel(node.category(), node.kind(), withText ? node.text() : QString());
}

std::size_t GramLabel::hash() const
{
    std::size_t seed = 0;
    if(!mPresent)
    {
        boost::hash_combine(seed, -1);
        return seed;
    }

    boost::hash_combine(seed, static_cast<int>(mCategory));
    boost::hash_combine(seed, static_cast<int>(mKind));
    boost::hash_combine(seed, qHash(mText, 0));
    return seed;
}

bool GramLabel::operator==(const GramLabel& other) const
{
    if(mPresent != other.mPresent)
        return false;
    if(!mPresent)
        return true;

    return mCategory == other.mCategory && mKind == other.mKind && mText == other.mText;
}

std::size_t Gram::hash() const
{
    std::size_t seed = 0;

    for(const GramLabel& label: mStem)
        boost::hash_combine(seed, label.hash());
    //Separates stem and base so shifting a label between them changes the hash.
    boost::hash_combine(seed, mStem.size());
    for(const GramLabel& label: mBase)
        boost::hash_combine(seed, label.hash());

    return seed;
}

GramExtractor::GramExtractor(qint32 stemSize, qint32 baseSize):
    mStemSize(stemSize), mBaseSize(baseSize)
{
}

Gram GramExtractor::gramAt(const TreeIndex& tree, const NodeRef ref) const
{
    const size_t p = static_cast<qint32>(mStemSize);
    const size_t q = static_cast<qint32>(mBaseSize);

    std::vector<GramLabel> stem;
    stem.reserve(p);
    stem.push_back(GramLabel::of(tree.node(ref), true));
    for(NodeRef ancestor = tree.parent(ref); ancestor.isValid() && stem.size() < p; ancestor = tree.parent(ancestor))
        stem.push_back(GramLabel::of(tree.node(ancestor), false));
    stem.resize(p);

    std::vector<GramLabel> base;
    base.reserve(q);
    for(const NodeRef child: tree.children(ref))
    {
        if(base.size() == q)
            break;
        base.push_back(GramLabel::of(tree.node(child), false));
    }

    const NodeRef parent = tree.parent(ref);
    if(parent.isValid())
    {
        const std::vector<NodeRef>& siblings = tree.children(parent);
        for(size_t i = tree.indexInParent(ref) + 1; i < siblings.size() && base.size() < q; ++i)
            base.push_back(GramLabel::of(tree.node(siblings[i]), false));
    }
    base.resize(q);

    return Gram(std::move(stem), std::move(base));
}

GramBag GramExtractor::extract(const TreeIndex& tree) const
{
    GramBag grams;
    grams.reserve(tree.size());

    for(NodeRef ref = 0; ref < tree.size(); ++ref)
        grams.push_back(gramAt(tree, ref));

    return grams;
}

GramBag GramExtractor::subtreeGrams(const TreeIndex& tree, const GramBag& grams, const NodeRef ref)
{
    assert(grams.size() == static_cast<size_t>(tree.size()));

    const auto first = grams.begin() + static_cast<qint32>(ref);
    return GramBag(first, first + tree.subtreeSize(ref));
}
