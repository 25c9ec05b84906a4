/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "SimilarityOracle.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <stdexcept>

namespace {
double unitDistance(const FeatureVector& a, double normA, const FeatureVector& b, double normB)
{
    if(a.dimension() != b.dimension())
        throw std::invalid_argument("FeatureVector dimensions differ");

    if(normA == 0.0 && normB == 0.0)
        return 0.0;
    if(normA == 0.0 || normB == 0.0)
        return 1.0;

    double squares = 0.0;
    for(qint32 i = 0; i < a.dimension(); ++i)
    {
        const double d = a[i] / normA - b[i] / normB;
        squares += d * d;
    }

    //Unit vectors with non-negative entries are at most sqrt(2) apart.
    return std::clamp(std::sqrt(squares) / std::sqrt(2.0), 0.0, 1.0);
}
} // namespace

double vectorDistance(const FeatureVector& a, const FeatureVector& b)
{
    return unitDistance(a, a.norm(), b, b.norm());
}

bool isComparable(const SyntaxNode& a, const SyntaxNode& b)
{
    return a.kind() == b.kind() && categoriesCompatible(a.category(), b.category());
}

SimilarityOracle::SimilarityOracle(const TreeIndex& oldTree, const std::vector<FeatureVector>& oldVectors,
                                   const TreeIndex& newTree, const std::vector<FeatureVector>& newVectors,
                                   double threshold):
    mOldTree(oldTree),
    mOldVectors(oldVectors), mNewTree(newTree), mNewVectors(newVectors), mThreshold(threshold)
{
    assert(mOldVectors.size() == static_cast<size_t>(mOldTree.size()));
    assert(mNewVectors.size() == static_cast<size_t>(mNewTree.size()));

    mOldNorms.reserve(mOldVectors.size());
    for(const FeatureVector& vector: mOldVectors)
        mOldNorms.push_back(vector.norm());
    mNewNorms.reserve(mNewVectors.size());
    for(const FeatureVector& vector: mNewVectors)
        mNewNorms.push_back(vector.norm());
}

bool SimilarityOracle::comparable(const NodeRef oldRef, const NodeRef newRef) const
{
    return isComparable(mOldTree.node(oldRef), mNewTree.node(newRef));
}

double SimilarityOracle::distance(const NodeRef oldRef, const NodeRef newRef) const
{
    return unitDistance(mOldVectors[oldRef], mOldNorms[oldRef], mNewVectors[newRef], mNewNorms[newRef]);
}

bool SimilarityOracle::contentEqual(const NodeRef oldRef, const NodeRef newRef) const
{
    return mOldTree.subtreeEqual(oldRef, mNewTree, newRef);
}

double SimilarityOracle::positionDelta(const NodeRef oldRef, const NodeRef newRef) const
{
    return std::abs(mOldTree.relativePosition(oldRef) - mNewTree.relativePosition(newRef));
}
