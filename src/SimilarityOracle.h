/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef SIMILARITYORACLE_H
#define SIMILARITYORACLE_H

#include "FeatureVector.h"
#include "NodeRef.h"
#include "SyntaxTree.h"
#include "TreeIndex.h"

#include <vector>

/*
    Euclidean distance between the unit length versions of a and b, scaled into [0, 1].
    Two zero vectors are at distance 0, a zero and a non-zero vector at distance 1.
    Throws std::invalid_argument if the dimensions differ.
*/
[[nodiscard]] double vectorDistance(const FeatureVector& a, const FeatureVector& b);

// Cheap pre-filter run before any distance is computed.
[[nodiscard]] bool isComparable(const SyntaxNode& a, const SyntaxNode& b);

class SimilarityOracle
{
  public:
    SimilarityOracle(const TreeIndex& oldTree, const std::vector<FeatureVector>& oldVectors,
                     const TreeIndex& newTree, const std::vector<FeatureVector>& newVectors,
                     double threshold);

    [[nodiscard]] inline const TreeIndex& oldTree() const { return mOldTree; }
    [[nodiscard]] inline const TreeIndex& newTree() const { return mNewTree; }
    [[nodiscard]] inline double threshold() const { return mThreshold; }

    [[nodiscard]] bool comparable(const NodeRef oldRef, const NodeRef newRef) const;
    [[nodiscard]] double distance(const NodeRef oldRef, const NodeRef newRef) const;
    [[nodiscard]] inline bool accepts(double distance) const { return distance <= mThreshold; }

    [[nodiscard]] bool contentEqual(const NodeRef oldRef, const NodeRef newRef) const;

    // Absolute difference of the relative pre-order positions.
    [[nodiscard]] double positionDelta(const NodeRef oldRef, const NodeRef newRef) const;

  private:
    const TreeIndex& mOldTree;
    const std::vector<FeatureVector>& mOldVectors;
    const TreeIndex& mNewTree;
    const std::vector<FeatureVector>& mNewVectors;
    std::vector<double> mOldNorms;
    std::vector<double> mNewNorms;
    double mThreshold;
};

#endif // !SIMILARITYORACLE_H
