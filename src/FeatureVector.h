/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef FEATUREVECTOR_H
#define FEATUREVECTOR_H

#include "Gram.h"
#include "TreeIndex.h"
#include "TypeUtils.h"

#include <vector>

/*
    Hashed histogram of a gram multiset. Every entry is a non-negative count and the
    length is fixed at construction.
*/
class FeatureVector
{
  public:
    // Throws std::system_error if dimension is not positive.
    explicit FeatureVector(qint32 dimension);

    [[nodiscard]] inline qint32 dimension() const { return static_cast<qint32>(mValues.size()); }

    [[nodiscard]] double at(qint32 bucket) const;
    [[nodiscard]] inline double operator[](qint32 bucket) const { return at(bucket); }

    void increment(qint32 bucket, double amount = 1.0);

    // Throws std::invalid_argument if the dimensions differ.
    FeatureVector& operator+=(const FeatureVector& other);

    [[nodiscard]] double sum() const;
    [[nodiscard]] double norm() const;
    [[nodiscard]] bool isZero() const;

    [[nodiscard]] inline const std::vector<double>& values() const { return mValues; }

    bool operator==(const FeatureVector& other) const { return mValues == other.mValues; }
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }

  private:
    std::vector<double> mValues;
};

[[nodiscard]] qint32 gramBucket(const Gram& gram, qint32 dimension);

[[nodiscard]] FeatureVector featureVector(const GramBag& grams, qint32 dimension);

/*
    Computes the vector of every subtree of a tree in one bottom-up pass. The result for
    node n equals featureVector(GramExtractor::subtreeGrams(tree, grams, n), dimension).
*/
class FeatureVectorEncoder
{
  public:
    explicit FeatureVectorEncoder(qint32 dimension);

    [[nodiscard]] qint32 dimension() const { return mDimension; }

    [[nodiscard]] std::vector<FeatureVector> encode(const TreeIndex& tree, const GramBag& grams) const;

  private:
    Dimension mDimension;
};

#endif // !FEATUREVECTOR_H
