/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "FeatureVector.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <stdexcept>

FeatureVector::FeatureVector(qint32 dimension)
{
    const Dimension checked = dimension;
    mValues.assign(static_cast<qint32>(checked), 0.0);
}

double FeatureVector::at(qint32 bucket) const
{
    assert(bucket >= 0 && bucket < dimension());
    return mValues[bucket];
}

void FeatureVector::increment(qint32 bucket, double amount)
{
    assert(bucket >= 0 && bucket < dimension());
    assert(amount >= 0);
    mValues[bucket] += amount;
}

FeatureVector& FeatureVector::operator+=(const FeatureVector& other)
{
    if(other.dimension() != dimension())
        throw std::invalid_argument("FeatureVector dimensions differ");

    for(size_t i = 0; i < mValues.size(); ++i)
        mValues[i] += other.mValues[i];

    return *this;
}

double FeatureVector::sum() const
{
    return std::accumulate(mValues.begin(), mValues.end(), 0.0);
}

double FeatureVector::norm() const
{
    double squares = 0.0;
    for(const double v: mValues)
        squares += v * v;

    return std::sqrt(squares);
}

bool FeatureVector::isZero() const
{
    return std::all_of(mValues.begin(), mValues.end(), [](const double v) { return v == 0.0; });
}

qint32 gramBucket(const Gram& gram, qint32 dimension)
{
    const Dimension checked = dimension;
    return static_cast<qint32>(gram.hash() % static_cast<std::size_t>(static_cast<qint32>(checked)));
}

FeatureVector featureVector(const GramBag& grams, qint32 dimension)
{
    FeatureVector result(dimension);

    for(const Gram& gram: grams)
        result.increment(gramBucket(gram, dimension));

    return result;
}

FeatureVectorEncoder::FeatureVectorEncoder(qint32 dimension):
    mDimension(dimension)
{
}

std::vector<FeatureVector> FeatureVectorEncoder::encode(const TreeIndex& tree, const GramBag& grams) const
{
    assert(grams.size() == static_cast<size_t>(tree.size()));

    const qint32 dim = mDimension;
    std::vector<FeatureVector> vectors(tree.size(), FeatureVector(dim));

    //Children have larger refs so they are complete before their parent is visited.
    for(qint32 ref = tree.size() - 1; ref >= 0; --ref)
    {
        vectors[ref].increment(gramBucket(grams[ref], dim));
        for(const NodeRef child: tree.children(ref))
            vectors[ref] += vectors[child];
    }

    return vectors;
}
