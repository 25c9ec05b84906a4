/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef TREEMATCHER_H
#define TREEMATCHER_H

#include "combiners.h"
#include "NodeMapping.h"
#include "NodeRef.h"
#include "SimilarityOracle.h"

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <boost/signals2.hpp>

#include <QSharedPointer>

class Options;

/*
    Turns similarity scores into a one-to-one node mapping.

    The top-down pass visits old subtrees from largest to smallest and accepts a pair when
    each side is the other's best unmapped candidate and the distance is within the
    threshold. Children of an accepted pair are aligned by slot, key or best match.
    Sibling sequences pair content equal children first, in order, so unchanged code
    costs time proportional to its size.
    The bottom-up pass then recovers small identical subtrees, containers whose
    descendants were mostly mapped together, and renamed leaves.
*/
class TreeMatcher
{
  public:
    TreeMatcher(const SimilarityOracle& oracle, const QSharedPointer<Options>& options);

    // std::nullopt if cancelled.
    [[nodiscard]] std::optional<NodeMapping> match();

    // Polled once per top-down step.
    boost::signals2::signal<bool(), find> wasCancelled;

  private:
    struct Candidate
    {
        NodeRef ref;
        double distance = 1.0;
        double delta = 1.0;
    };

    using BucketKey = std::pair<qint32, qint32>;

    [[nodiscard]] static BucketKey bucketKey(const SyntaxNode& node);
    [[nodiscard]] static bool isBetter(const Candidate& a, const Candidate& b);

    [[nodiscard]] Candidate rankPair(const NodeRef oldRef, const NodeRef newRef) const;
    [[nodiscard]] Candidate bestNewFor(const NodeMapping& mapping, const NodeRef oldRef, const std::vector<NodeRef>& candidates) const;
    [[nodiscard]] Candidate bestOldFor(const NodeMapping& mapping, const NodeRef newRef, const std::vector<NodeRef>& candidates) const;

    bool topDown(NodeMapping& mapping);
    void acceptPair(NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef);
    void matchSequence(NodeMapping& mapping, const std::vector<NodeRef>& oldRefs, const std::vector<NodeRef>& newRefs,
                       std::vector<std::pair<NodeRef, NodeRef>>& pending) const;
    bool propose(NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef, std::vector<std::pair<NodeRef, NodeRef>>& pending) const;

    void matchIdenticalSubtrees(NodeMapping& mapping) const;
    void linkIdentical(NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef) const;
    void matchContainers(NodeMapping& mapping) const;
    [[nodiscard]] double dice(const NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef) const;
    void mapRenamedLeaves(NodeMapping& mapping) const;

    const SimilarityOracle& mOracle;
    QSharedPointer<Options> mOptions;

    std::map<BucketKey, std::vector<NodeRef>> mOldBuckets;
    std::map<BucketKey, std::vector<NodeRef>> mNewBuckets;
};

#endif // !TREEMATCHER_H
