/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "TreeMatcher.h"

#include "Logging.h"
#include "options.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <deque>
#include <numeric>
#include <unordered_map>

namespace {
//Distances closer than this are treated as ties.
constexpr double kEpsilon = 1e-12;
} // namespace

TreeMatcher::TreeMatcher(const SimilarityOracle& oracle, const QSharedPointer<Options>& options):
    mOracle(oracle), mOptions(options)
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    for(NodeRef ref = 0; ref < oldTree.size(); ++ref)
        mOldBuckets[bucketKey(oldTree.node(ref))].push_back(ref);
    for(NodeRef ref = 0; ref < newTree.size(); ++ref)
        mNewBuckets[bucketKey(newTree.node(ref))].push_back(ref);
}

TreeMatcher::BucketKey TreeMatcher::bucketKey(const SyntaxNode& node)
{
    const Category family = isOperatorCategory(node.category()) ? Category::Operator : node.category();
    return BucketKey(static_cast<qint32>(node.kind()), static_cast<qint32>(family));
}

/*
    Ranking used for every choice the matcher makes: smaller distance, then smaller
    position delta, then earlier ref.
*/
bool TreeMatcher::isBetter(const Candidate& a, const Candidate& b)
{
    if(!b.ref.isValid())
        return a.ref.isValid();
    if(!a.ref.isValid())
        return false;

    if(std::abs(a.distance - b.distance) > kEpsilon)
        return a.distance < b.distance;
    if(std::abs(a.delta - b.delta) > kEpsilon)
        return a.delta < b.delta;

    return a.ref < b.ref;
}

TreeMatcher::Candidate TreeMatcher::rankPair(const NodeRef oldRef, const NodeRef newRef) const
{
    Candidate candidate;
    candidate.distance = mOracle.distance(oldRef, newRef);
    candidate.delta = mOracle.positionDelta(oldRef, newRef);
    return candidate;
}

TreeMatcher::Candidate TreeMatcher::bestNewFor(const NodeMapping& mapping, const NodeRef oldRef, const std::vector<NodeRef>& candidates) const
{
    Candidate best;
    for(const NodeRef newRef: candidates)
    {
        if(!newRef.isValid() || mapping.hasDst(newRef) || !mOracle.comparable(oldRef, newRef))
            continue;

        Candidate candidate = rankPair(oldRef, newRef);
        candidate.ref = newRef;
        if(isBetter(candidate, best))
            best = candidate;
    }
    return best;
}

TreeMatcher::Candidate TreeMatcher::bestOldFor(const NodeMapping& mapping, const NodeRef newRef, const std::vector<NodeRef>& candidates) const
{
    Candidate best;
    for(const NodeRef oldRef: candidates)
    {
        if(!oldRef.isValid() || mapping.hasSrc(oldRef) || !mOracle.comparable(oldRef, newRef))
            continue;

        Candidate candidate = rankPair(oldRef, newRef);
        candidate.ref = oldRef;
        if(isBetter(candidate, best))
            best = candidate;
    }
    return best;
}

std::optional<NodeMapping> TreeMatcher::match()
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    NodeMapping mapping(oldTree.size(), newTree.size());

    if(!topDown(mapping))
    {
        qCInfo(ktreediffMatcher) << "Matching cancelled, partial mapping discarded.";
        return {};
    }
    const qint32 topDownCount = mapping.size();

    matchIdenticalSubtrees(mapping);
    const qint32 identicalCount = mapping.size() - topDownCount;

    matchContainers(mapping);
    const qint32 containerCount = mapping.size() - topDownCount - identicalCount;

    if(mOptions->m_bMapRenamedLeaves)
        mapRenamedLeaves(mapping);

    qCInfo(ktreediffMatcher) << "Mapped" << mapping.size() << "of" << oldTree.size() << "old and" << newTree.size() << "new nodes."
                             << "top-down:" << topDownCount << "identical subtrees:" << identicalCount << "containers:" << containerCount
                             << "renamed leaves:" << mapping.size() - topDownCount - identicalCount - containerCount;
    return mapping;
}

bool TreeMatcher::topDown(NodeMapping& mapping)
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    std::vector<NodeRef> order(oldTree.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&oldTree](const NodeRef a, const NodeRef b) {
        return oldTree.subtreeSize(a) > oldTree.subtreeSize(b);
    });

    for(const NodeRef oldRef: order)
    {
        if(wasCancelled())
            return false;

        if(mapping.hasSrc(oldRef))
            continue;

        const BucketKey key = bucketKey(oldTree.node(oldRef));
        const Candidate best = bestNewFor(mapping, oldRef, mNewBuckets[key]);
        if(!best.ref.isValid() || !mOracle.accepts(best.distance))
            continue;

        const Candidate reverse = bestOldFor(mapping, best.ref, mOldBuckets[bucketKey(newTree.node(best.ref))]);
        if(reverse.ref != oldRef)
            continue;

        acceptPair(mapping, oldRef, best.ref);
    }

    return true;
}

void TreeMatcher::acceptPair(NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef)
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    std::vector<std::pair<NodeRef, NodeRef>> pending;
    mapping.link(oldRef, newRef);
    pending.emplace_back(oldRef, newRef);

    while(!pending.empty())
    {
        const NodeRef o = pending.back().first;
        const NodeRef n = pending.back().second;
        pending.pop_back();

        //Nothing below an equal pair needs aligning.
        if(mOracle.contentEqual(o, n))
        {
            linkIdentical(mapping, o, n);
            continue;
        }

        const std::vector<IndexedGroup>& oldGroups = oldTree.groups(o);
        const std::vector<IndexedGroup>& newGroups = newTree.groups(n);
        assert(oldGroups.size() == newGroups.size());

        for(size_t g = 0; g < oldGroups.size(); ++g)
        {
            const IndexedGroup& oldGroup = oldGroups[g];
            const IndexedGroup& newGroup = newGroups[g];
            assert(oldGroup.alignment == newGroup.alignment);

            switch(oldGroup.alignment)
            {
                case ChildAlignment::Positional:
                    for(size_t i = 0; i < std::min(oldGroup.refs.size(), newGroup.refs.size()); ++i)
                        propose(mapping, oldGroup.refs[i], newGroup.refs[i], pending);
                    break;
                case ChildAlignment::Keyed:
                    for(qint32 i = 0; i < oldGroup.keys.size(); ++i)
                    {
                        const qint32 j = newGroup.keys.indexOf(oldGroup.keys[i]);
                        if(j >= 0)
                            propose(mapping, oldGroup.refs[i], newGroup.refs[j], pending);
                    }
                    break;
                case ChildAlignment::Sequence:
                    matchSequence(mapping, oldGroup.refs, newGroup.refs, pending);
                    break;
            }
        }
    }
}

/*
    Content equal siblings are paired first through their hashes, each old child taking
    the earliest unmapped equal new child. The remaining siblings are then paired by
    mutual best distance.
*/
void TreeMatcher::matchSequence(NodeMapping& mapping, const std::vector<NodeRef>& oldRefs, const std::vector<NodeRef>& newRefs,
                                std::vector<std::pair<NodeRef, NodeRef>>& pending) const
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    std::unordered_map<std::size_t, std::deque<NodeRef>> newByHash;
    for(const NodeRef newRef: newRefs)
    {
        if(!mapping.hasDst(newRef))
            newByHash[newTree.contentHash(newRef)].push_back(newRef);
    }

    std::vector<NodeRef> oldRest;
    for(const NodeRef oldRef: oldRefs)
    {
        if(mapping.hasSrc(oldRef))
            continue;

        const auto bucket = newByHash.find(oldTree.contentHash(oldRef));
        if(bucket != newByHash.end())
        {
            std::deque<NodeRef>& queue = bucket->second;
            const auto equal = std::find_if(queue.begin(), queue.end(), [this, oldRef](const NodeRef newRef) {
                return mOracle.contentEqual(oldRef, newRef);
            });
            if(equal != queue.end())
            {
                linkIdentical(mapping, oldRef, *equal);
                queue.erase(equal);
                continue;
            }
        }

        oldRest.push_back(oldRef);
    }

    if(oldRest.empty())
        return;

    std::vector<NodeRef> newRest;
    for(const NodeRef newRef: newRefs)
    {
        if(!mapping.hasDst(newRef))
            newRest.push_back(newRef);
    }

    for(const NodeRef oldRef: oldRest)
    {
        const Candidate best = bestNewFor(mapping, oldRef, newRest);
        if(!best.ref.isValid())
            continue;

        const Candidate reverse = bestOldFor(mapping, best.ref, oldRest);
        if(reverse.ref == oldRef)
            propose(mapping, oldRef, best.ref, pending);
    }
}

bool TreeMatcher::propose(NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef, std::vector<std::pair<NodeRef, NodeRef>>& pending) const
{
    if(!oldRef.isValid() || !newRef.isValid())
        return false;
    if(mapping.hasSrc(oldRef) || mapping.hasDst(newRef))
        return false;
    if(!mOracle.comparable(oldRef, newRef))
        return false;
    if(!mOracle.contentEqual(oldRef, newRef) && !mOracle.accepts(mOracle.distance(oldRef, newRef)))
        return false;

    mapping.link(oldRef, newRef);
    pending.emplace_back(oldRef, newRef);
    return true;
}

void TreeMatcher::matchIdenticalSubtrees(NodeMapping& mapping) const
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();
    const qint32 maxSize = mOptions->m_bottomUpMaxSubtreeSize;

    std::unordered_multimap<std::size_t, NodeRef> newByHash;
    for(NodeRef ref = 0; ref < newTree.size(); ++ref)
    {
        if(newTree.subtreeSize(ref) <= maxSize)
            newByHash.emplace(newTree.contentHash(ref), ref);
    }

    //Pre-order so an identical parent is taken before its children are tried alone.
    for(NodeRef oldRef = 0; oldRef < oldTree.size(); ++oldRef)
    {
        if(mapping.hasSrc(oldRef) || oldTree.subtreeSize(oldRef) > maxSize)
            continue;

        Candidate best;
        const auto range = newByHash.equal_range(oldTree.contentHash(oldRef));
        for(auto it = range.first; it != range.second; ++it)
        {
            const NodeRef newRef = it->second;
            if(mapping.hasDst(newRef) || !mOracle.contentEqual(oldRef, newRef))
                continue;

            Candidate candidate;
            candidate.ref = newRef;
            candidate.distance = 0.0;
            candidate.delta = mOracle.positionDelta(oldRef, newRef);
            if(isBetter(candidate, best))
                best = candidate;
        }

        if(best.ref.isValid())
            linkIdentical(mapping, oldRef, best.ref);
    }
}

void TreeMatcher::linkIdentical(NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef) const
{
    //Equal subtrees have the same pre-order shape.
    const qint32 count = mOracle.oldTree().subtreeSize(oldRef);
    assert(count == mOracle.newTree().subtreeSize(newRef));

    for(qint32 k = 0; k < count; ++k)
    {
        const NodeRef o = oldRef + k;
        const NodeRef n = newRef + k;
        if(!mapping.hasSrc(o) && !mapping.hasDst(n))
            mapping.link(o, n);
    }
}

// Share of descendants mapped into each other, 2 * common / (old descendants + new descendants).
double TreeMatcher::dice(const NodeMapping& mapping, const NodeRef oldRef, const NodeRef newRef) const
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    const qint32 oldDescendants = oldTree.subtreeSize(oldRef) - 1;
    const qint32 newDescendants = newTree.subtreeSize(newRef) - 1;
    if(oldDescendants + newDescendants == 0)
        return 0.0;

    qint32 common = 0;
    for(qint32 k = 1; k <= oldDescendants; ++k)
    {
        const NodeRef dst = mapping.getDst(oldRef + k);
        if(dst.isValid() && newTree.isAncestor(newRef, dst))
            ++common;
    }

    return 2.0 * common / (oldDescendants + newDescendants);
}

void TreeMatcher::matchContainers(NodeMapping& mapping) const
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const double minDice = mOptions->m_bottomUpMinDice;

    //Descending refs visit children before their parents.
    for(qint32 i = oldTree.size() - 1; i >= 0; --i)
    {
        const NodeRef oldRef = i;
        if(mapping.hasSrc(oldRef) || oldTree.isLeaf(oldRef))
            continue;

        const auto bucket = mNewBuckets.find(bucketKey(oldTree.node(oldRef)));
        if(bucket == mNewBuckets.end())
            continue;

        NodeRef best;
        double bestDice = 0.0;
        for(const NodeRef newRef: bucket->second)
        {
            if(mapping.hasDst(newRef) || !mOracle.comparable(oldRef, newRef))
                continue;

            const double value = dice(mapping, oldRef, newRef);
            if(value > bestDice + kEpsilon)
            {
                bestDice = value;
                best = newRef;
            }
        }

        if(best.isValid() && bestDice >= minDice)
            mapping.link(oldRef, best);
    }
}

void TreeMatcher::mapRenamedLeaves(NodeMapping& mapping) const
{
    const TreeIndex& oldTree = mOracle.oldTree();
    const TreeIndex& newTree = mOracle.newTree();

    const auto tryLink = [&](const NodeRef o, const NodeRef n) {
        if(!o.isValid() || !n.isValid())
            return;
        if(mapping.hasSrc(o) || mapping.hasDst(n))
            return;
        if(!oldTree.isLeaf(o) || !newTree.isLeaf(n) || !mOracle.comparable(o, n))
            return;

        mapping.link(o, n);
    };

    for(const auto& pair: mapping.pairs())
    {
        const std::vector<IndexedGroup>& oldGroups = oldTree.groups(pair.first);
        const std::vector<IndexedGroup>& newGroups = newTree.groups(pair.second);

        for(size_t g = 0; g < oldGroups.size(); ++g)
        {
            const IndexedGroup& oldGroup = oldGroups[g];
            const IndexedGroup& newGroup = newGroups[g];

            switch(oldGroup.alignment)
            {
                case ChildAlignment::Sequence:
                    if(oldGroup.refs.size() != newGroup.refs.size())
                        break;
                    [[fallthrough]];
                case ChildAlignment::Positional:
                    for(size_t i = 0; i < std::min(oldGroup.refs.size(), newGroup.refs.size()); ++i)
                        tryLink(oldGroup.refs[i], newGroup.refs[i]);
                    break;
                case ChildAlignment::Keyed:
                    for(qint32 i = 0; i < oldGroup.keys.size(); ++i)
                    {
                        const qint32 j = newGroup.keys.indexOf(oldGroup.keys[i]);
                        if(j >= 0)
                            tryLink(oldGroup.refs[i], newGroup.refs[j]);
                    }
                    break;
            }
        }
    }
}
