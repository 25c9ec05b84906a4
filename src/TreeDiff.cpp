/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "TreeDiff.h"

#include "FeatureVector.h"
#include "Gram.h"
#include "Logging.h"
#include "options.h"
#include "SimilarityOracle.h"
#include "TreeMatcher.h"

#include <cassert>
#include <utility>
#include <vector>

TreeDiff::TreeDiff(const QSharedPointer<Options>& options):
    mOptions(options)
{
    checkOptions(*mOptions);
}

void TreeDiff::checkOptions(const Options& options)
{
    [[maybe_unused]] const GramExtractor extractor(options.m_gramStemSize, options.m_gramBaseSize);
    [[maybe_unused]] const FeatureVectorEncoder encoder(options.m_featureVectorDimension);
}

std::optional<TreeDiffResult> TreeDiff::run(const SyntaxNode& oldRoot, const SyntaxNode& newRoot)
{
    qCInfo(ktreediffMain) << "Enter: TreeDiff::run";

    const GramExtractor extractor(mOptions->m_gramStemSize, mOptions->m_gramBaseSize);
    const FeatureVectorEncoder encoder(mOptions->m_featureVectorDimension);

    TreeIndex oldTree(oldRoot);
    TreeIndex newTree(newRoot);
    qCInfo(ktreediffMain) << "Indexed" << oldTree.size() << "old and" << newTree.size() << "new nodes";

    const GramBag oldGrams = extractor.extract(oldTree);
    const GramBag newGrams = extractor.extract(newTree);

    const std::vector<FeatureVector> oldVectors = encoder.encode(oldTree, oldGrams);
    const std::vector<FeatureVector> newVectors = encoder.encode(newTree, newGrams);

    const SimilarityOracle oracle(oldTree, oldVectors, newTree, newVectors, mOptions->m_similarityThreshold);

    TreeMatcher matcher(oracle, mOptions);
    boost::signals2::scoped_connection cancelConnection = matcher.wasCancelled.connect([this]() { return wasCancelled(); });

    std::optional<NodeMapping> mapping = matcher.match();
    if(!mapping.has_value())
    {
        qCInfo(ktreediffMain) << "Leave: TreeDiff::run (cancelled)";
        return {};
    }

    EditScript script = EditScriptBuilder(oldTree, newTree, mapping.value(), mOptions->m_bDetectMoves).build();

#ifndef NDEBUG
    if(!script.verify(oldTree, newTree, mapping.value()))
    {
        mapping->dump();
        script.dump();
        assert(false);
    }
#endif

    qCInfo(ktreediffMain) << "Edit script:" << script.count(EditType::Copy) << "copies," << script.count(EditType::Replace) << "replacements,"
                          << script.count(EditType::Insert) << "inserts," << script.count(EditType::Delete) << "deletes," << script.movedCount() << "moves";

    if(!mOptions->m_bKeepMapping)
        mapping.reset();

    qCInfo(ktreediffMain) << "Leave: TreeDiff::run";
    return TreeDiffResult(std::move(oldTree), std::move(newTree), std::move(script), std::move(mapping));
}
