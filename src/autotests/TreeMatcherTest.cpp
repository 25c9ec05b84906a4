/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../EditScript.h"
#include "../FeatureVector.h"
#include "../Gram.h"
#include "../options.h"
#include "../SimilarityOracle.h"
#include "../TreeDiff.h"
#include "../TreeIndex.h"
#include "../TreeMatcher.h"

#include "TreeFixtures.h"

#include <system_error>

#include <QRandomGenerator>
#include <QSharedPointer>
#include <QTest>

using namespace TreeFixtures;

class TreeMatcherTest: public QObject
{
    Q_OBJECT;

  private:
    QSharedPointer<Options> makeOptions()
    {
        QSharedPointer<Options> options = QSharedPointer<Options>::create();
        options->m_bKeepMapping = true;
        //Wide enough that the small examples below never share a bucket by accident.
        options->m_featureVectorDimension = 4096;
        return options;
    }

    // f(x, y, z) with names unique to tag
    SyntaxNodePtr taggedCall(const QString& tag)
    {
        return call("f" + tag, list(leaf("x" + tag), leaf("y" + tag), leaf("z" + tag)));
    }

  private Q_SLOTS:
    void testIdentity()
    {
        QRandomGenerator rng(100);
        const QSharedPointer<Options> options = makeOptions();
        options->m_featureVectorDimension = 64;

        for(qint32 i = 0; i < 30; ++i)
        {
            SyntaxNodePtr root = randomProgram(rng);
            SyntaxNodePtr copy = root->clone();

            TreeDiff diff(options);
            const std::optional<TreeDiffResult> result = diff.run(*root, *copy);
            QVERIFY(result.has_value());

            const qint32 size = result->oldTree().size();
            QCOMPARE(result->mapping()->size(), size);
            QCOMPARE(qint32(result->script().size()), size);
            QCOMPARE(result->script().count(EditType::Copy), size);
            QCOMPARE(result->script().movedCount(), 0);

            for(NodeRef ref = 0; ref < size; ++ref)
                QVERIFY(result->mapping()->getDst(ref) == ref);
        }
    }

    void testDeepIdentity()
    {
        SyntaxNodePtr root = chain(1500);
        SyntaxNodePtr copy = root->clone();

        const QSharedPointer<Options> options = makeOptions();
        options->m_featureVectorDimension = 64;
        TreeDiff diff(options);
        const std::optional<TreeDiffResult> result = diff.run(*root, *copy);
        QVERIFY(result.has_value());
        QCOMPARE(result->script().count(EditType::Copy), 1501);
    }

    void testManyEqualStatements()
    {
        // 3000 copies of x + y, the new side without the last one
        SyntaxNodeList oldStatements;
        SyntaxNodeList newStatements;
        for(qint32 i = 0; i < 3000; ++i)
        {
            oldStatements.push_back(binary("x", "y"));
            if(i < 2999)
                newStatements.push_back(binary("x", "y"));
        }
        SyntaxNodePtr oldRoot = program(std::move(oldStatements));
        SyntaxNodePtr newRoot = program(std::move(newStatements));

        const QSharedPointer<Options> options = makeOptions();
        options->m_featureVectorDimension = 64;
        TreeDiff diff(options);

        std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        const NodeMapping& mapping = result->mapping().value();
        const qint32 newSize = result->newTree().size();
        QCOMPARE(newSize, 1 + 2999 * 3);
        QCOMPARE(mapping.size(), newSize);
        //Equal statements pair up in order.
        for(NodeRef ref = 0; ref < newSize; ++ref)
            QVERIFY(mapping.getDst(ref) == ref);
        QVERIFY(!mapping.hasSrc(newSize));

        QCOMPARE(result->script().count(EditType::Copy), newSize);
        QCOMPARE(result->script().count(EditType::Delete), 1);
        QCOMPARE(result->script().count(EditType::Insert), 0);
        QCOMPARE(result->script().movedCount(), 0);

        result = diff.run(*oldRoot, *oldRoot);
        QVERIFY(result.has_value());
        QCOMPARE(result->script().count(EditType::Copy), result->oldTree().size());
    }

    void testTotalDifference()
    {
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = object({"k"}, {"v"});

        TreeDiff diff(makeOptions());
        const std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        QVERIFY(result->mapping()->isEmpty());
        const EditScript expected{EditOperation::insert(0), EditOperation::remove(0)};
        QVERIFY(result->script() == expected);
    }

    void testRenamedLeaf()
    {
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = binary("a", "c");

        const QSharedPointer<Options> options = makeOptions();
        TreeDiff diff(options);
        std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        EditScript expected{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation(EditType::Replace, 2, 2)};
        QVERIFY(result->script() == expected);

        options->m_bMapRenamedLeaves = false;
        result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        //b and c are only paired top-down if their grams happen to share a bucket.
        if(result->mapping()->hasSrc(2))
        {
            QVERIFY(result->script() == expected);
        }
        else
        {
            expected = {EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation::remove(2), EditOperation::insert(2)};
            QVERIFY(result->script() == expected);
        }
    }

    void testMappingIsInjective()
    {
        QRandomGenerator rng(555);
        const QSharedPointer<Options> options = makeOptions();
        options->m_featureVectorDimension = 64;
        TreeDiff diff(options);

        for(qint32 i = 0; i < 50; ++i)
        {
            SyntaxNodePtr oldRoot = randomProgram(rng);
            SyntaxNodePtr newRoot = mutate(*oldRoot, rng);

            const std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
            QVERIFY(result.has_value());
            const NodeMapping& mapping = result->mapping().value();
            const TreeIndex& oldTree = result->oldTree();
            const TreeIndex& newTree = result->newTree();

            qint32 mapped = 0;
            for(NodeRef o = 0; o < oldTree.size(); ++o)
            {
                const NodeRef n = mapping.getDst(o);
                if(!n.isValid())
                    continue;

                ++mapped;
                QVERIFY(mapping.getSrc(n) == o);
                //Nothing crosses the pre-filter.
                QVERIFY(isComparable(oldTree.node(o), newTree.node(n)));
            }
            QCOMPARE(mapped, mapping.size());

            for(const auto& pair: mapping.pairs())
                QVERIFY(mapping.getDst(pair.first) == pair.second);
        }
    }

    void testMoves()
    {
        SyntaxNodePtr oldRoot = program(list(taggedCall("1"), taggedCall("2"), taggedCall("3")));
        SyntaxNodePtr newRoot = program(list(taggedCall("3"), taggedCall("1"), taggedCall("2")));

        const QSharedPointer<Options> options = makeOptions();
        TreeDiff diff(options);
        std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        const EditScript& script = result->script();
        QCOMPARE(qint32(script.size()), 16);
        QCOMPARE(script.count(EditType::Copy), 16);
        QCOMPARE(script.movedCount(), 3);

        //The calls moved, their contents did not.
        for(const EditOperation& op: script)
            QCOMPARE(op.isMoved(), result->oldTree().node(op.oldRef()).kind() == SyntaxKind::FunctionCall);

        // f3 is old ref 11 and new ref 1
        QVERIFY(result->mapping()->getDst(11) == 1);

        options->m_bDetectMoves = false;
        result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());
        QCOMPARE(result->script().count(EditType::Copy), 16);
        QCOMPARE(result->script().movedCount(), 0);
    }

    void testParseErrorsTakePart()
    {
        SyntaxNodePtr oldRoot = program(list(parseError(list(leaf("x"), leaf("y"))), binary("a", "b")));
        SyntaxNodePtr newRoot = program(list(parseError(list(leaf("x"), leaf("y"))), binary("a", "b"), leaf("z")));

        TreeDiff diff(makeOptions());
        const std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        const NodeRef dst = result->mapping()->getDst(1);
        QVERIFY(dst.isValid());
        QVERIFY(result->newTree().node(dst).kind() == SyntaxKind::ParseError);
        QCOMPARE(result->script().count(EditType::Insert), 1);
        QCOMPARE(result->script().count(EditType::Delete), 0);
    }

    void testCancellation()
    {
        QRandomGenerator rng(9);
        SyntaxNodePtr oldRoot = randomProgram(rng);
        SyntaxNodePtr newRoot = mutate(*oldRoot, rng);

        TreeDiff diff(makeOptions());
        QVERIFY(diff.run(*oldRoot, *newRoot).has_value());

        {
            boost::signals2::scoped_connection connection = diff.wasCancelled.connect([]() { return true; });
            QVERIFY(!diff.run(*oldRoot, *newRoot).has_value());
        }

        //Disconnected again, runs to completion.
        QVERIFY(diff.run(*oldRoot, *newRoot).has_value());
    }

    void testMatcherCancellation()
    {
        SyntaxNodePtr oldRoot = program(list(taggedCall("1"), taggedCall("2"), taggedCall("3")));
        SyntaxNodePtr newRoot = oldRoot->clone();

        const QSharedPointer<Options> options = makeOptions();
        const TreeIndex oldTree(*oldRoot);
        const TreeIndex newTree(*newRoot);
        const GramExtractor extractor(2, 3);
        const FeatureVectorEncoder encoder(64);
        const std::vector<FeatureVector> oldVectors = encoder.encode(oldTree, extractor.extract(oldTree));
        const std::vector<FeatureVector> newVectors = encoder.encode(newTree, extractor.extract(newTree));
        const SimilarityOracle oracle(oldTree, oldVectors, newTree, newVectors, 0.7);

        TreeMatcher matcher(oracle, options);
        std::optional<NodeMapping> mapping = matcher.match();
        QVERIFY(mapping.has_value());
        QCOMPARE(mapping->size(), oldTree.size());

        //Cancel on the third poll.
        qint32 polls = 0;
        matcher.wasCancelled.connect([&polls]() { return ++polls >= 3; });
        mapping = matcher.match();
        QVERIFY(!mapping.has_value());
        QCOMPARE(polls, 3);
    }

    void testKeepMapping()
    {
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = binary("a", "c");

        const QSharedPointer<Options> options = makeOptions();
        options->m_bKeepMapping = false;
        TreeDiff diff(options);

        std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());
        QVERIFY(!result->mapping().has_value());
        QCOMPARE(qint32(result->script().size()), 3);

        options->m_bKeepMapping = true;
        result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result->mapping().has_value());
        QCOMPARE(result->mapping()->size(), 3);
    }

    void testInvalidOptions()
    {
        const QSharedPointer<Options> options = makeOptions();

        options->m_featureVectorDimension = 0;
        QVERIFY_EXCEPTION_THROWN(TreeDiff diff(options), std::system_error);

        options->m_featureVectorDimension = 64;
        options->m_gramStemSize = 0;
        QVERIFY_EXCEPTION_THROWN(TreeDiff diff(options), std::system_error);

        options->m_gramStemSize = 2;
        options->m_gramBaseSize = -1;
        QVERIFY_EXCEPTION_THROWN(TreeDiff diff(options), std::system_error);
    }

    void testOptionsReadOnEveryRun()
    {
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = binary("c", "d");

        const QSharedPointer<Options> options = makeOptions();
        options->m_bMapRenamedLeaves = false;
        TreeDiff diff(options);

        options->m_featureVectorDimension = 0;
        QVERIFY_EXCEPTION_THROWN(static_cast<void>(diff.run(*oldRoot, *newRoot)), std::system_error);

        options->m_featureVectorDimension = 64;
        options->m_gramStemSize = -1;
        QVERIFY_EXCEPTION_THROWN(static_cast<void>(diff.run(*oldRoot, *newRoot)), std::system_error);

        //With a single bucket every two non-empty vectors point the same way.
        options->m_gramStemSize = 2;
        options->m_featureVectorDimension = 1;
        const std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());
        QCOMPARE(result->mapping()->size(), 3);
        QCOMPARE(result->script().count(EditType::Copy), 1);
        QCOMPARE(result->script().count(EditType::Replace), 2);
    }

    void testContainerRecovery()
    {
        // Program[a, b + c, d] -> Program[a, d]
        SyntaxNodePtr oldRoot = program(list(leaf("a"), binary("b", "c"), leaf("d")));
        SyntaxNodePtr newRoot = program(list(leaf("a"), leaf("d")));

        const QSharedPointer<Options> options = makeOptions();
        TreeDiff diff(options);
        std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());
        QVERIFY(result->mapping()->getDst(0) == 0);
        QCOMPARE(result->mapping()->size(), 3);

        //Two of five old descendants mapped is not enough here.
        options->m_bottomUpMinDice = 0.9;
        result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());
        QVERIFY(!result->mapping()->hasSrc(0));
        QCOMPARE(result->mapping()->size(), 2);
        QVERIFY(result->script().verify(result->oldTree(), result->newTree(), result->mapping().value()));

        //Without identical subtrees only d, whose context is unchanged, is found top-down.
        options->m_bottomUpMinDice = 0.5;
        options->m_bottomUpMaxSubtreeSize = 0;
        result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());
        QVERIFY(!result->mapping()->hasSrc(0));
        QCOMPARE(result->mapping()->size(), 1);
        QVERIFY(result->mapping()->getDst(5) == 2);
    }
};

QTEST_MAIN(TreeMatcherTest);

#include "TreeMatcherTest.moc"
