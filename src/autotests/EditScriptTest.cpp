/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../EditScript.h"
#include "../NodeMapping.h"
#include "../options.h"
#include "../TreeDiff.h"
#include "../TreeIndex.h"

#include "TreeFixtures.h"

#include <QRandomGenerator>
#include <QSharedPointer>
#include <QTest>

using namespace TreeFixtures;

class EditScriptTest: public QObject
{
    Q_OBJECT;

  private Q_SLOTS:
    void testTypeNames()
    {
        QCOMPARE(editTypeName(EditType::Insert), QStringLiteral("Insert"));
        QCOMPARE(editTypeName(EditType::Delete), QStringLiteral("Delete"));
        QCOMPARE(editTypeName(EditType::Replace), QStringLiteral("Replace"));
        QCOMPARE(editTypeName(EditType::Copy), QStringLiteral("Copy"));

        const EditOperation insert = EditOperation::insert(4);
        QVERIFY(insert.type() == EditType::Insert);
        QVERIFY(!insert.oldRef().isValid());
        QVERIFY(insert.newRef() == 4);
        QVERIFY(!insert.isMoved());

        const EditOperation remove = EditOperation::remove(2);
        QVERIFY(remove.type() == EditType::Delete);
        QVERIFY(remove.oldRef() == 2);
        QVERIFY(!remove.newRef().isValid());

        QVERIFY(EditOperation(EditType::Copy, 1, 1, true) != EditOperation(EditType::Copy, 1, 1));
    }

    void testCounts()
    {
        const EditScript script{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 2, true), EditOperation::remove(2),
                                EditOperation::insert(1), EditOperation::insert(3), EditOperation(EditType::Replace, 3, 4)};

        QCOMPARE(script.count(EditType::Copy), 2);
        QCOMPARE(script.count(EditType::Insert), 2);
        QCOMPARE(script.count(EditType::Delete), 1);
        QCOMPARE(script.count(EditType::Replace), 1);
        QCOMPARE(script.movedCount(), 1);
    }

    void testBuildFromMapping()
    {
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = binary("a", "c");
        const TreeIndex oldTree(*oldRoot);
        const TreeIndex newTree(*newRoot);

        NodeMapping mapping(oldTree.size(), newTree.size());
        mapping.link(0, 0);
        mapping.link(1, 1);
        mapping.link(2, 2);

        const EditScript script = EditScriptBuilder(oldTree, newTree, mapping, true).build();
        const EditScript expected{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation(EditType::Replace, 2, 2)};
        QVERIFY(script == expected);
        QVERIFY(script.verify(oldTree, newTree, mapping));
    }

    void testSwappedOperands()
    {
        // a + b -> b + a, mapped crosswise
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = binary("b", "a");
        const TreeIndex oldTree(*oldRoot);
        const TreeIndex newTree(*newRoot);

        NodeMapping mapping(oldTree.size(), newTree.size());
        mapping.link(0, 0);
        mapping.link(1, 2);
        mapping.link(2, 1);

        const EditScript script = EditScriptBuilder(oldTree, newTree, mapping, true).build();
        QCOMPARE(script.count(EditType::Copy), 3);
        QCOMPARE(script.movedCount(), 2);
        QVERIFY(script[1] == EditOperation(EditType::Copy, 2, 1, true));
        QVERIFY(script.verify(oldTree, newTree, mapping));

        const EditScript unmoved = EditScriptBuilder(oldTree, newTree, mapping, false).build();
        QCOMPARE(unmoved.movedCount(), 0);
    }

    void testCompactDelete()
    {
        // Program[a, b + c, d] -> Program[a, d]
        SyntaxNodePtr oldRoot = program(list(leaf("a"), binary("b", "c"), leaf("d")));
        SyntaxNodePtr newRoot = program(list(leaf("a"), leaf("d")));

        const QSharedPointer<Options> options = QSharedPointer<Options>::create();
        options->m_bKeepMapping = true;
        options->m_featureVectorDimension = 4096;
        TreeDiff diff(options);

        const std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
        QVERIFY(result.has_value());

        //One Delete for the whole operator subtree, placed where it used to be.
        const EditScript expected{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation::remove(2),
                                  EditOperation(EditType::Copy, 5, 2)};
        QVERIFY(result->script() == expected);
    }

    void testInsertedSubtreeKeepsMappedDescendants()
    {
        SyntaxNodePtr oldRoot = program(list(binary("a", "b")));
        SyntaxNodePtr newRoot = program(list(leaf("x")));
        const TreeIndex oldTree(*oldRoot);
        const TreeIndex newTree(*newRoot);

        //Only the leaves correspond; both roots are unmapped.
        NodeMapping mapping(oldTree.size(), newTree.size());
        mapping.link(2, 1);

        const EditScript script = EditScriptBuilder(oldTree, newTree, mapping, true).build();
        const EditScript expected{EditOperation::insert(0), EditOperation(EditType::Replace, 2, 1), EditOperation::remove(0)};
        QVERIFY(script == expected);
        QVERIFY(script.verify(oldTree, newTree, mapping));
    }

    void testVerifyRejects()
    {
        SyntaxNodePtr oldRoot = binary("a", "b");
        SyntaxNodePtr newRoot = binary("a", "c");
        const TreeIndex oldTree(*oldRoot);
        const TreeIndex newTree(*newRoot);

        NodeMapping mapping(oldTree.size(), newTree.size());
        mapping.link(0, 0);
        mapping.link(1, 1);

        const EditScript good{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation::remove(2), EditOperation::insert(2)};
        QVERIFY(good.verify(oldTree, newTree, mapping));

        //Old node 2 not accounted for.
        const EditScript missing{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation::insert(2)};
        QVERIFY(!missing.verify(oldTree, newTree, mapping));

        //Old node 2 twice.
        EditScript twice = good;
        twice.push_back(EditOperation::remove(2));
        QVERIFY(!twice.verify(oldTree, newTree, mapping));

        //Labels are equal, so Replace is wrong.
        const EditScript replace{EditOperation(EditType::Replace, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation::remove(2), EditOperation::insert(2)};
        QVERIFY(!replace.verify(oldTree, newTree, mapping));

        //Copy of a pair that is not in the mapping.
        const EditScript unmapped{EditOperation(EditType::Copy, 0, 0), EditOperation(EditType::Copy, 1, 1), EditOperation(EditType::Copy, 2, 2)};
        QVERIFY(!unmapped.verify(oldTree, newTree, mapping));

        //Delete of a mapped node.
        const EditScript mappedDelete{EditOperation::remove(0), EditOperation::insert(0)};
        QVERIFY(!mappedDelete.verify(oldTree, newTree, mapping));
    }

    void testRandomScriptsVerify()
    {
        QRandomGenerator rng(424242);
        const QSharedPointer<Options> options = QSharedPointer<Options>::create();
        options->m_bKeepMapping = true;
        TreeDiff diff(options);

        for(qint32 i = 0; i < 100; ++i)
        {
            SyntaxNodePtr oldRoot = randomProgram(rng);
            SyntaxNodePtr newRoot = mutate(*oldRoot, rng);

            const std::optional<TreeDiffResult> result = diff.run(*oldRoot, *newRoot);
            QVERIFY(result.has_value());

            const EditScript& script = result->script();
            const NodeMapping& mapping = result->mapping().value();
            QVERIFY(script.verify(result->oldTree(), result->newTree(), mapping));
            QCOMPARE(script.count(EditType::Copy) + script.count(EditType::Replace), mapping.size());

            for(const EditOperation& op: script)
            {
                if(op.type() != EditType::Insert)
                    continue;
                //Only the top of an inserted run is reported.
                const NodeRef parent = result->newTree().parent(op.newRef());
                QVERIFY(!parent.isValid() || mapping.hasDst(parent));
            }
        }
    }
};

QTEST_MAIN(EditScriptTest);

#include "EditScriptTest.moc"
