/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../Gram.h"
#include "../TreeIndex.h"

#include "TreeFixtures.h"

#include <system_error>

#include <QRandomGenerator>
#include <QTest>

using namespace TreeFixtures;

class GramTest: public QObject
{
    Q_OBJECT;

  private Q_SLOTS:
    void testContextSizeContract()
    {
        QVERIFY_EXCEPTION_THROWN(GramExtractor(0, 3), std::system_error);
        QVERIFY_EXCEPTION_THROWN(GramExtractor(2, 0), std::system_error);
        QVERIFY_EXCEPTION_THROWN(GramExtractor(-1, -1), std::system_error);

        const GramExtractor extractor(1, 1);
        QCOMPARE(extractor.stemSize(), 1);
        QCOMPARE(extractor.baseSize(), 1);
    }

    void testBinaryExpression()
    {
        // a + b
        SyntaxNodePtr root = binary("a", "b");
        const TreeIndex tree(*root);
        const GramExtractor extractor(2, 3);
        const GramBag grams = extractor.extract(tree);

        QCOMPARE(grams.size(), size_t(3));

        const GramLabel plus(Category::MathOperator, SyntaxKind::Fixed);
        const GramLabel identifier(Category::Identifier, SyntaxKind::Leaf);
        const GramLabel absent;

        //Root: nothing above it, both operands below.
        const Gram& rootGram = grams[0];
        QVERIFY(rootGram.stem() == std::vector<GramLabel>({plus, absent}));
        QVERIFY(rootGram.base() == std::vector<GramLabel>({identifier, identifier, absent}));

        //Leaf a: no children, so the base continues with its sibling b.
        const Gram& aGram = grams[1];
        QVERIFY(aGram.stem() == std::vector<GramLabel>({GramLabel(Category::Identifier, SyntaxKind::Leaf, "a"), plus}));
        QVERIFY(aGram.base() == std::vector<GramLabel>({identifier, absent, absent}));

        const Gram& bGram = grams[2];
        QVERIFY(bGram.stem()[0].text() == QStringLiteral("b"));
        QVERIFY(bGram.base() == std::vector<GramLabel>({absent, absent, absent}));

        QVERIFY(aGram != bGram);
    }

    void testOnlyAnchorCarriesText()
    {
        SyntaxNodePtr root = program(list(call("f", list(leaf("x"), leaf("y")))));
        const TreeIndex tree(*root);
        const GramBag grams = GramExtractor(3, 3).extract(tree);

        for(const Gram& gram: grams)
        {
            for(size_t i = 1; i < gram.stem().size(); ++i)
                QVERIFY(gram.stem()[i].text().isEmpty());
            for(const GramLabel& label: gram.base())
                QVERIFY(label.text().isEmpty());
        }
        QCOMPARE(grams[3].stem()[0].text(), QStringLiteral("x"));
    }

    void testLengthAndPadding()
    {
        QRandomGenerator rng(99);
        for(qint32 p = 1; p <= 4; ++p)
        {
            for(qint32 q = 1; q <= 4; ++q)
            {
                SyntaxNodePtr root = randomProgram(rng, 3);
                const TreeIndex tree(*root);
                const GramBag grams = GramExtractor(p, q).extract(tree);

                QCOMPARE(grams.size(), size_t(tree.size()));
                for(const Gram& gram: grams)
                {
                    QCOMPARE(gram.length(), p + q);
                    QVERIFY(!gram.stem()[0].isAbsent());
                }
                //The root has no ancestors to fill the stem.
                if(p > 1)
                    QVERIFY(grams[0].stem()[1].isAbsent());
            }
        }
    }

    void testSubtreeGrams()
    {
        QRandomGenerator rng(7);
        const GramExtractor extractor(2, 3);
        for(qint32 i = 0; i < 20; ++i)
        {
            SyntaxNodePtr root = randomProgram(rng);
            const TreeIndex tree(*root);
            const GramBag grams = extractor.extract(tree);

            for(NodeRef ref = 0; ref < tree.size(); ++ref)
            {
                const GramBag subtree = GramExtractor::subtreeGrams(tree, grams, ref);
                QCOMPARE(qint32(subtree.size()), tree.subtreeSize(ref));
                QVERIFY(subtree.front() == grams[ref]);
            }
        }
    }

    void testDeterministicHash()
    {
        QRandomGenerator rng(1234);
        SyntaxNodePtr root = randomProgram(rng);
        SyntaxNodePtr copy = root->clone();

        const GramExtractor extractor(2, 3);
        const TreeIndex tree(*root);
        const TreeIndex copyTree(*copy);
        const GramBag grams = extractor.extract(tree);
        const GramBag copyGrams = extractor.extract(copyTree);

        QCOMPARE(grams.size(), copyGrams.size());
        for(size_t i = 0; i < grams.size(); ++i)
        {
            QVERIFY(grams[i] == copyGrams[i]);
            QCOMPARE(grams[i].hash(), copyGrams[i].hash());
        }

        QVERIFY(GramLabel().hash() != GramLabel(Category::Other, SyntaxKind::Leaf).hash());
        QVERIFY(GramLabel() == GramLabel());
        QVERIFY(GramLabel() != GramLabel(Category::Other, SyntaxKind::Leaf));
    }

    void testParseErrorNodesHaveGrams()
    {
        SyntaxNodePtr root = program(list(parseError(list(leaf("x"))), binary("a", "b")));
        const TreeIndex tree(*root);
        const GramBag grams = GramExtractor(2, 3).extract(tree);

        QVERIFY(grams[1].stem()[0].kind() == SyntaxKind::ParseError);
        QVERIFY(grams[1].stem()[0].category() == Category::ParseError);
        QVERIFY(grams[1].base()[0].category() == Category::Identifier);
    }
};

QTEST_MAIN(GramTest);

#include "GramTest.moc"
