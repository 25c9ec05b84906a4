/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>
#include <QtGlobal>

#include "../combiners.h"

#include <list>

#include <boost/bind/bind.hpp>

class CombinertestTest: public QObject
{
    Q_OBJECT;

  private:
    qint32 calls = 0;

    bool yes() { ++calls; return true; }
    bool no() { ++calls; return false;}

  private Q_SLOTS:
    void init()
    {
        calls = 0;
    }

    void testFindCombiner()
    {
        boost::signals2::signal<bool(), find> test1;
        std::list<boost::signals2::scoped_connection> connections;

        //Nothing connected, nothing found.
        QVERIFY(!test1());

        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));

        QVERIFY(!test1());
        QCOMPARE(calls, 3);
        connections.clear();
    }

    void testFindStopsAtFirstTrue()
    {
        boost::signals2::signal<bool(), find> test1;
        std::list<boost::signals2::scoped_connection> connections;

        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::yes, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));

        QVERIFY(test1());
        QCOMPARE(calls, 2);
        connections.clear();

        calls = 0;
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::yes, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::yes, this)));

        QVERIFY(test1());
        QCOMPARE(calls, 1);
        connections.clear();

        QVERIFY(!test1());
    }
};

QTEST_MAIN(CombinertestTest);

#include "combinertest.moc"
