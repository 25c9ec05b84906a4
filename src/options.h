/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef OPTIONS_H
#define OPTIONS_H

#include "combiners.h"

#include <boost/signals2.hpp>
#include <list>
#include <memory>

#include <QString>
#include <QStringList>

class QTextStream;

class ValueMap;

class OptionItemBase;

class Options
{
  public:
    // Declared before the option items so the items disconnect before the signals go away.
    boost::signals2::signal<void()> resetToDefaults;
    boost::signals2::signal<void(ValueMap*)> read;
    boost::signals2::signal<void(ValueMap*)> write;

    boost::signals2::signal<void()> preserve;
    boost::signals2::signal<void()> unpreserve;
    boost::signals2::signal<bool(const QString&, const QString&), find> accept;

    Options();
    ~Options();

    // key=value lines, unknown keys are kept but ignored.
    void load(QTextStream& ts);
    // Values overridden by parseOptions are restored first and are not written.
    void save(QTextStream& ts);

    // Applies "key=value" strings. Returns one line per unknown key or malformed entry, empty on success.
    const QString parseOptions(const QStringList& optionList);
    [[nodiscard]] QString calcOptionHelp();

  private:
    void init();
    void addOptionItem(std::shared_ptr<OptionItemBase> inItem);

    std::list<std::shared_ptr<OptionItemBase>> mOptionItemList;

  public:
    // Gram shape: p ancestors including the anchor, q children or following siblings.
    qint32 m_gramStemSize = 2;
    qint32 m_gramBaseSize = 3;
    qint32 m_featureVectorDimension = 64;

    // Largest distance at which two subtrees are still considered the same construct.
    double m_similarityThreshold = 0.7;
    qint32 m_bottomUpMaxSubtreeSize = 3;
    // Smallest share of mapped descendants for two unmatched containers to be paired.
    double m_bottomUpMinDice = 0.5;
    bool m_bMapRenamedLeaves = true;

    bool m_bDetectMoves = true;
    bool m_bKeepMapping = false;

  private:
    Q_DISABLE_COPY(Options)
};

#endif
