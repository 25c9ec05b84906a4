/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef COMMON_H
#define COMMON_H

#include <map>

#include <QString>

class QTextStream;

class ValueMap
{
  private:
    std::map<QString, QString> m_map;

  public:
    ValueMap();
    virtual ~ValueMap();

    void save(QTextStream& ts) const;
    void load(QTextStream& ts);
    [[nodiscard]] QString getAsString() const;
    [[nodiscard]] bool contains(const QString& key) const { return m_map.find(key) != m_map.end(); }

    virtual void writeEntry(const QString&, qint32);
    virtual void writeEntry(const QString&, bool);
    virtual void writeEntry(const QString&, double);
    virtual void writeEntry(const QString&, const QString&);

    QString     readEntry(const QString& s, const QString& defaultVal);
    bool        readEntry(const QString& s, bool bDefault);
    qint32      readEntry(const QString& s, qint32 iDefault);
    double      readEntry(const QString& s, double dDefault);

  private:
    virtual bool        readBoolEntry(const QString&, bool bDefault);
    virtual qint32      readNumEntry(const QString&, qint32 iDefault);
    virtual double      readDoubleEntry(const QString&, double dDefault);
    virtual QString     readStringEntry(const QString&, const QString&);
};

#endif
