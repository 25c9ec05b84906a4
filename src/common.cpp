/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "common.h"

#include "Logging.h"
#include "TypeUtils.h"

#include <map>
#include <utility>            // for pair

#include <QStringLiteral>
#include <QTextStream>

ValueMap::ValueMap() = default;

ValueMap::~ValueMap() = default;

void ValueMap::save(QTextStream& ts) const
{
    for(const auto &entry: m_map)
    {
        const QString key = entry.first;
        const QString val = entry.second;
        ts << key << "=" << val << "\n";
    }
}

QString ValueMap::getAsString() const
{
    QString result;

    for(const auto &entry: m_map)
    {
        const QString key = entry.first;
        const QString val = entry.second;
        result += key + '=' + val + '\n';
    }
    return result;
}

void ValueMap::load(QTextStream& ts)
{
    while(!ts.atEnd())
    {                              // until end of file...
        QString s = ts.readLine(); // line of text excluding '\n'
        if(s.trimmed().isEmpty() || s.startsWith('#'))
            continue;

        QtSizeType pos = s.indexOf('=');
        if(pos > 0) // seems not to have a tag
        {
            QString key = s.left(pos).trimmed();
            QString val = s.mid(pos + 1).trimmed();
            m_map[key] = val;
        }
        else
        {
            qCWarning(ktreediffOptions) << "Ignoring option line without key:" << s;
        }
    }
}

void ValueMap::writeEntry(const QString& k, qint32 v)
{
    m_map[k].setNum(v);
}

void ValueMap::writeEntry(const QString& k, bool v)
{
    m_map[k].setNum(v);
}

void ValueMap::writeEntry(const QString& k, double v)
{
    //QString::setNum always uses QLocale::C so the stream stays portable.
    m_map[k].setNum(v, 'g', 17);
}

void ValueMap::writeEntry(const QString& k, const QString& v)
{
    m_map[k] = v;
}

bool ValueMap::readBoolEntry(const QString& k, bool bDefault)
{
    bool b = bDefault;
    std::map<QString, QString>::iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        const QString s = i->second.toLower();
        if(s == QStringLiteral("1") || s == QStringLiteral("true"))
            b = true;
        else if(s == QStringLiteral("0") || s == QStringLiteral("false"))
            b = false;
        else
            qCWarning(ktreediffOptions) << "Invalid boolean" << i->second << "for" << k << "using" << bDefault;
    }

    return b;
}

qint32 ValueMap::readNumEntry(const QString& k, qint32 iDefault)
{
    qint32 ival = iDefault;
    std::map<QString, QString>::iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        bool ok = false;
        const qint32 parsed = i->second.toInt(&ok);
        if(ok)
            ival = parsed;
        else
            qCWarning(ktreediffOptions) << "Invalid number" << i->second << "for" << k << "using" << iDefault;
    }

    return ival;
}

double ValueMap::readDoubleEntry(const QString& k, double dDefault)
{
    double dval = dDefault;
    std::map<QString, QString>::iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        bool ok = false;
        const double parsed = i->second.toDouble(&ok);
        if(ok)
            dval = parsed;
        else
            qCWarning(ktreediffOptions) << "Invalid number" << i->second << "for" << k << "using" << dDefault;
    }

    return dval;
}

QString ValueMap::readStringEntry(const QString& k, const QString& sDefault)
{
    QString sval = sDefault;
    std::map<QString, QString>::iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        sval = i->second;
    }

    return sval;
}

QString ValueMap::readEntry(const QString& s, const QString& defaultVal)
{
    return readStringEntry(s, defaultVal);
}
bool ValueMap::readEntry(const QString& s, bool bDefault)
{
    return readBoolEntry(s, bDefault);
}
qint32 ValueMap::readEntry(const QString& s, qint32 iDefault)
{
    return readNumEntry(s, iDefault);
}
double ValueMap::readEntry(const QString& s, double dDefault)
{
    return readDoubleEntry(s, dDefault);
}
