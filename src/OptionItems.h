/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef OPTIONITEMS_H
#define OPTIONITEMS_H

#include "common.h"
#include "Logging.h"
#include "options.h"
#include "TypeUtils.h"

#include <list>

#include <boost/signals2.hpp>

#include <QString>

/*
    Binds one Options member to its save name. Items connect to the signals of the
    Options instance that owns them, so separate Options objects never see each other.
*/
class OptionItemBase
{
  public:
    OptionItemBase(const QString& saveName, Options* owner);
    virtual ~OptionItemBase() = default;

    virtual void setToDefault() = 0;

    virtual void write(ValueMap*) const = 0;
    virtual void read(ValueMap*) = 0;

    void preserve()
    {
        if(!m_bPreserved)
        {
            m_bPreserved = true;
            preserveImp();
        }
    }

    void unpreserve()
    {
        if(m_bPreserved)
        {
            unpreserveImp();
            m_bPreserved = false;
        }
    }

    bool accept(const QString& key, const QString& val);

    [[nodiscard]] QString getSaveName() const { return m_saveName; }
  protected:
    virtual void preserveImp() = 0;
    virtual void unpreserveImp() = 0;
    bool m_bPreserved = false;
    QString m_saveName;
    std::list<boost::signals2::scoped_connection> connections;
    Q_DISABLE_COPY(OptionItemBase)
};

template <class T>
class Option : public OptionItemBase
{
  public:
    explicit Option(Options* owner, const T& defaultVal, const QString& saveName, T* pVar)
        : OptionItemBase(saveName, owner)
    {
        m_pVar = pVar;
        m_defaultVal = defaultVal;
    }

    void setToDefault() override { *m_pVar = m_defaultVal; }
    [[nodiscard]] const T& getDefault() const { return m_defaultVal; };
    [[nodiscard]] const T getCurrent() const { return *m_pVar; };

    void write(ValueMap* config) const override { config->writeEntry(m_saveName, *m_pVar); }
    void read(ValueMap* config) override { *m_pVar = config->readEntry(m_saveName, m_defaultVal); }

  protected:
    void preserveImp() override { m_preservedVal = *m_pVar; }
    void unpreserveImp() override { *m_pVar = m_preservedVal; }
    T* m_pVar = nullptr;
    T m_preservedVal;
    T m_defaultVal;

  private:
    Q_DISABLE_COPY(Option)
};

/*
    Numeric option with a lower bound. Values read below the bound are rejected and the
    default is used instead.
*/
template <class T>
class OptionNum : public Option<T>
{
  public:
    explicit OptionNum(Options* owner, const T& defaultVal, const T& minimum, const QString& saveName, T* pVar)
        : Option<T>(owner, defaultVal, saveName, pVar), m_minimum(minimum)
    {
    }

    void read(ValueMap* config) override
    {
        const T value = config->readEntry(this->m_saveName, this->m_defaultVal);
        if(value < m_minimum)
        {
            qCWarning(ktreediffOptions) << this->m_saveName << "must be at least" << m_minimum << "got" << value << "using" << this->m_defaultVal;
            *this->m_pVar = this->m_defaultVal;
            return;
        }
        *this->m_pVar = value;
    }

    [[nodiscard]] const T& getMinimum() const { return m_minimum; }

  private:
    T m_minimum;
    Q_DISABLE_COPY(OptionNum)
};

typedef Option<bool> OptionBool;
typedef OptionNum<qint32> OptionInt;
typedef OptionNum<double> OptionDouble;

#endif // !OPTIONITEMS_H
