/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2019-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "options.h"

#include "combiners.h"
#include "common.h"
#include "Logging.h"
#include "OptionItems.h"

#include <cassert>

#include <boost/bind/bind.hpp>
#include <boost/signals2.hpp>
#include <memory>

#include <QTextStream>

OptionItemBase::OptionItemBase(const QString& saveName, Options* owner)
{
    assert(owner != nullptr);
    m_saveName = saveName;

    connections.push_back(owner->resetToDefaults.connect(boost::bind(&OptionItemBase::setToDefault, this)));

    connections.push_back(owner->read.connect(boost::bind(&OptionItemBase::read, this, boost::placeholders::_1)));
    connections.push_back(owner->write.connect(boost::bind(&OptionItemBase::write, this, boost::placeholders::_1)));

    connections.push_back(owner->preserve.connect(boost::bind(&OptionItemBase::preserve, this)));
    connections.push_back(owner->unpreserve.connect(boost::bind(&OptionItemBase::unpreserve, this)));

    connections.push_back(owner->accept.connect(boost::bind(&OptionItemBase::accept, this, boost::placeholders::_1, boost::placeholders::_2)));
}

bool OptionItemBase::accept(const QString& key, const QString& val)
{
    if(getSaveName() != key)
        return false;

    preserve();

    ValueMap config;
    config.writeEntry(key, val); // Write the value as a string and
    read(&config);               // use the internal conversion from string to the needed value.

    return true;
}

Options::Options()
{
    init();
}

Options::~Options() = default;

void Options::init()
{
    addOptionItem(std::make_shared<OptionInt>(this, 2, 1, "GramStemSize", &m_gramStemSize));
    addOptionItem(std::make_shared<OptionInt>(this, 3, 1, "GramBaseSize", &m_gramBaseSize));
    addOptionItem(std::make_shared<OptionInt>(this, 64, 1, "FeatureVectorDimension", &m_featureVectorDimension));

    addOptionItem(std::make_shared<OptionDouble>(this, 0.7, 0.0, "SimilarityThreshold", &m_similarityThreshold));
    addOptionItem(std::make_shared<OptionInt>(this, 3, 0, "BottomUpMaxSubtreeSize", &m_bottomUpMaxSubtreeSize));
    addOptionItem(std::make_shared<OptionDouble>(this, 0.5, 0.0, "BottomUpMinDice", &m_bottomUpMinDice));
    addOptionItem(std::make_shared<OptionBool>(this, true, "MapRenamedLeaves", &m_bMapRenamedLeaves));

    addOptionItem(std::make_shared<OptionBool>(this, true, "DetectMoves", &m_bDetectMoves));
    addOptionItem(std::make_shared<OptionBool>(this, false, "KeepMapping", &m_bKeepMapping));
}

void Options::save(QTextStream& ts)
{
    ValueMap config;

    unpreserve();
    write(&config);
    config.save(ts);
}

void Options::load(QTextStream& ts)
{
    ValueMap config;

    config.load(ts);
    read(&config);
    qCInfo(ktreediffOptions) << "Options loaded.";
}

const QString Options::parseOptions(const QStringList& optionList)
{
    QString result;

    for(const QString& optionString: optionList)
    {
        qint32 pos = optionString.indexOf('=');
        if(pos > 0) // seems not to have a tag
        {
            const QString key = optionString.left(pos);
            const QString val = optionString.mid(pos + 1);

            bool bFound = accept(key, val);

            if(!bFound)
            {
                result += "No config item named \"" + key + "\"\n";
            }
        }
        else
        {
            result += "No '=' found in \"" + optionString + "\"\n";
        }
    }

    if(!result.isEmpty())
        qCWarning(ktreediffOptions).noquote() << result.trimmed();
    return result;
}

QString Options::calcOptionHelp()
{
    ValueMap config;

    write(&config);

    return config.getAsString();
}

void Options::addOptionItem(std::shared_ptr<OptionItemBase> inItem)
{
    mOptionItemList.push_back(inItem);
}
