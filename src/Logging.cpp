/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2019-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Logging.h"

#ifdef NDEBUG
#define logLevel        QtWarningMsg

#else
#define logLevel         QtInfoMsg
#endif

Q_LOGGING_CATEGORY(ktreediffMain, "org.kde.ktreediff", logLevel)
//ktreediffCore logs every node pair and edit operation. Only useful when working on the matcher itself.
Q_LOGGING_CATEGORY(ktreediffCore, "org.kde.ktreediff.core", QtWarningMsg)
Q_LOGGING_CATEGORY(ktreediffMatcher, "org.kde.ktreediff.matcher", logLevel)
Q_LOGGING_CATEGORY(ktreediffOptions, "org.kde.ktreediff.options", logLevel)

#undef logLevel
