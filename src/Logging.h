/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2019-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef LOGGING_H
#define LOGGING_H
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ktreediffMain);

Q_DECLARE_LOGGING_CATEGORY(ktreediffCore); //very noisey shows every accepted pair and emitted edit.
Q_DECLARE_LOGGING_CATEGORY(ktreediffMatcher);
Q_DECLARE_LOGGING_CATEGORY(ktreediffOptions);

#endif // !LOGGING_H
