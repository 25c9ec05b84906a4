// clang-format off
/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on
#ifndef TYPEUTILS_H
#define TYPEUTILS_H

#include <QtGlobal>

#include <stdlib.h>
#include <type_traits>
#include <limits>

#include <boost/safe_numerics/automatic.hpp>
#include <boost/safe_numerics/safe_integer.hpp>
#include <boost/safe_numerics/safe_integer_range.hpp>

using QtSizeType = qsizetype;

template <typename T>
using limits = std::numeric_limits<T>;

using KTreeDiff_exception_policy = boost::safe_numerics::exception_policy<
    boost::safe_numerics::throw_exception, // arithmetic error
    boost::safe_numerics::trap_exception,  // implementation defined behavior
    boost::safe_numerics::trap_exception,  // undefined behavior
    boost::safe_numerics::trap_exception   // uninitialized value
>;

template <typename T, T MIN = limits<T>::min(), T MAX = limits<T>::max()>
using SafeSignedRange =
    boost::safe_numerics::safe_signed_range<MIN, MAX>;

template <typename T>
using SafeInt = boost::safe_numerics::safe<T, boost::safe_numerics::automatic, KTreeDiff_exception_policy>;

/*
    Parameters a caller must keep strictly positive. Constructing one of these from a value
    outside the range throws std::system_error, which is how contract violations
    (non-positive feature vector dimension, empty gram context) fail fast.
*/
using Dimension = SafeSignedRange<qint32, 1>;
using ContextSize = SafeSignedRange<qint32, 1>;

#endif
