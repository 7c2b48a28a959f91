//
// MoneyFmt - Currency-aware money string formatting
// Copyright (C) 2019-2025 Calin A. Culianu <calin.culianu@gmail.com>
// Copyright (C) 2026 The MoneyFmt developers
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program (see LICENSE.txt).  If not, see
// <https://www.gnu.org/licenses/>.
//
#include "Common.h"

#include <limits>

Exception::~Exception() {}
InternalError::~InternalError() {}
BadArgs::~BadArgs() {}
ConfigurationError::~ConfigurationError() {}

#if !defined(_MSC_VER)
static_assert (__cplusplus >= 202002L, "C++20 standard assumed");
#endif

// Money::splitValue() relies on IEEE 754 doubles for its finite check and for QString::number(x, 'f', 2).
static_assert (std::numeric_limits<double>::is_iec559, "IEEE 754 double assumed");
static_assert (std::numeric_limits<double>::has_infinity && std::numeric_limits<double>::has_quiet_NaN,
               "double must support infinity and NaN");
