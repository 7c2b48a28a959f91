//
// MoneyFmt - Currency-aware money string formatting
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
#pragma once

#include "Common.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace Money {

/// One row of the static currency table. Instances are only ever created by the table itself in Currency.cpp and are
/// handed out as const references/pointers which remain valid for the lifetime of the process.
struct Currency
{
    QString isoCode; ///< e.g. "USD"
    QString name; ///< e.g. "United States Dollar"
    QString symbol; ///< e.g. "$"
    /// e.g. "Cent". nullopt means the currency has no fractional subunit (JPY, KRW, etc), in which case formatting
    /// never shows a decimal mark or fractional digits.
    std::optional<QString> subunit;
    bool symbolFirst = true; ///< true: "$10", false: "10 kr"
    QString thousandsSeparator;
    QString decimalMark;

    bool hasSubunit() const { return subunit.has_value(); }

    /// Returns the table key for `code`: trimmed and lowercased. Lookups are case-insensitive.
    static QString normalizeCode(const QString &code) { return code.trimmed().toLower(); }

    /// Returns a pointer into the static table, or nullptr if `code` is not a known currency. Thread-safe.
    static const Currency *find(const QString &code);
    /// Like find() but throws ConfigurationError if `code` is not a known currency. Thread-safe.
    static const Currency & get(const QString &code);
    /// All table keys (lowercase codes), sorted.
    static QStringList allCodes();
};

} // namespace Money
