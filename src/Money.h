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
#include "Currency.h"

#include <QString>
#include <QVariantMap>

/// Currency-aware formatting of monetary amounts, e.g. Money::format(1000) -> "$1,000.00"
namespace Money {

/// Display options for format(). A default-constructed instance is fully specified.
struct Options
{
    QString currency = QStringLiteral("usd"); ///< key into the currency table (case-insensitive)
    bool withCents = true; ///< include the decimal mark and fractional digits (if the currency has a subunit)
    bool withCurrency = false; ///< append " " + ISO code
    bool withSymbol = true; ///< include the currency symbol
    bool withSymbolSpace = false; ///< put a space between the symbol and the amount
    bool withThousandsSeparator = true; ///< group the integer digits

    /// Map keys accepted by fromMap() and produced by toMap()
    static constexpr auto kCurrency = "currency", kWithCents = "with_cents", kWithCurrency = "with_currency",
                          kWithSymbol = "with_symbol", kWithSymbolSpace = "with_symbol_space",
                          kWithThousandsSeparator = "with_thousands_separator";
    static QStringList allKeys();

    /// Returns `base` overridden key-by-key by the entries in `map`. Unspecified keys retain their value from `base`.
    ///
    /// Throws ConfigurationError if `map` contains an unrecognized key, a bool key whose value is not a bool, or a
    /// "currency" whose value is not a string or is not a known currency code. Values are never coerced, so e.g.
    /// QVariant("true") for "with_cents" is rejected.
    static Options fromMap(const QVariantMap &map, const Options &base = {});

    /// The inverse of fromMap(): all 6 keys with their current values.
    QVariantMap toMap() const;

    bool operator==(const Options &) const = default;
};

/// The transient result of splitValue()
struct SplitValue
{
    bool negative = false; ///< true if the value is < 0 and its rounded magnitude is nonzero
    QString integer; ///< digits of the magnitude's integer part, e.g. "1234". Never empty.
    QString fractional; ///< exactly 2 digits, e.g. "05"

    bool operator==(const SplitValue &) const = default;
};

/// Splits `value` into its integer digits and 2 fractional digits, rounding the magnitude to 2 decimal places first.
/// Rounding may carry into the integer part, e.g. 0.999 -> {"1", "00"}. Throws BadArgs if `value` is not finite.
SplitValue splitValue(double value);

/// Inserts `separator` between every group of 3 digits, counting from the right, e.g. ("1234567", ",") ->
/// "1,234,567". Inputs of 3 or fewer characters (including the empty string) are returned unchanged.
QString separateThousands(const QString &digits, const QString &separator);

/// Prepends or appends currency.symbol to `amount` according to currency.symbolFirst, with an optional single space
/// in between.
QString addSymbol(const QString &amount, const Currency &currency, bool withSymbolSpace);

/// Formats `value` according to `opts`. Throws ConfigurationError if opts.currency is unknown, or BadArgs if `value`
/// is NaN or infinite. Thread-safe.
QString format(double value, const Options &opts = {});

/// Convenience: format(value, Options::fromMap(opts)).
QString format(double value, const QVariantMap &opts);

} // namespace Money
