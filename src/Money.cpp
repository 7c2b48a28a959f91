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
#include "Compat.h"
#include "Money.h"
#include "Util.h"

#include <QStringList>

#include <array>
#include <cmath>
#include <utility>

namespace Money {

namespace {
    using BoolMember = bool Options::*;
    using BoolKey = std::pair<const char *, BoolMember>;
    constexpr std::array<BoolKey, 5> boolKeys = {{
        { Options::kWithCents, &Options::withCents },
        { Options::kWithCurrency, &Options::withCurrency },
        { Options::kWithSymbol, &Options::withSymbol },
        { Options::kWithSymbolSpace, &Options::withSymbolSpace },
        { Options::kWithThousandsSeparator, &Options::withThousandsSeparator },
    }};

    BoolMember boolMemberForKey(const QString &key) {
        for (const auto & [k, member] : boolKeys)
            if (key == QLatin1String(k))
                return member;
        return nullptr;
    }
} // namespace

/* static */
QStringList Options::allKeys()
{
    QStringList ret{kCurrency};
    for (const auto & [k, member] : boolKeys)
        ret.push_back(k);
    return ret;
}

/* static */
Options Options::fromMap(const QVariantMap &map, const Options &base)
{
    Options ret(base);
    for (auto it = map.cbegin(); it != map.cend(); ++it) {
        const QString & key = it.key();
        const QVariant & val = it.value();
        if (key == QLatin1String(kCurrency)) {
            if (const auto t = Compat::VarType(val); t != QMetaType::QString && t != QMetaType::QByteArray)
                throw ConfigurationError(QString("Option \"%1\" must be a string, got: %2")
                                         .arg(key, Compat::VarTypeName(val)));
            const QString code = val.toString();
            if (!Currency::find(code))
                throw ConfigurationError(QString("Option \"%1\": unknown currency code \"%2\"")
                                         .arg(key, Util::Ellipsify(code, 16)));
            ret.currency = Currency::normalizeCode(code);
        } else if (auto member = boolMemberForKey(key)) {
            if (Compat::VarType(val) != QMetaType::Bool)
                throw ConfigurationError(QString("Option \"%1\" must be a bool, got: %2")
                                         .arg(key, Compat::VarTypeName(val)));
            ret.*member = val.toBool();
        } else {
            throw ConfigurationError(QString("Unrecognized option \"%1\", valid options are: %2")
                                     .arg(Util::Ellipsify(key, 32), allKeys().join(", ")));
        }
    }
    return ret;
}

QVariantMap Options::toMap() const
{
    QVariantMap m;
    m[kCurrency] = currency;
    for (const auto & [k, member] : boolKeys)
        m[k] = this->*member;
    return m;
}

SplitValue splitValue(double value)
{
    if (!std::isfinite(value))
        throw BadArgs(QString("Cannot format a non-finite amount: %1").arg(value));
    // Round the magnitude exactly once so that a carry out of the fraction lands in the integer part,
    // e.g. 0.999 -> "1.00". QString::number() always uses the C locale, so the mark is always '.'.
    const QString fixed = QString::number(std::abs(value), 'f', 2);
    const auto dot = fixed.indexOf(QChar('.'));
    if (dot < 1 || fixed.size() - dot != 3)
        throw InternalError(QString("Unexpected fixed-point rendering of %1: \"%2\"").arg(value).arg(fixed));
    SplitValue ret;
    ret.integer = fixed.left(dot);
    ret.fractional = fixed.mid(dot + 1);
    ret.negative = value < 0. && fixed != QLatin1String("0.00");
    return ret;
}

QString separateThousands(const QString &digits, const QString &separator)
{
    const int len = int(digits.size());
    const int lead = len % 3; // size of the leading short group, if any
    const int nGroups = len / 3 + (lead ? 1 : 0);
    if (nGroups <= 1)
        return digits;
    QStringList groups;
    groups.reserve(nGroups);
    int pos = 0;
    if (lead) {
        groups.push_back(digits.left(lead));
        pos = lead;
    }
    for ( ; pos < len; pos += 3)
        groups.push_back(digits.mid(pos, 3));
    return groups.join(separator);
}

QString addSymbol(const QString &amount, const Currency &currency, bool withSymbolSpace)
{
    const QString space = withSymbolSpace ? QStringLiteral(" ") : QString();
    if (currency.symbolFirst)
        return currency.symbol + space + amount;
    return amount + space + currency.symbol;
}

QString format(double value, const Options &opts)
{
    const Currency & currency = Currency::get(opts.currency); // throws on unknown currency
    const auto [negative, integer, fractional] = splitValue(value); // throws on NaN/inf

    QString result = opts.withThousandsSeparator ? separateThousands(integer, currency.thousandsSeparator) : integer;

    const bool showFraction = opts.withCents && currency.hasSubunit();
    if (showFraction)
        result += currency.decimalMark + fractional;

    // The sign goes directly before the integer digits, and is omitted if every digit shown is a zero
    // (e.g. -0.4 with cents disabled is just "$0").
    if (negative && (integer != QLatin1String("0") || (showFraction && fractional != QLatin1String("00"))))
        result.prepend(QChar('-'));

    if (opts.withSymbol)
        result = addSymbol(result, currency, opts.withSymbolSpace);

    if (opts.withCurrency)
        result += QChar(' ') + currency.isoCode;

    TraceM("Money::format(", QString::number(value, 'g', 17), ", ", currency.isoCode, ") -> \"", result, "\"");
    return result;
}

QString format(double value, const QVariantMap &opts)
{
    return format(value, Options::fromMap(opts));
}

} // namespace Money
