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
#include "Currency.h"
#include "Util.h"

#include <QMap>

namespace Money {

namespace {
    struct Row {
        const char *code, *isoCode, *name, *symbol;
        const char *subunit; ///< nullptr for zero-decimal currencies
        bool symbolFirst;
        const char *thousandsSeparator, *decimalMark;
    };

    // NB: Source file is UTF-8; QString(const char *) interprets the literals below as UTF-8.
    constexpr Row rows[] = {
        // code   iso    name                           symbol  subunit      first  thou  dec
        { "aud", "AUD", "Australian Dollar",            "$",    "Cent",      true,  ",",  "." },
        { "ars", "ARS", "Argentine Peso",               "$",    "Centavo",   true,  ".",  "," },
        { "brl", "BRL", "Brazilian Real",               "R$",   "Centavo",   true,  ".",  "," },
        { "cad", "CAD", "Canadian Dollar",              "$",    "Cent",      true,  ",",  "." },
        { "chf", "CHF", "Swiss Franc",                  "CHF",  "Rappen",    true,  ",",  "." },
        { "clp", "CLP", "Chilean Peso",                 "$",    nullptr,     true,  ".",  "," },
        { "cny", "CNY", "Chinese Renminbi Yuan",        "¥",    "Fen",       true,  ",",  "." },
        { "czk", "CZK", "Czech Koruna",                 "Kč",   "Haléř",     false, " ",  "," },
        { "dkk", "DKK", "Danish Krone",                 "kr.",  "Øre",       false, ".",  "," },
        { "eur", "EUR", "Euro",                         "€",    "Cent",      true,  ",",  "." },
        { "gbp", "GBP", "British Pound",                "£",    "Penny",     true,  ",",  "." },
        { "hkd", "HKD", "Hong Kong Dollar",             "$",    "Cent",      true,  ",",  "." },
        { "huf", "HUF", "Hungarian Forint",             "Ft",   "Fillér",    false, " ",  "," },
        { "ils", "ILS", "Israeli New Sheqel",           "₪",    "Agora",     true,  ",",  "." },
        { "inr", "INR", "Indian Rupee",                 "₹",    "Paisa",     true,  ",",  "." },
        { "isk", "ISK", "Icelandic Króna",              "kr.",  nullptr,     false, ".",  "," },
        { "jpy", "JPY", "Japanese Yen",                 "¥",    nullptr,     true,  ",",  "." },
        { "krw", "KRW", "South Korean Won",             "₩",    nullptr,     true,  ",",  "." },
        { "mxn", "MXN", "Mexican Peso",                 "$",    "Centavo",   true,  ",",  "." },
        { "nok", "NOK", "Norwegian Krone",              "kr",   "Øre",       false, ".",  "," },
        { "nzd", "NZD", "New Zealand Dollar",           "$",    "Cent",      true,  ",",  "." },
        { "pln", "PLN", "Polish Złoty",                 "zł",   "Grosz",     false, " ",  "," },
        { "pyg", "PYG", "Paraguayan Guaraní",           "₲",    nullptr,     true,  ".",  "," },
        { "rub", "RUB", "Russian Ruble",                "₽",    "Kopeck",    false, ".",  "," },
        { "sek", "SEK", "Swedish Krona",                "kr",   "Öre",       false, " ",  "," },
        { "sgd", "SGD", "Singapore Dollar",             "$",    "Cent",      true,  ",",  "." },
        { "try", "TRY", "Turkish Lira",                 "₺",    "Kuruş",     false, ".",  "," },
        { "ugx", "UGX", "Ugandan Shilling",             "USh",  nullptr,     false, ",",  "." },
        { "usd", "USD", "United States Dollar",         "$",    "Cent",      true,  ",",  "." },
        { "vnd", "VND", "Vietnamese Đồng",              "₫",    nullptr,     false, ".",  "," },
        { "zar", "ZAR", "South African Rand",           "R",    "Cent",      true,  ",",  "." },
    };

    using Table = QMap<QString, Currency>;

    const Table & table() {
        // C++11 guarantees thread-safe initialization of function-local statics. After this the table is read-only.
        static const Table t = [] {
            Table ret;
            for (const auto & r : rows) {
                Currency c;
                c.isoCode = r.isoCode;
                c.name = r.name;
                c.symbol = r.symbol;
                if (r.subunit) c.subunit = QString(r.subunit);
                c.symbolFirst = r.symbolFirst;
                c.thousandsSeparator = r.thousandsSeparator;
                c.decimalMark = r.decimalMark;
                ret.insert(QString(r.code), c);
            }
            return ret;
        }();
        return t;
    }
} // namespace

/* static */
const Currency * Currency::find(const QString &code)
{
    const auto & t = table();
    if (auto it = t.constFind(normalizeCode(code)); it != t.constEnd())
        return &it.value();
    return nullptr;
}

/* static */
const Currency & Currency::get(const QString &code)
{
    if (const auto *c = find(code))
        return *c;
    throw ConfigurationError(QString("Unknown currency code: \"%1\"").arg(Util::Ellipsify(code, 16)));
}

/* static */
QStringList Currency::allCodes()
{
    return table().keys(); // sorted
}

} // namespace Money
