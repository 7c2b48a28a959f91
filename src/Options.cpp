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
#include "Options.h"

#include <QFile>
#include <QIODevice>
#include <QLatin1String>

#include <algorithm>

QString Options::logTimestampModeString() const
{
    switch (logTimestampMode) {
    case Log::Timestamp::None: return "none";
    case Log::Timestamp::Uptime: return "uptime";
    case Log::Timestamp::Local: return "localtime";
    case Log::Timestamp::UTC: return "utc";
    }
    return "localtime"; // not reached
}

QVariantMap Options::toMap() const
{
    QVariantMap m = format.toMap();
    m["debug"] = verboseDebug;
    m["trace"] = verboseTrace;
    m["ts-format"] = logTimestampModeString();
    m["config"] = configFile.isEmpty() ? QVariant() : QVariant(configFile);
    return m;
}

/* static */
Log::Timestamp Options::timestampModeFromString(const QString &str)
{
    const QString s = str.trimmed().toLower();
    if (s == "none")
        return Log::Timestamp::None;
    if (s == "uptime" || s == "abs" || s == "abstime")
        return Log::Timestamp::Uptime;
    if (s.startsWith("local"))
        return Log::Timestamp::Local;
    if (s == "utc")
        return Log::Timestamp::UTC;
    throw BadArgs(QString("ts-format: unrecognized value \"%1\"").arg(Util::Ellipsify(str, 32)));
}

/* static */
QList<QCommandLineOption> Options::formatCliOptions()
{
    return {
        { { "c", "currency" },
          QString("Currency code to format with, case-insensitive (default: %1). See -l.").arg(Money::Options{}.currency),
          QString("code"),
        },
        { "no-cents",
          "Drop the fractional digits.",
        },
        { { "i", "with-currency" },
          "Append the uppercase currency code, e.g. \"$10.00 USD\".",
        },
        { "no-symbol",
          "Leave out the currency symbol.",
        },
        { { "s", "symbol-space" },
          "Put a space between the symbol and the number.",
        },
        { "no-thousands-separator",
          "Don't group the integer digits in threes.",
        },
    };
}

/* static */
Money::Options Options::formatOptionsFromConfig(const ConfigFile &conf, const Money::Options &base)
{
    // Type each string value and let Money::Options::fromMap() reject anything else (unknown currency, etc).
    QVariantMap m;
    for (const auto & key : Money::Options::allKeys()) {
        const auto opt = conf.optValue(key);
        if (!opt)
            continue;
        if (key == QLatin1String(Money::Options::kCurrency)) {
            m[key] = *opt;
        } else if (const auto b = ConfigFile::parseBool(*opt)) {
            m[key] = *b;
        } else {
            throw ConfigurationError(QString("Config option \"%1\" must be a boolean (true/false/yes/no/on/off/1/0),"
                                             " got: \"%2\"").arg(key, Util::Ellipsify(*opt, 32)));
        }
    }
    return Money::Options::fromMap(m, base);
}

/* static */
Money::Options Options::formatOptionsFromCli(const QCommandLineParser &parser, const ConfigFile &conf)
{
    QVariantMap cli;
    if (parser.isSet("c"))
        cli[Money::Options::kCurrency] = parser.value("c");
    if (parser.isSet("no-cents"))
        cli[Money::Options::kWithCents] = false;
    if (parser.isSet("i"))
        cli[Money::Options::kWithCurrency] = true;
    if (parser.isSet("no-symbol"))
        cli[Money::Options::kWithSymbol] = false;
    if (parser.isSet("s"))
        cli[Money::Options::kWithSymbolSpace] = true;
    if (parser.isSet("no-thousands-separator"))
        cli[Money::Options::kWithThousandsSeparator] = false;
    return Money::Options::fromMap(cli, formatOptionsFromConfig(conf));
}

/* static */
std::vector<double> Options::parseAmounts(const QStringList &args)
{
    std::vector<double> ret;
    ret.reserve(size_t(args.size()));
    for (const auto & arg : args) {
        bool ok = false;
        const double d = arg.trimmed().toDouble(&ok);
        if (!ok)
            throw BadArgs(QString("Unparseable amount: \"%1\"").arg(Util::Ellipsify(arg, 32)));
        ret.push_back(d);
    }
    return ret;
}

bool ConfigFile::open(const QString &filePath)
{
    clear();
    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly|QIODevice::Text))
        return false;
    parse(f.readAll());
    return true;
}

void ConfigFile::parse(const QByteArray &text)
{
    clear();
    for (const auto & lineData : text.split('\n')) {
        QString line = QString::fromUtf8(lineData);
        if (const auto hash = line.indexOf('#'); hash > -1)
            line.truncate(hash);
        line = line.trimmed();
        if (line.isEmpty() || line.startsWith('['))
            continue;
        const auto eq = line.indexOf('=');
        const QString name = (eq > -1 ? line.left(eq) : line).trimmed().toLower();
        if (name.isEmpty())
            continue;
        entries.append({name, eq > -1 ? line.mid(eq + 1).trimmed() : QString()});
    }
}

std::optional<QString> ConfigFile::optValue(const QString &name) const
{
    const QString key = name.trimmed().toLower();
    for (auto it = entries.crbegin(); it != entries.crend(); ++it)
        if (it->first == key)
            return it->second;
    return std::nullopt;
}

QString ConfigFile::value(const QString &name, const QString &defaultIfNotFound) const
{
    return optValue(name).value_or(defaultIfNotFound);
}

int ConfigFile::remove(const QString &name)
{
    const QString key = name.trimmed().toLower();
    const auto before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(), [&key](const auto &e) { return e.first == key; }),
                  entries.end());
    return int(before - entries.size());
}

/* static */
std::optional<bool> ConfigFile::parseBool(const QString &str)
{
    const QString s = str.trimmed().toLower();
    if (s.isEmpty() || s == "true" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "no" || s == "off")
        return false;
    bool ok = false;
    const int i = s.toInt(&ok);
    if (!ok)
        return std::nullopt;
    return i != 0;
}

bool ConfigFile::boolValue(const QString &name, bool def, bool *parsedOk) const
{
    std::optional<bool> b;
    if (const auto opt = optValue(name))
        b = parseBool(*opt);
    if (parsedOk)
        *parsedOk = b.has_value();
    return b.value_or(def);
}

QStringList ConfigFile::allNames() const
{
    QStringList ret;
    ret.reserve(entries.size());
    for (const auto & e : entries)
        ret.append(e.first);
    return ret;
}
