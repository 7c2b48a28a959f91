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
#pragma once

#include "Money.h"
#include "Util.h"

#include <QByteArray>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <optional>
#include <utility>
#include <vector>

class ConfigFile;

/// App-wide options, filled in once by App::parseArgs() from the config file (if any) and the command line.
struct Options {
    bool verboseDebug =
#ifdef QT_DEBUG
        true;
#else
        false;
#endif
    bool verboseTrace = false; ///< -d -d
    Log::Timestamp logTimestampMode = Log::Timestamp::Local;

    /// Applied to every amount formatted on the command line
    Money::Options format;

    /// --config, empty if none was given
    QString configFile;

    QString logTimestampModeString() const;
    /// For the debug log
    QVariantMap toMap() const;

    /// Accepts "none", "uptime" (or "abs"), "local"/"localtime" and "utc", case-insensitively. Throws BadArgs otherwise.
    static Log::Timestamp timestampModeFromString(const QString &);

    /// The command-line flags that map onto Money::Options: -c, --no-cents, -i, --no-symbol, -s and
    /// --no-thousands-separator.
    static QList<QCommandLineOption> formatCliOptions();

    /// Reads the Money::Options keys ("currency", "with_cents", ...) from `conf` on top of `base`. Throws
    /// ConfigurationError for an unknown currency or a value that is not a bool.
    static Money::Options formatOptionsFromConfig(const ConfigFile &conf, const Money::Options &base = {});

    /// formatOptionsFromConfig(conf) with any formatCliOptions() set in `parser` applied on top.
    static Money::Options formatOptionsFromCli(const QCommandLineParser &parser, const ConfigFile &conf);

    /// Parses each string as a C-locale double. Throws BadArgs naming the first one that doesn't parse.
    static std::vector<double> parseAmounts(const QStringList &args);
};

/// A config file of `name = value` lines. '#' starts a comment, "[section]" lines are skipped, and a name on its
/// own means name = "" (which boolValue() reads as true). Names are case-insensitive. If a name appears more than
/// once the last one wins.
class ConfigFile
{
public:
    /// Replaces the current contents with the parsed file. Returns false (leaving this empty) if it can't be read.
    bool open(const QString &filePath);
    /// Like open() but parses `text` directly.
    void parse(const QByteArray &text);

    bool hasValue(const QString &name) const { return optValue(name).has_value(); }
    QString value(const QString &name, const QString &defaultIfNotFound = QString()) const;
    std::optional<QString> optValue(const QString &name) const;

    /// Removes every entry for `name`, returning how many there were.
    int remove(const QString &name);

    /// Returns `def` if `name` is missing or its value is not a bool, in which case *parsedOk is set to false.
    bool boolValue(const QString &name, bool def = false, bool *parsedOk = nullptr) const;
    /// "true"/"yes"/"on"/"" and nonzero integers are true. "false"/"no"/"off" and 0 are false.
    static std::optional<bool> parseBool(const QString &);

    /// Lowercased, in file order, with duplicates.
    QStringList allNames() const;

    bool isEmpty() const { return entries.isEmpty(); }
    void clear() { entries.clear(); }

private:
    QList<std::pair<QString, QString>> entries; ///< (lowercased name, value)
};
