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
#include "App.h"
#include "Logger.h"
#include "Util.h"

#include <QDateTime>
#include <QElapsedTimer>

#include <cstdio>

namespace {
    const QElapsedTimer uptime = [] { QElapsedTimer t; t.start(); return t; }();

    const char *ansiCode(Log::Color c) {
        switch (c) {
        case Log::Normal: break;
        case Log::Red: return "\033[31m";
        case Log::Green: return "\033[32m";
        case Log::Yellow: return "\033[33m";
        case Log::Blue: return "\033[34m";
        case Log::Magenta: return "\033[35m";
        case Log::Cyan: return "\033[36m";
        case Log::BrightRed: return "\033[31;1m";
        case Log::BrightGreen: return "\033[32;1m";
        case Log::BrightCyan: return "\033[36;1m";
        }
        return "";
    }
} // namespace

/* static */
QString Log::timestampPrefix(Timestamp mode)
{
    switch (mode) {
    case Timestamp::None:
        return QString();
    case Timestamp::Uptime: {
        const qint64 ms = uptime.elapsed();
        return QString::asprintf("[%lld.%03d] ", static_cast<long long>(ms / 1000), int(ms % 1000));
    }
    case Timestamp::Local:
    case Timestamp::UTC: {
        const auto now = mode == Timestamp::UTC ? QDateTime::currentDateTimeUtc() : QDateTime::currentDateTime();
        return now.toString(QStringLiteral("[yyyy-MM-dd hh:mm:ss.zzz] "));
    }
    }
    return QString();
}

/* static */
QString Log::colorize(const QString &text, Color c)
{
    if (c == Normal) return text;
    return QString::fromLatin1(ansiCode(c)) + text + QStringLiteral("\033[0m");
}

Log::~Log()
{
    if (!enabled) return;
    stream.flush();

    const App *a = app();
    // Qt may log before App has finished constructing
    const Options *opts = a ? a->options.get() : nullptr;
    Logger *logger = a && opts ? a->logger() : nullptr;

    const QString line = timestampPrefix(opts ? opts->logTimestampMode : Timestamp::Local)
                         + (logger && logger->isaTTY() ? colorize(str, color) : str);
    if (logger)
        emit logger->log(int(level), line);
    else
        // no App yet, or it is already gone
        std::fprintf(stderr, "%s\n", line.toUtf8().constData());
}

Debug::~Debug()
{
    enabled = isEnabled();
    setDefaults(Level::Debug, Cyan);
}

bool Debug::isEnabled()
{
    const App *a = app();
    return a && a->options && a->options->verboseDebug;
}

Trace::~Trace()
{
    enabled = isEnabled();
    setDefaults(Level::Debug, Green);
}

bool Trace::isEnabled()
{
    const App *a = app();
    return a && a->options && a->options->verboseDebug && a->options->verboseTrace;
}

Warning::~Warning()
{
    setDefaults(Level::Warning, Yellow);
}

Error::~Error()
{
    setDefaults(Level::Error, BrightRed);
}
