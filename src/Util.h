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

#include "Common.h"

#include <QIODevice>
#include <QString>
#include <QTextStream>

#include <utility>

/// One log line, written out when the object goes out of scope:
///
///     Log() << "Read " << n << " config entries";
///
/// Subclasses pick the level, and a default color, in their destructors.
class Log
{
public:
    enum Color {
        Normal = 0, Red, Green, Yellow, Blue, Magenta, Cyan, BrightRed, BrightGreen, BrightCyan
    };
    enum class Level { Info = 0, Warning, Error, Debug };
    /// How each line is prefixed (--ts-format)
    enum class Timestamp { None = 0, Uptime, Local, UTC };

    Log() = default;
    explicit Log(Color c) : color(c), colorOverridden(true) {}
    Log(const Log &) = delete;
    Log & operator=(const Log &) = delete;
    virtual ~Log();

    template <typename T>
    Log & operator<<(const T & t) { stream << t; return *this; }

    /// Streams every argument in turn. Used by DebugM and TraceM.
    template <typename ...Args>
    Log & operator()(Args && ...args) { ((*this) << ... << args); return *this; }

    /// "[2026-10-19 12:00:00.000] " for Local/UTC, "[12.345] " (seconds since start) for Uptime, "" for None.
    static QString timestampPrefix(Timestamp mode);
    /// Wraps `text` in the ANSI escape sequences for `c`. Normal returns `text` unchanged.
    static QString colorize(const QString & text, Color c);

protected:
    void setDefaults(Level lvl, Color c) { level = lvl; if (!colorOverridden) color = c; }

    bool enabled = true;
    Level level = Level::Info;
    Color color = Normal;
    bool colorOverridden = false;
    QString str;
    QTextStream stream{&str, QIODevice::WriteOnly};
};

/// Printed only with -d (or on debug builds).
class Debug : public Log
{
public:
    using Log::Log;
    ~Debug() override;
    static bool isEnabled();
};

/// Printed only with -d -d. Used for per-amount formatting details.
class Trace : public Log
{
public:
    using Log::Log;
    ~Trace() override;
    static bool isEnabled();
};

class Warning : public Log
{
public:
    using Log::Log;
    ~Warning() override;
};

class Error : public Log
{
public:
    using Log::Log;
    ~Error() override;
};

/// Lazy variants: the arguments are not evaluated at all unless the level is enabled.
#define DebugM(...) \
    do { if (Debug::isEnabled()) Debug()(__VA_ARGS__); } while (0)
#define TraceM(...) \
    do { if (Trace::isEnabled()) Trace()(__VA_ARGS__); } while (0)

namespace Util {
    /// Truncates s to `limit` characters, appending "..." if it was truncated. Used when echoing user input in
    /// error messages. A negative `limit` means no limit.
    template <typename StringLike>
    StringLike Ellipsify(const StringLike &s, int limit = 100)
    {
        if (limit < 0 || s.length() <= limit) return s;
        return s.left(limit) + "...";
    }
} // namespace Util
