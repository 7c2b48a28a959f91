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
#include "Logger.h"

#include <QtGlobal>

#ifdef Q_OS_WIN
#  include <io.h>
#  define MONEYFMT_ISATTY(f) _isatty(_fileno(f))
#else
#  include <unistd.h>
#  define MONEYFMT_ISATTY(f) isatty(fileno(f))
#endif

Logger::Logger(std::FILE *out_, QObject *parent)
    : QObject(parent), out(out_), tty(out_ && MONEYFMT_ISATTY(out_))
{
    connect(this, &Logger::log, this, &Logger::writeLine);
}

Logger::~Logger() {}

void Logger::writeLine(int, const QString &line)
{
    const QByteArray utf8 = line.toUtf8();
    std::fwrite(utf8.constData(), 1, size_t(utf8.size()), out);
    std::fputc('\n', out);
    std::fflush(out);
}
