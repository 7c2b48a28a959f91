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

#include <QObject>
#include <QString>

#include <cstdio>

/// Where finished Log() lines go. MoneyFmt writes them to stderr so that stdout only ever carries formatted amounts.
class Logger : public QObject
{
    Q_OBJECT
public:
    explicit Logger(std::FILE *out = stderr, QObject *parent = nullptr);
    ~Logger() override;

    /// true if `out` is a terminal, in which case lines are colorized
    bool isaTTY() const { return tty; }

signals:
    /// `level` is a Log::Level
    void log(int level, const QString &line);

private slots:
    void writeLine(int level, const QString &line);

private:
    std::FILE * const out;
    const bool tty;
};
