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
#include "Options.h"

#include <QCoreApplication>
#include <QString>

#include <functional>
#include <map>
#include <memory>
#include <vector>

class Logger;

/// The MoneyFmt application: reads the command line (and an optional config file), prints one formatted line per
/// amount to stdout and quits. Log output goes to stderr through logger().
class App final : public QCoreApplication
{
    Q_OBJECT
public:
    App(int argc, char *argv[]);
    ~App() override;

    /// Set from the command line and config file in the constructor, before the event loop starts.
    std::unique_ptr<Options> options;

    Logger *logger() const { return _logger.get(); }

    /// The one App, or nullptr before it is constructed and after it is destroyed.
    static App *globalInstance() { return _globalInstance; }

    /// Registers `func` to be run by `--test name`. Call at namespace scope only (see TEST_SUITE in tests/Tests.h).
    static bool registerTest(const QString &name, const std::function<void()> &func);

    /// Formats each amount with `opts`, one per line, each line ending in '\n'.
    static QString formatAmounts(const std::vector<double> &amounts, const Money::Options &opts);

    /// For --version
    static QString extendedVersionString();

private:
    static App *_globalInstance;

    std::unique_ptr<Logger> _logger;
    std::vector<double> amounts;

    void startup();
    /// Throws BadArgs or ConfigurationError on bad input. Exits directly for -h, -v, -l and --test.
    void parseArgs();
    /// Runs the named tests (or "all") and returns the process exit code.
    static int runTests(QStringList names);
    /// -l
    static void printCurrencies();

    static std::map<QString, std::function<void()>> &registeredTests();

    /// QCoreApplication can leave the C library on the user's locale, which would make toDouble() and number()
    /// use a ',' decimal point.
    static void setCLocale();
};

inline App *app() { return App::globalInstance(); }
