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
#include "Currency.h"
#include "Logger.h"
#include "Util.h"

#include <QCommandLineParser>
#include <QDateTime>
#include <QElapsedTimer>
#include <QLibraryInfo>
#include <QLocale>
#include <QSet>
#include <QTextStream>
#include <QTimer>

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <locale>

App *App::_globalInstance = nullptr;

namespace {
    void writeStdout(const QString &text)
    {
        const QByteArray utf8 = text.toUtf8();
        std::fwrite(utf8.constData(), 1, size_t(utf8.size()), stdout);
        std::fflush(stdout);
    }
} // namespace

App::App(int argc, char *argv[])
    : QCoreApplication(argc, argv)
{
    setCLocale();
    _globalInstance = this;
    setApplicationName(APPNAME);
    setApplicationVersion(QString("%1 %2").arg(VERSION, VERSION_EXTRA));

    options = std::make_unique<Options>();
    _logger = std::make_unique<Logger>(stderr);

    try {
        parseArgs();
    } catch (const std::exception &e) {
        options->logTimestampMode = Log::Timestamp::None;
        Error() << e.what();
        Log() << "Use the -h option to show help.";
        std::exit(1);
    }
    // QCoreApplication's constructor may have changed it
    setCLocale();

    QTimer::singleShot(0, this, &App::startup);
}

App::~App()
{
    DebugM("App d'tor");
    _globalInstance = nullptr;
}

void App::startup()
{
    if (Debug::isEnabled()) {
        Debug() << applicationName() << " " << applicationVersion() << ", Qt " << QLibraryInfo::version().toString()
                << ", started " << QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss");
        Debug d;
        d << "Options:";
        const auto m = options->toMap();
        for (auto it = m.cbegin(); it != m.cend(); ++it)
            d << " " << it.key() << "=" << (it.value().isNull() ? QString("(unset)") : it.value().toString());
    }

    int rc = 0;
    try {
        QElapsedTimer t;
        t.start();
        writeStdout(formatAmounts(amounts, options->format));
        DebugM("Formatted ", amounts.size(), " amount(s) in ", t.nsecsElapsed() / 1e6, " msec");
    } catch (const std::exception &e) {
        Error() << "Caught exception: " << e.what();
        rc = 1;
    }
    exit(rc);
}

/* static */
QString App::formatAmounts(const std::vector<double> &amounts, const Money::Options &opts)
{
    QString out;
    for (const double amt : amounts) {
        out += Money::format(amt, opts);
        out += '\n';
    }
    return out;
}

void App::parseArgs()
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Formats monetary amounts as human-readable strings, e.g. 1000 -> \"$1,000.00\"");
    parser.addHelpOption();

    const QList<QCommandLineOption> formatOpts = Options::formatCliOptions();
    QList<QCommandLineOption> appOpts{
        { { "l", "list-currencies" },
          "Print the supported currencies and exit.",
        },
        { "config",
          "Read options from a name=value config file. The command line overrides it.",
          QString("file"),
        },
        { { "d", "debug" },
          "Debug output on stderr (the default for debug builds). Give it twice for trace output as well.",
        },
        { { "q", "quiet" },
          "No debug output (the default for release builds).",
        },
        { "ts-format",
          "Log timestamps: \"none\", \"uptime\", \"localtime\" (default) or \"utc\".",
          QString("keyword"),
        },
        { { "v", "version" },
          "Print version information and exit.",
        },
    };
    if (!registeredTests().empty()) {
        QStringList names;
        for (const auto & [name, func] : registeredTests())
            names.append(name);
        appOpts.append({ "test",
                         QString("Run the named test suite and exit. May be repeated, or use \"all\". Suites: %1")
                             .arg(names.join(", ")),
                         QString("suite") });
    }

    parser.addOptions(formatOpts);
    parser.addOptions(appOpts);
    parser.addPositionalArgument("amount", "Amount(s) to format, one line each. Put -- before a negative amount,"
                                           " e.g.: " APPNAME " -- -12.5", "[amount ...]");
    parser.process(*this);

    if (parser.isSet("v")) {
        writeStdout(extendedVersionString());
        std::exit(0);
    }

    const int nDebug = int(parser.optionNames().count("d") + parser.optionNames().count("debug"));
    if (nDebug) {
        options->verboseDebug = true;
        options->verboseTrace = nDebug > 1;
    } else if (parser.isSet("q")) {
        options->verboseDebug = options->verboseTrace = false;
    }

    if (parser.isSet("test"))
        std::exit(runTests(parser.values("test")));

    if (parser.isSet("l")) {
        printCurrencies();
        std::exit(0);
    }

    ConfigFile conf;
    if (parser.isSet("config")) {
        options->configFile = parser.value("config");
        if (!conf.open(options->configFile))
            throw BadArgs(QString("Unable to open config file %1").arg(options->configFile));
    }

    // the command line wins over the config file
    QSet<QString> known{"debug", "quiet", "ts-format"};
    for (const auto & opt : formatOpts + appOpts) {
        for (const auto & name : opt.names()) {
            if (name.length() > 1 && parser.isSet(name) && conf.remove(name))
                Log() << "'" << name << "' is in both the config file and the command line, using the command line";
        }
    }
    for (const auto & key : Money::Options::allKeys())
        known.insert(key);
    for (const auto & name : conf.allNames())
        if (!known.contains(name))
            Warning() << "Ignoring unknown config file option '" << name << "'";

    if (!nDebug && !parser.isSet("q")) {
        if (conf.boolValue("debug"))
            options->verboseDebug = true;
        if (conf.boolValue("quiet"))
            options->verboseDebug = options->verboseTrace = false;
    }

    if (const QString fmt = parser.isSet("ts-format") ? parser.value("ts-format") : conf.value("ts-format");
            !fmt.isEmpty())
        options->logTimestampMode = Options::timestampModeFromString(fmt);

    options->format = Options::formatOptionsFromCli(parser, conf);

    const QStringList posArgs = parser.positionalArguments();
    if (posArgs.isEmpty())
        throw BadArgs("No amounts specified. Please specify at least 1 amount to format.");
    amounts = Options::parseAmounts(posArgs);
}

/* static */
int App::runTests(QStringList names)
{
    auto & tests = registeredTests();
    if (names.size() == 1 && names.front() == "all") {
        names.clear();
        for (const auto & [name, func] : tests)
            names.append(name);
        Log() << "Running all " << names.size() << " tests ...";
    }
    try {
        for (const auto & name : names) {
            const auto it = tests.find(name);
            if (it == tests.end())
                throw BadArgs(QString("No such test: %1").arg(name));
            Log(Log::BrightGreen) << "Running test: " << name << " ...";
            it->second();
        }
    } catch (const std::exception &e) {
        Error(Log::Magenta) << "Caught exception: " << e.what();
        return 1;
    }
    return 0;
}

/* static */
void App::printCurrencies()
{
    QString out;
    QTextStream ts(&out, QIODevice::WriteOnly);
    for (const auto & code : Money::Currency::allCodes()) {
        const auto & c = Money::Currency::get(code);
        ts << code << "  " << c.isoCode << "  " << c.symbol.leftJustified(4) << "  " << c.name;
        if (c.hasSubunit())
            ts << " (" << *c.subunit << ")";
        ts << "\n";
    }
    ts.flush();
    writeStdout(out);
}

/* static */
std::map<QString, std::function<void()>> &App::registeredTests()
{
    static std::map<QString, std::function<void()>> tests;
    return tests;
}

/* static */
bool App::registerTest(const QString &name, const std::function<void()> &func)
{
    if (globalInstance()) {
        Error() << "Test \"" << name << "\" registered after startup, ignoring";
        return false;
    }
    if (!registeredTests().emplace(name, func).second) {
        Error() << "Duplicate test \"" << name << "\", ignoring";
        return false;
    }
    return true;
}

/* static */
void App::setCLocale()
{
    QLocale::setDefault(QLocale::c());
    std::setlocale(LC_ALL, "C");
    std::locale::global(std::locale::classic());
}

/* static */
QString App::extendedVersionString()
{
    QString ret;
    QTextStream ts(&ret, QIODevice::WriteOnly);
    ts << applicationName() << " " << applicationVersion() << "\n";
    ts << "Currencies: " << Money::Currency::allCodes().size() << " supported\n";
#ifdef __clang_version__
    ts << "compiled: clang " << __clang_version__ << "\n";
#elif defined(__GNUC__)
    ts << "compiled: gcc " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#endif
    ts << "Qt: version " << QLibraryInfo::version().toString() << "\n";
    ts.flush();
    return ret;
}
