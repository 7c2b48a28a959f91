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
#include "Tests.h"
#include "Options.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QTemporaryFile>

namespace {
    const QByteArray sampleConf =
        "# MoneyFmt sample config\n"
        "[formatting]\n"
        "currency = SEK   # trailing comment\n"
        "with_cents = no\n"
        "With_Symbol_Space\n"
        "\n"
        "   debug=1\n"
        "debug = yes\n"
        "ts-format = utc\n"
        "=orphan value\n"
        "empty =\n";

    /// Parses `args` (without the program name) against the formatting flags, as App::parseArgs() would.
    Money::Options fromCli(const QStringList &args, const QByteArray &confText = {}) {
        QCommandLineParser parser;
        parser.addOptions(Options::formatCliOptions());
        parser.addPositionalArgument("amount", "", "[amount ...]");
        if (!parser.parse(QStringList{"MoneyFmt"} + args))
            throw BadArgs(parser.errorText());
        ConfigFile conf;
        conf.parse(confText);
        return Options::formatOptionsFromCli(parser, conf);
    }
}

TEST_SUITE(options)

TEST_CASE(configfile_parse) {
    ConfigFile conf;
    conf.parse(sampleConf);
    TEST_CHECK(!conf.isEmpty());
    TEST_CHECK(conf.value("currency") == "SEK");
    TEST_CHECK(conf.value("CURRENCY") == "SEK");
    TEST_CHECK(conf.allNames().contains("with_symbol_space") && !conf.allNames().contains("With_Symbol_Space"));
    TEST_CHECK(conf.hasValue("with_symbol_space"));
    TEST_CHECK(conf.value("with_symbol_space", "default") == "");
    TEST_CHECK(!conf.hasValue("formatting") && !conf.hasValue("[formatting]"));
    TEST_CHECK(conf.value("debug") == "yes"); // last one wins
    TEST_CHECK(conf.allNames().count("debug") == 2);
    TEST_CHECK(conf.value("ts-format") == "utc");
    TEST_CHECK(conf.value("missing", "dflt") == "dflt");
    TEST_CHECK(!conf.optValue("missing").has_value());
    TEST_CHECK(conf.hasValue("empty") && conf.value("empty", "x").isEmpty());
    TEST_CHECK(!conf.allNames().contains(""));

    TEST_CHECK(conf.remove("DEBUG") == 2);
    TEST_CHECK(!conf.hasValue("debug"));
    TEST_CHECK(conf.remove("debug") == 0);

    // parse() replaces the previous contents
    conf.parse("currency=eur\n");
    TEST_CHECK(conf.allNames() == QStringList{"currency"});
    conf.clear();
    TEST_CHECK(conf.isEmpty());
};

TEST_CASE(configfile_bool) {
    ConfigFile conf;
    conf.parse("a=true\nb=Yes\nc=on\nd\ne=false\nf=NO\ng=off\nh=0\ni=1\nj=42\nk=maybe\n");
    bool ok{};
    for (const auto & name : {"a", "b", "c", "d", "i", "j"}) {
        TEST_CHECK(conf.boolValue(name, false, &ok) == true);
        TEST_CHECK_MESSAGE(ok, name);
    }
    for (const auto & name : {"e", "f", "g", "h"}) {
        TEST_CHECK(conf.boolValue(name, true, &ok) == false);
        TEST_CHECK_MESSAGE(ok, name);
    }
    TEST_CHECK(conf.boolValue("k", true, &ok) == true && !ok);
    TEST_CHECK(conf.boolValue("k", false, &ok) == false && !ok);
    TEST_CHECK(conf.boolValue("missing", true, &ok) == true && !ok);
    TEST_CHECK(conf.boolValue("A") == true);
};

TEST_CASE(configfile_open) {
    ConfigFile conf;
    conf.parse("stale=1\n");
    TEST_CHECK(!conf.open(QDir::temp().filePath("moneyfmt-this-file-does-not-exist.conf")));
    TEST_CHECK(conf.isEmpty());

    QTemporaryFile tmp;
    TEST_CHECK(tmp.open());
    TEST_CHECK(tmp.write(sampleConf) == sampleConf.size());
    tmp.close();
    TEST_CHECK(conf.open(tmp.fileName()));
    TEST_CHECK(conf.value("currency") == "SEK");
    TEST_CHECK(!conf.hasValue("stale"));
};

TEST_CASE(formatOptionsFromConfig) {
    ConfigFile conf;
    conf.parse(sampleConf);
    const auto fo = Options::formatOptionsFromConfig(conf);
    TEST_CHECK(fo.currency == "sek");
    TEST_CHECK(!fo.withCents);
    TEST_CHECK(fo.withSymbolSpace);
    TEST_CHECK(fo.withSymbol && fo.withThousandsSeparator && !fo.withCurrency);
    TEST_CHECK(Money::format(1234.5, fo) == "1 234 kr");

    // keys the config file doesn't mention keep the base's values
    Money::Options base;
    base.withCurrency = true;
    base.currency = "jpy";
    conf.parse("with_symbol = off\n");
    const auto fo2 = Options::formatOptionsFromConfig(conf, base);
    TEST_CHECK(fo2.currency == "jpy" && fo2.withCurrency && !fo2.withSymbol);

    conf.clear();
    TEST_CHECK(Options::formatOptionsFromConfig(conf) == Money::Options{});
};

TEST_CASE(formatOptionsFromConfig_errors) {
    ConfigFile conf;
    conf.parse("currency = xyz\n");
    TEST_CHECK_THROW(Options::formatOptionsFromConfig(conf), ConfigurationError);
    conf.parse("with_cents = sometimes\n");
    TEST_CHECK_EXCEPTION(Options::formatOptionsFromConfig(conf), ConfigurationError,
                         [](const ConfigurationError &e) { return QString(e.what()).contains("with_cents"); });
    conf.parse("currency =\n");
    TEST_CHECK_THROW(Options::formatOptionsFromConfig(conf), ConfigurationError);
    // unrelated keys are left for App::parseArgs to deal with
    conf.parse("debug\nquiet = maybe\n");
    TEST_CHECK_NO_THROW(Options::formatOptionsFromConfig(conf));
};

TEST_CASE(app_options_toMap) {
    Options opts;
    opts.verboseDebug = false;
    opts.logTimestampMode = Log::Timestamp::UTC;
    opts.format.currency = "eur";
    const auto m = opts.toMap();
    TEST_CHECK(m.value("debug").toBool() == false);
    TEST_CHECK(m.value("ts-format").toString() == "utc");
    TEST_CHECK(m.value("currency").toString() == "eur");
    TEST_CHECK(m.contains("with_cents") && m.contains("with_thousands_separator"));
    TEST_CHECK(m.value("config").isNull());
    opts.logTimestampMode = Log::Timestamp::None;
    TEST_CHECK(opts.logTimestampModeString() == "none");
};

TEST_CASE(timestampModeFromString) {
    TEST_CHECK(Options::timestampModeFromString("none") == Log::Timestamp::None);
    TEST_CHECK(Options::timestampModeFromString(" UTC ") == Log::Timestamp::UTC);
    TEST_CHECK(Options::timestampModeFromString("abs") == Log::Timestamp::Uptime);
    TEST_CHECK(Options::timestampModeFromString("uptime") == Log::Timestamp::Uptime);
    TEST_CHECK(Options::timestampModeFromString("localtime") == Log::Timestamp::Local);
    TEST_CHECK_THROW(Options::timestampModeFromString("gmt"), BadArgs);
    TEST_CHECK_THROW(Options::timestampModeFromString(""), BadArgs);
};

TEST_CASE(formatOptionsFromCli) {
    TEST_CHECK(fromCli({}) == Money::Options{});

    // the command line overrides the config file
    const auto fo = fromCli({"-c", "eur"}, "currency = sek\n");
    TEST_CHECK(fo.currency == "eur");
    TEST_CHECK(Money::format(10, fo) == "€10.00");
    TEST_CHECK(fromCli({"--currency", "JPY"}, "currency = sek\n").currency == "jpy");

    // config values the command line doesn't mention are kept
    const auto fo2 = fromCli({"12"}, "with_cents = no\n");
    TEST_CHECK(!fo2.withCents);
    TEST_CHECK(Money::format(12, fo2) == "$12");
    const auto fo3 = fromCli({"-c", "eur", "-s"}, "currency = sek\nwith_cents = no\n");
    TEST_CHECK(fo3.currency == "eur" && !fo3.withCents && fo3.withSymbolSpace);

    const auto fo4 = fromCli({"--no-cents", "-i", "--no-symbol", "--no-thousands-separator"});
    TEST_CHECK(!fo4.withCents && fo4.withCurrency && !fo4.withSymbol && !fo4.withThousandsSeparator);
    TEST_CHECK(Money::format(1234.5, fo4) == "1234 USD");

    TEST_CHECK_THROW(fromCli({"-c", "xyz"}), ConfigurationError);
    TEST_CHECK_THROW(fromCli({}, "with_symbol = perhaps\n"), ConfigurationError);
};

TEST_CASE(parseAmounts) {
    const auto v = Options::parseAmounts({"1000", " 10.5 ", "-0.25", "1e3"});
    TEST_CHECK(v == std::vector<double>({1000.0, 10.5, -0.25, 1000.0}));
    TEST_CHECK(Options::parseAmounts({}).empty());
    TEST_CHECK_EXCEPTION(Options::parseAmounts({"1", "12abc"}), BadArgs,
                         [](const BadArgs &e) { return QString(e.what()).contains("\"12abc\""); });
    TEST_CHECK_THROW(Options::parseAmounts({""}), BadArgs);
    TEST_CHECK_THROW(Options::parseAmounts({"1,000"}), BadArgs);
};

TEST_CASE(formatAmounts) {
    TEST_CHECK(App::formatAmounts({}, {}).isEmpty());
    const QString out = App::formatAmounts({1000, 10, -1234.56}, {});
    TEST_CHECK(out == "$1,000.00\n$10.00\n$-1,234.56\n");
    TEST_CHECK(out.count('\n') == 3);
    Money::Options eur;
    eur.currency = "eur";
    TEST_CHECK(App::formatAmounts({10}, eur) == "€10.00\n");
};

TEST_SUITE_END()
