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
#include "Compat.h"
#include "Util.h"

#include <QRegularExpression>
#include <QVariant>

TEST_SUITE(util)

TEST_CASE(Ellipsify) {
    const QString s = "abcdefghij";
    TEST_CHECK(Util::Ellipsify(s, 3) == "abc...");
    TEST_CHECK(Util::Ellipsify(s, 10) == s);
    TEST_CHECK(Util::Ellipsify(s, 100) == s);
    TEST_CHECK(Util::Ellipsify(s, -1) == s);
    TEST_CHECK(Util::Ellipsify(s, 0) == "...");
    TEST_CHECK(Util::Ellipsify(QString()).isEmpty());
    TEST_CHECK(Util::Ellipsify(QString(150, QChar('x'))).length() == 103);
    TEST_CHECK(Util::Ellipsify(QByteArray("0123456789"), 4) == QByteArray("0123..."));
};

TEST_CASE(VarType) {
    TEST_CHECK(Compat::VarType(QVariant(true)) == QMetaType::Bool);
    TEST_CHECK(Compat::VarType(QVariant(QString("usd"))) == QMetaType::QString);
    TEST_CHECK(Compat::VarType(QVariant(QByteArray("usd"))) == QMetaType::QByteArray);
    TEST_CHECK(Compat::VarType(QVariant(1)) == QMetaType::Int);
    TEST_CHECK(Compat::VarTypeName(QVariant(true)) == "bool");
    TEST_CHECK(Compat::VarTypeName(QVariant(QString())) == "QString");
    TEST_CHECK(Compat::VarTypeName(QVariant()) == "(invalid)");
};

TEST_CASE(timestampPrefix) {
    TEST_CHECK(Log::timestampPrefix(Log::Timestamp::None).isEmpty());
    const QString up = Log::timestampPrefix(Log::Timestamp::Uptime);
    TEST_CHECK_MESSAGE(QRegularExpression(R"(^\[\d+\.\d{3}\] $)").match(up).hasMatch(), up);
    // "[yyyy-MM-dd hh:mm:ss.zzz] "
    for (const auto mode : {Log::Timestamp::UTC, Log::Timestamp::Local}) {
        const QString ts = Log::timestampPrefix(mode);
        TEST_CHECK_MESSAGE(ts.length() == 26 && ts.startsWith('[') && ts.endsWith("] "), ts);
    }
};

TEST_CASE(colorize) {
    TEST_CHECK(Log::colorize("plain", Log::Normal) == "plain");
    const QString red = Log::colorize("oops", Log::Red);
    TEST_CHECK(red.startsWith("\033[31m") && red.endsWith("\033[0m") && red.contains("oops"));
    TEST_CHECK(Log::colorize("x", Log::BrightRed) != Log::colorize("x", Log::Red));
};

TEST_CASE(nested_suite) {
    Tests::Suite &outer = Tests::Suite::current();
    bool innerWasCurrent = false, innerStillCurrent = false;
    {
        Tests::Suite inner("inner");
        innerWasCurrent = &Tests::Suite::current() == &inner;
        {
            Tests::Suite innermost("innermost");
        }
        // leaving innermost must not remove the outer suites
        innerStillCurrent = &Tests::Suite::current() == &inner;
        inner.addCase("passes") = [&inner] { inner.check(true, "true", __FILE__, __LINE__); };
        inner.run();
    }
    TEST_CHECK(innerWasCurrent);
    TEST_CHECK(innerStillCurrent);
    TEST_CHECK(&Tests::Suite::current() == &outer);
};

TEST_SUITE_END()
