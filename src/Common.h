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

#include <QString>
#include <QtGlobal>

#include <stdexcept>

#if QT_VERSION < QT_VERSION_CHECK(5, 15, 0)
#error MoneyFmt requires Qt 5.15 or later (Qt 6 is also supported).
#endif

/// Root of the MoneyFmt exception hierarchy. what() returns the message as UTF-8.
struct Exception : std::runtime_error
{
    explicit Exception(const QString & message = "Error") : std::runtime_error(message.toStdString()) {}
    ~Exception() override;
};

/// A broken invariant inside MoneyFmt itself.
struct InternalError : Exception { using Exception::Exception; ~InternalError() override; };
/// The caller passed something unusable: a non-finite amount, an unparseable CLI amount, a bad flag value, etc.
struct BadArgs : Exception { using Exception::Exception; ~BadArgs() override; };
/// Unknown currency code, unrecognized option key, or an option value of the wrong type.
struct ConfigurationError : BadArgs { using BadArgs::BadArgs; ~ConfigurationError() override; };

#define APPNAME "MoneyFmt"
#define VERSION "1.0.0"

#ifdef QT_DEBUG
#  define BUILD_TYPE "Debug"
#else
#  define BUILD_TYPE "Release"
#endif

// GIT_COMMIT is passed in by CMake when building from a git checkout
#ifdef GIT_COMMIT
#  define VERSION_EXTRA "(" BUILD_TYPE " " GIT_COMMIT ")"
#else
#  define VERSION_EXTRA "(" BUILD_TYPE ")"
#endif
