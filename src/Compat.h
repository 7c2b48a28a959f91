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

#include <QMetaType>
#include <QString>
#include <QVariant>

/// Papers over QVariant API differences between Qt 5.15 and Qt 6.
namespace Compat {

    /// The QMetaType id of the value held in `var` (QMetaType::UnknownType for a null QVariant).
    inline QMetaType::Type VarType(const QVariant &var) {
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
        return QMetaType::Type(var.userType());
#else
        return QMetaType::Type(var.typeId());
#endif
    }

    /// e.g. "QString", "bool", or "(invalid)" for a null QVariant. Used in error messages.
    inline QString VarTypeName(const QVariant &var) {
        const char *name = var.typeName();
        return name ? QString::fromLatin1(name) : QStringLiteral("(invalid)");
    }

} // namespace Compat
