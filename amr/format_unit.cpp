// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "format_unit.h"
#include <cmath>
#include "i18n.h"

using namespace amr;


std::wstring amr::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printNumber<std::wstring>(L"%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printNumber<std::wstring>(L"%.1f", value);

    return formatNumber(std::llround(value));
}


std::wstring amr::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) <= 999)
        return _P("1 byte", "%x bytes", static_cast<int>(size));

    double sizeInUnit = static_cast<double>(size);

    auto formatUnit = [&](const std::wstring& unitTxt) { return replaceCpy(unitTxt, L"%x", formatThreeDigitPrecision(sizeInUnit)); };

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x KB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x MB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x GB"));

    sizeInUnit /= bytesPerKilo;
    return formatUnit(_("%x TB"));
}


std::wstring amr::formatProgressPercent(double fraction)
{
    //round down! don't show 100% when not actually done
    return numberTo<std::wstring>(static_cast<int>(std::floor(fraction * 100))) + L'%';
}


std::wstring amr::formatNumber(int64_t n)
{
    //no locale is set => use a fixed grouping separator
    std::wstring number = numberTo<std::wstring>(n < 0 ? -n : n);

    for (int pos = static_cast<int>(number.size()) - 3; pos > 0; pos -= 3)
        number.insert(pos, 1, L',');

    return n < 0 ? L'-' + number : number;
}
