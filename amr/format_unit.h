// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FORMAT_UNIT_H_4410293847561920
#define FORMAT_UNIT_H_4410293847561920

#include <cstdint>
#include <string>


namespace amr
{
const int bytesPerKilo = 1000;
std::wstring formatFilesizeShort(int64_t filesize);
std::wstring formatProgressPercent(double fraction /*[0, 1]*/); //rounded down!

std::wstring formatThreeDigitPrecision(double value); //format with fixed number of digits (unless value is too large)

std::wstring formatNumber(int64_t n); //format integer number including thousands separator
}

#endif //FORMAT_UNIT_H_4410293847561920
