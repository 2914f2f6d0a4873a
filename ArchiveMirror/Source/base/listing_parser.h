// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef LISTING_PARSER_H_4410928374651092
#define LISTING_PARSER_H_4410928374651092

#include <string_view>
#include "structures.h"


namespace mirror
{
/*  parse the HTML index page of a remote folder:
        <tr><td class="link"><a href="Some%20Game.zip">...</a></td><td class="size">12345</td>...</tr>

    - href is entity- and percent-decoded; trailing '/' => folder
    - parent/self links, absolute and query links, names containing '/' are dropped
    - "size" cell in the same row yields a size hint if it is an exact byte count (not "1.2 MiB" or "-")
    - malformed markup never fails: whatever cannot be recognized is ignored                     */
std::vector<ListingEntry> parseListing(const std::string_view& html);
}

#endif //LISTING_PARSER_H_4410928374651092
