// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef PROCESS_XML_H_2210938475610293
#define PROCESS_XML_H_2210938475610293

#include "structures.h"


namespace mirror
{
/*  <ArchiveMirror>
        <BaseUrl>https://example.org/files</BaseUrl>
        <TargetFolder>/srv/mirror</TargetFolder>
        <Parallel Listing="4" Transfer="8"/>
        <Retry Count="3" DelaySec="2"/>
        <TimeoutSec>20</TimeoutSec>
        <ReportOrphans>true</ReportOrphans>
        <LogFile>/var/log/mirror.log</LogFile>
        <Exclude>     <Item>*.zip</Item>                    </Exclude>
        <ExcludeFile> <Item>/etc/mirror/excludes.txt</Item> </ExcludeFile>
    </ArchiveMirror>

    all elements are optional: missing ones keep the value already in "cfg"          */
void readConfig(const Zstring& filePath, SyncConfig& cfg); //throw FileError

//reject values the sync engine cannot work with
void validateConfig(const SyncConfig& cfg); //throw FileError
}

#endif //PROCESS_XML_H_2210938475610293
