// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "process_xml.h"
#include <amrxml/xml.h>

using namespace amr;
using namespace mirror;


namespace
{
const char XML_ROOT_NAME[] = "ArchiveMirror";


void checkXmlMappingErrors(const XmlIn& xmlInput, const Zstring& filePath) //throw FileError
{
    if (const std::wstring& errors = xmlInput.getErrors();
        !errors.empty())
        throw FileError(replaceCpy(_("Configuration file %x contains invalid values."), L"%x", fmtPath(filePath)) + L"\n\n" +
                        _("The following XML elements could not be read:") + L'\n' + errors);
}


void readConfigElements(const XmlIn& in, SyncConfig& cfg)
{
    if (in["BaseUrl"])
        in["BaseUrl"](cfg.baseUrl);

    if (in["TargetFolder"])
        in["TargetFolder"](cfg.targetFolder);

    if (XmlIn inPar = in["Parallel"])
    {
        if (inPar.hasAttribute("Listing"))
            inPar.attribute("Listing", cfg.listingParallel);
        if (inPar.hasAttribute("Transfer"))
            inPar.attribute("Transfer", cfg.transferParallel);
    }

    if (XmlIn inRetry = in["Retry"])
    {
        if (inRetry.hasAttribute("Count"))
            inRetry.attribute("Count", cfg.retry.retryCount);

        if (inRetry.hasAttribute("DelaySec"))
        {
            size_t delaySec = 0;
            if (inRetry.attribute("DelaySec", delaySec))
                cfg.retry.retryDelay = std::chrono::seconds(delaySec);
        }
    }

    if (in["TimeoutSec"])
        in["TimeoutSec"](cfg.timeoutSec);

    if (in["ReportOrphans"])
        in["ReportOrphans"](cfg.reportOrphans);

    if (in["LogFile"])
        in["LogFile"](cfg.logFilePath);

    if (in["Exclude"])
        in["Exclude"](cfg.excludePatterns);

    if (in["ExcludeFile"])
        in["ExcludeFile"](cfg.excludeFiles);
}
}


void mirror::readConfig(const Zstring& filePath, SyncConfig& cfg) //throw FileError
{
    const XmlDoc doc = loadXml(filePath); //throw FileError

    if (doc.root().getName() != XML_ROOT_NAME)
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    XmlIn in(doc);
    readConfigElements(in, cfg);

    checkXmlMappingErrors(in, filePath); //throw FileError
}


void mirror::validateConfig(const SyncConfig& cfg) //throw FileError
{
    auto throwInvalid = [](const std::wstring& details) { throw FileError(_("Invalid configuration."), details); };

    if (cfg.targetFolder.empty())
        throwInvalid(_("Target folder not specified."));

    if (!startsWith(cfg.baseUrl, "http://") &&
        !startsWith(cfg.baseUrl, "https://"))
        throwInvalid(replaceCpy(_("Unsupported URL %x: expected http:// or https://"), L"%x", fmtPath(utfTo<std::wstring>(cfg.baseUrl))));

    if (cfg.listingParallel == 0 || cfg.transferParallel == 0)
        throwInvalid(_("The number of parallel operations must be at least 1."));

    if (cfg.timeoutSec <= 0)
        throwInvalid(_("The timeout must be at least 1 second."));
}
