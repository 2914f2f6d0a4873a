// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <unistd.h> //isatty
#include <amr/extra_log.h>
#include <amr/scope_guard.h>
#include <libcurl/curl_wrap.h>
#include "base/exclude_filter.h"
#include "base/http_archive.h"
#include "base/log_file.h"
#include "base/process_xml.h"
#include "base/synchronization.h"
#include "ui/console_status_handler.h"

using namespace amr;
using namespace mirror;


namespace
{
const char* const TAB_SPACE = "    ";

std::atomic<StatusHandler*> globalStatusHandler{nullptr}; //accessed from signal handler


void onTerminationRequest(int /*signal*/)
{
    //async-signal-safe: only sets an atomic flag
    if (StatusHandler* handler = globalStatusHandler.load())
        handler->userRequestAbort();
}


void showSyntaxHelp()
{
    std::cout << utfTo<std::string>(_("Syntax:")) << "\n\n" <<
              "ArchiveMirror sync " << utfTo<std::string>(_("directory")) << '\n' <<
              TAB_SPACE << "[--exclude " << utfTo<std::string>(_("pattern")) << "]...\n" <<
              TAB_SPACE << "[--exclude-file " << utfTo<std::string>(_("file")) << "]...\n" <<
              TAB_SPACE << "[--base-url URL]\n" <<
              TAB_SPACE << "[--parallel N] [--listing-parallel N]\n" <<
              TAB_SPACE << "[--retries N] [--timeout " << utfTo<std::string>(_("seconds")) << "]\n" <<
              TAB_SPACE << "[--config " << utfTo<std::string>(_("file")) << "]\n" <<
              TAB_SPACE << "[--log-file " << utfTo<std::string>(_("file")) << "]\n" <<
              TAB_SPACE << "[--no-orphans]\n\n" <<

              "--exclude\n" << utfTo<std::string>(_("Skip remote files and folders matching the pattern. '*' matches within a single path segment.")) << "\n\n" <<
              "--exclude-file\n" << utfTo<std::string>(_("Read exclude patterns from a UTF-8 text file, one per line. Lines starting with '#' are ignored.")) << "\n\n" <<
              "--base-url\n" << utfTo<std::string>(_("Root URL of the remote archive.")) << ' ' << DEFAULT_BASE_URL << "\n\n" <<
              "--parallel\n" << utfTo<std::string>(_("Number of concurrent downloads.")) << "\n\n" <<
              "--listing-parallel\n" << utfTo<std::string>(_("Number of concurrent folder listings.")) << "\n\n" <<
              "--retries\n" << utfTo<std::string>(_("Automatic retries after a transient error.")) << "\n\n" <<
              "--timeout\n" << utfTo<std::string>(_("Network timeout per request.")) << "\n\n" <<
              "--config\n" << utfTo<std::string>(_("XML configuration file. Command line options take precedence.")) << "\n\n" <<
              "--log-file\n" << utfTo<std::string>(_("Save the log of the run to a text file.")) << "\n\n" <<
              "--no-orphans\n" << utfTo<std::string>(_("Do not report local files missing from the archive.")) << '\n';
}


void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


struct CommandLine
{
    bool showHelp = false;
    SyncConfig cfg;
};


CommandLine parseCommandLine(const std::vector<Zstring>& commandArgs) //throw FileError
{
    const char* optionExclude         = "--exclude";
    const char* optionExcludeFile     = "--exclude-file";
    const char* optionBaseUrl         = "--base-url";
    const char* optionParallel        = "--parallel";
    const char* optionListingParallel = "--listing-parallel";
    const char* optionRetries         = "--retries";
    const char* optionTimeout         = "--timeout";
    const char* optionConfig          = "--config";
    const char* optionLogFile         = "--log-file";
    const char* optionNoOrphans       = "--no-orphans";

    auto isHelpRequest = [](const Zstring& arg)
    {
        return arg == Zstr("-h") || arg == Zstr("--help") || arg == Zstr("-?");
    };

    auto isCommandLineOption = [&](const Zstring& arg)
    {
        return startsWith(arg, Zstr("--")) || isHelpRequest(arg);
    };

    CommandLine cmdLine;
    if (commandArgs.empty())
    {
        cmdLine.showHelp = true;
        return cmdLine;
    }

    //--config is evaluated first: all other options override its values
    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
        if (*it == optionConfig)
        {
            if (++it == commandArgs.end() || isCommandLineOption(*it))
                throw FileError(replaceCpy(_("A file path is expected after %x."), L"%x", utfTo<std::wstring>(optionConfig)));
            readConfig(*it, cmdLine.cfg); //throw FileError
        }

    auto getNumber = [&](auto& it, const char* option) //throw FileError
    {
        if (++it == commandArgs.end() || it->empty() || !std::all_of(it->begin(), it->end(), [](Zchar c) { return isDigit(c); }) || it->size() > 9)
            throw FileError(replaceCpy(_("A positive number is expected after %x."), L"%x", utfTo<std::wstring>(option)));
        return stringTo<int>(*it);
    };

    auto getValue = [&](auto& it, const char* option) -> const Zstring& //throw FileError
    {
        if (++it == commandArgs.end() || isCommandLineOption(*it))
            throw FileError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
        return *it;
    };

    bool syncCommandFound = false;
    bool targetFound = false;
    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
        if (isHelpRequest(*it))
        {
            cmdLine.showHelp = true;
            return cmdLine;
        }
        else if (*it == optionConfig)
            ++it; //already evaluated
        else if (*it == optionExclude)
            cmdLine.cfg.excludePatterns.push_back(getValue(it, optionExclude));
        else if (*it == optionExcludeFile)
            cmdLine.cfg.excludeFiles.push_back(getValue(it, optionExcludeFile));
        else if (*it == optionBaseUrl)
            cmdLine.cfg.baseUrl = utfTo<std::string>(getValue(it, optionBaseUrl));
        else if (*it == optionParallel)
            cmdLine.cfg.transferParallel = getNumber(it, optionParallel);
        else if (*it == optionListingParallel)
            cmdLine.cfg.listingParallel = getNumber(it, optionListingParallel);
        else if (*it == optionRetries)
            cmdLine.cfg.retry.retryCount = getNumber(it, optionRetries);
        else if (*it == optionTimeout)
            cmdLine.cfg.timeoutSec = getNumber(it, optionTimeout);
        else if (*it == optionLogFile)
            cmdLine.cfg.logFilePath = getValue(it, optionLogFile);
        else if (*it == optionNoOrphans)
            cmdLine.cfg.reportOrphans = false;
        else if (isCommandLineOption(*it))
            throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", utfTo<std::wstring>(*it)));
        else if (!syncCommandFound)
        {
            if (*it != Zstr("sync"))
                throw FileError(replaceCpy(_("Unknown command %x."), L"%x", utfTo<std::wstring>(*it)));
            syncCommandFound = true;
        }
        else if (!targetFound)
        {
            cmdLine.cfg.targetFolder = *it;
            targetFound = true;
        }
        else
            throw FileError(replaceCpy(_("Unexpected argument %x."), L"%x", fmtPath(*it)));

    if (!syncCommandFound)
        throw FileError(_("Missing command: sync"));
    return cmdLine;
}
}


int main(int argc, char* argv[])
{
    std::vector<Zstring> commandArgs(argv + std::min(argc, 1), argv + argc); //skip exe path

    libcurlInit();
    AMR_ON_SCOPE_EXIT(libcurlTearDown());

    SyncConfig cfg;
    ExcludeFilter filter;
    try
    {
        const CommandLine cmdLine = parseCommandLine(commandArgs); //throw FileError
        if (cmdLine.showHelp)
        {
            showSyntaxHelp();
            return AMR_RC_SUCCESS;
        }
        cfg = cmdLine.cfg;

        validateConfig(cfg); //throw FileError

        std::vector<Zstring> patterns = cfg.excludePatterns;
        for (const Zstring& filePath : cfg.excludeFiles)
            append(patterns, readExcludeFile(filePath)); //throw FileError

        filter = ExcludeFilter(patterns); //throw FileError
    }
    catch (const FileError& e) //fail before any network activity
    {
        notifyAppError(e.toString());
        return AMR_RC_ABORTED;
    }

    //--------------------------------------------------------------------
    ConsoleStatusHandler statusHandler(::isatty(STDERR_FILENO) != 0 /*showProgress*/);

    globalStatusHandler = &statusHandler;
    AMR_ON_SCOPE_EXIT(globalStatusHandler = nullptr);

    for (const int signalId : {SIGINT, SIGTERM})
        if (::signal(signalId, onTerminationRequest) == SIG_ERR)
            logExtraError(_("Error during process initialization.") + L"\n\n" + formatSystemError("signal", getLastError()));

    try
    {
        const HttpArchive archive(cfg.baseUrl, cfg.timeoutSec, "" /*caCertFilePath: system default*/);

        synchronize(cfg, filter, archive, statusHandler); //throw AbortProcess
    }
    catch (AbortProcess&) {} //status is evaluated by prepareResult()

    const StatusHandler::Result result = statusHandler.prepareResult();
    statusHandler.flushLog();

    AmrReturnCode rc = mapToReturnCode(result.summary.resultStatus);

    if (!cfg.logFilePath.empty())
        try
        {
            saveLogFile(cfg.logFilePath, result.summary, result.errorLog.ref()); //throw FileError
        }
        catch (const FileError& e)
        {
            notifyAppError(e.toString());
            raiseReturnCode(rc, AMR_RC_ERROR);
        }

    std::cout << utfTo<std::string>(getFinalStatusLabel(result.summary.resultStatus)) << '\n';
    return rc;
}
