// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef CONSOLE_STATUS_HANDLER_H_5510293847561029
#define CONSOLE_STATUS_HANDLER_H_5510293847561029

#include "../base/status_handler.h"


namespace mirror
{
//write log messages to stdout and a single-line progress indicator to stderr (terminal only)
class ConsoleStatusHandler : public StatusHandler
{
public:
    explicit ConsoleStatusHandler(bool showProgress);
    ~ConsoleStatusHandler();

    void logMessage(const std::wstring& msg, MsgType type) override; //throw AbortProcess

    void flushLog(); //print log entries not yet shown, e.g. those added by prepareResult()

private:
    void forceUiUpdateNoThrow() override;
    void clearProgressLine();

    const bool showProgress_;
    size_t printedCount_ = 0;
    size_t progressLineLen_ = 0; //0 if no progress line is currently visible
};
}

#endif //CONSOLE_STATUS_HANDLER_H_5510293847561029
