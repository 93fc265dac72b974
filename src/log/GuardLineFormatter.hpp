#pragma once

#include <plog/Record.h>
#include <plog/Util.h>

#include <iomanip>
#include <ctime>

// Plain line formatter shared by the dispatcher and the monitor process:
//   2026-01-31 08:15:02 [INFO] message
struct GuardLineFormatter
{
    static plog::util::nstring header()
    {
        return plog::util::nstring();
    }

    static const plog::util::nchar* severityLabel(plog::Severity severity)
    {
        switch (severity)
        {
        case plog::fatal:
            return PLOG_NSTR("FATAL");
        case plog::error:
            return PLOG_NSTR("ERROR");
        case plog::warning:
            return PLOG_NSTR("WARN");
        case plog::info:
            return PLOG_NSTR("INFO");
        case plog::debug:
            return PLOG_NSTR("DEBUG");
        case plog::verbose:
            return PLOG_NSTR("VERBOSE");
        default:
            return PLOG_NSTR("NONE");
        }
    }

    static plog::util::nstring format(const plog::Record& record)
    {
        std::tm t{};
        plog::util::localtime_s(&t, &record.getTime().time);

        plog::util::nostringstream ss;
        ss << t.tm_year + 1900 << PLOG_NSTR("-") << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_mon + 1
           << PLOG_NSTR("-") << std::setw(2) << t.tm_mday << PLOG_NSTR(" ");
        ss << std::setw(2) << t.tm_hour << PLOG_NSTR(":") << std::setw(2) << t.tm_min << PLOG_NSTR(":")
           << std::setw(2) << t.tm_sec << PLOG_NSTR(" ");
        ss << PLOG_NSTR("[") << severityLabel(record.getSeverity()) << PLOG_NSTR("] ");
        ss << record.getMessage() << PLOG_NSTR("\n");

        return ss.str();
    }
};
