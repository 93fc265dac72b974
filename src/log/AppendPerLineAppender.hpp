#pragma once

#include <plog/Appenders/IAppender.h>
#include <plog/Record.h>
#include <plog/Util.h>

#include <filesystem>
#include <fstream>
#include <mutex>

// File appender that reopens the log for every record. The dispatcher and the
// monitor write the same file from separate processes, so no handle is kept
// open between records and nothing is rotated.
template <class Formatter>
class AppendPerLineAppender : public plog::IAppender
{
public:
    explicit AppendPerLineAppender(std::filesystem::path path)
        : path_(std::move(path))
    {
    }

    void write(const plog::Record& record) override
    {
        plog::util::nstring line = Formatter::format(record);

        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream out(path_, std::ios::app | std::ios::binary);
        if (!out)
            return;

        out << line;
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};
