#include "MonitorLoop.hpp"
#include "IRelauncher.hpp"
#include "IProcessProbe.hpp"
#include "INotifier.hpp"

#include <plog/Log.h>

#include <thread>

namespace focusguard
{

MonitorLoop::MonitorLoop(MonitorSettings settings, std::vector<MonitorTarget> targets, IProcessProbe& probe,
                         INotifier& notifier, SleepFn sleep)
    : settings_(std::move(settings))
    , targets_(std::move(targets))
    , probe_(probe)
    , notifier_(notifier)
    , sleep_(std::move(sleep))
{
}

MonitorLoop::~MonitorLoop() = default;

int MonitorLoop::run(const std::atomic<bool>& keep_running)
{
    PLOG_INFO << "Monitor started: " << targets_.size() << " target(s), pause after "
              << settings_.pause_threshold << " checks for " << settings_.pause_duration.count() << "s";
    for (const auto& target : targets_)
    {
        PLOG_INFO << "  watching " << target.process_name << " -> " << target.relauncher->describe();
    }

    while (keep_running.load())
    {
        runIteration();
    }

    PLOG_INFO << "Monitor stopped";
    return 0;
}

void MonitorLoop::runIteration()
{
    ++counter_;

    for (auto& target : targets_)
    {
        checkTarget(target);
    }

    if (counter_ >= settings_.pause_threshold)
    {
        pause();
    }

    sleep_(settings_.check_interval);
}

void MonitorLoop::checkTarget(MonitorTarget& target)
{
    if (probe_.isRunning(target.process_name))
        return;

    PLOG_INFO << target.process_name << " is not running, relaunching (" << target.relauncher->describe() << ")";

    std::string error_message;
    if (!target.relauncher->relaunch(error_message))
    {
        ++relaunch_failures_;
        PLOG_ERROR << "Failed to relaunch " << target.process_name << ": " << error_message;
    }
}

void MonitorLoop::pause()
{
    state_ = MonitorState::Paused;
    ++pause_count_;

    PLOG_INFO << "Reached " << counter_ << " checks, pausing for " << settings_.pause_duration.count() << "s";

    std::string error_message;
    if (!notifier_.notify(settings_.notification_title, settings_.notification_message, error_message))
    {
        PLOG_WARNING << "Pause notification failed: " << error_message;
    }

    sleep_(std::chrono::duration_cast<std::chrono::milliseconds>(settings_.pause_duration));

    counter_ = 0;
    state_ = MonitorState::Active;
    PLOG_INFO << "Resuming checks";
}

void MonitorLoop::DefaultSleep(std::chrono::milliseconds duration)
{
    std::this_thread::sleep_for(duration);
}

} // namespace focusguard
