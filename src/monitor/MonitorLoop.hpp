#pragma once

#include "../config/GuardConfig.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace focusguard
{

class IRelauncher;
class IProcessProbe;
class INotifier;

enum class MonitorState
{
    Active, // checking and relaunching
    Paused // sleeping out the pause after the threshold
};

struct MonitorTarget
{
    std::string process_name;
    std::unique_ptr<IRelauncher> relauncher;
};

// Level-triggered supervisor: every iteration each missing target is
// relaunched again, with no backoff and no attempt cap. After
// pause_threshold iterations it notifies once, sleeps for pause_duration and
// starts counting from zero.
class MonitorLoop
{
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    MonitorLoop(MonitorSettings settings, std::vector<MonitorTarget> targets, IProcessProbe& probe,
                INotifier& notifier, SleepFn sleep = DefaultSleep);
    ~MonitorLoop();

    // Iterate until keep_running turns false
    int run(const std::atomic<bool>& keep_running);

    // One ACTIVE step: count, check every target, pause if due, then sleep
    // for the check interval
    void runIteration();

    MonitorState state() const { return state_; }
    int counter() const { return counter_; }
    std::uint64_t pauseCount() const { return pause_count_; }
    std::uint64_t relaunchFailures() const { return relaunch_failures_; }
    const std::vector<MonitorTarget>& targets() const { return targets_; }

    static void DefaultSleep(std::chrono::milliseconds duration);

private:
    void checkTarget(MonitorTarget& target);
    void pause();

    MonitorSettings settings_;
    std::vector<MonitorTarget> targets_;
    IProcessProbe& probe_;
    INotifier& notifier_;
    SleepFn sleep_;

    MonitorState state_ = MonitorState::Active;
    int counter_ = 0;
    std::uint64_t pause_count_ = 0;
    std::uint64_t relaunch_failures_ = 0;
};

} // namespace focusguard
