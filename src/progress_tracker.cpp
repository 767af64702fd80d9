#include "core/progress_tracker.hpp"
#include "logging/logger.hpp"
#include <algorithm>

std::string stageName(Stage stage)
{
    switch (stage)
    {
    case Stage::Idle:
        return "idle";
    case Stage::Analyzing:
        return "analyzing";
    case Stage::Converting:
        return "converting";
    case Stage::Optimizing:
        return "optimizing";
    case Stage::Finalizing:
        return "finalizing";
    case Stage::Completed:
        return "completed";
    case Stage::Failed:
        return "failed";
    }
    return "unknown";
}

bool isTerminalStage(Stage stage)
{
    return stage == Stage::Completed || stage == Stage::Failed;
}

void ProgressTracker::begin(const std::string &task_id)
{
    ProgressUpdate update;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        task_id_ = task_id;
        stage_ = Stage::Idle;
        progress_ = 0.0;
        update = ProgressUpdate{task_id_, stage_, progress_, "queued"};
    }
    publish(update);
}

bool ProgressTracker::transition(Stage next, const std::string &message)
{
    ProgressUpdate update;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (isTerminalStage(stage_))
        {
            Logger::warn("ProgressTracker: ignoring transition to " + stageName(next) + " after terminal stage " +
                         stageName(stage_) + " (" + task_id_ + ")");
            return false;
        }
        if (next == Stage::Failed)
        {
            stage_ = Stage::Failed;
        }
        else if (static_cast<int>(next) > static_cast<int>(stage_))
        {
            stage_ = next;
            if (next == Stage::Completed)
            {
                progress_ = 1.0;
            }
        }
        else
        {
            Logger::warn("ProgressTracker: rejected backward transition " + stageName(stage_) + " -> " +
                         stageName(next) + " (" + task_id_ + ")");
            return false;
        }
        update = ProgressUpdate{task_id_, stage_, progress_, message};
    }
    publish(update);
    return true;
}

void ProgressTracker::report(double progress, const std::string &message)
{
    ProgressUpdate update;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (isTerminalStage(stage_))
        {
            return;
        }
        double clamped = std::clamp(progress, 0.0, 1.0);
        if (clamped <= progress_)
        {
            return;
        }
        progress_ = clamped;
        update = ProgressUpdate{task_id_, stage_, progress_, message};
    }
    publish(update);
}

void ProgressTracker::fail(const std::string &reason)
{
    transition(Stage::Failed, reason);
}

Stage ProgressTracker::stage() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stage_;
}

double ProgressTracker::progress() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return progress_;
}

std::string ProgressTracker::taskId() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return task_id_;
}

void ProgressTracker::subscribe(ProgressObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void ProgressTracker::unsubscribe(ProgressObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void ProgressTracker::publish(const ProgressUpdate &update)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    for (auto observer : observers_)
    {
        try
        {
            observer->onProgress(update);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in progress observer: " + std::string(e.what()));
        }
    }
}
