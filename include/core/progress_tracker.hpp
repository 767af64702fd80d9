#pragma once

#include <mutex>
#include <string>
#include <vector>

enum class Stage
{
    Idle,
    Analyzing,
    Converting,
    Optimizing,
    Finalizing,
    Completed,
    Failed
};

std::string stageName(Stage stage);
bool isTerminalStage(Stage stage);

struct ProgressUpdate
{
    std::string task_id;
    Stage stage;
    double progress; // Overall fraction in [0, 1]
    std::string message;
};

/**
 * @brief Observer interface for stage and progress changes
 */
class ProgressObserver
{
public:
    virtual ~ProgressObserver() = default;
    virtual void onProgress(const ProgressUpdate &update) = 0;
};

/**
 * @brief Stage state machine for the task currently owned by a coordinator.
 *
 * Stages only move forward (Idle → Analyzing → Converting → Optimizing →
 * Finalizing → Completed, or to Failed from any non-terminal stage) and the
 * progress fraction never decreases within one task. begin() starts a new task
 * at Idle.
 */
class ProgressTracker
{
public:
    ProgressTracker() = default;

    void begin(const std::string &task_id);

    /**
     * @brief Move to a later stage
     * @return false (state unchanged) for backward moves or moves out of a terminal stage
     */
    bool transition(Stage next, const std::string &message = "");

    /**
     * @brief Raise progress; values below the current one are ignored, values are clamped to [0, 1]
     */
    void report(double progress, const std::string &message = "");

    /**
     * @brief Terminal failure from any non-terminal stage
     */
    void fail(const std::string &reason);

    Stage stage() const;
    double progress() const;
    std::string taskId() const;

    void subscribe(ProgressObserver *observer);
    void unsubscribe(ProgressObserver *observer);

private:
    void publish(const ProgressUpdate &update);

    mutable std::mutex state_mutex_;
    std::string task_id_;
    Stage stage_ = Stage::Idle;
    double progress_ = 0.0;

    std::mutex observers_mutex_;
    std::vector<ProgressObserver *> observers_;
};
