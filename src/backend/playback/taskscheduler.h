#ifndef TASKSCHEDULER_H
#define TASKSCHEDULER_H

#include <QObject>
#include <QHash>
#include <functional>

class QTimer;

// Source of delayed and periodic callbacks for the playback engine.
// Every scheduled task gets an id that cancels it.
class TaskScheduler
{
public:
    using TaskId = quint64;
    static constexpr TaskId InvalidTask = 0;

    virtual ~TaskScheduler() = default;

    virtual TaskId scheduleOnce(int delayMs, std::function<void()> task) = 0;
    virtual TaskId scheduleRepeating(int intervalMs, std::function<void()> task) = 0;

    // After cancel() returns the task will not run again. Unknown ids are ignored.
    virtual void cancel(TaskId id) = 0;
    virtual void cancelAll() = 0;
    virtual int pendingCount() const = 0;
};

// QTimer backed scheduler; tasks run on the thread that owns the scheduler
class QtTaskScheduler : public QObject, public TaskScheduler
{
    Q_OBJECT

public:
    explicit QtTaskScheduler(QObject *parent = nullptr);
    ~QtTaskScheduler() override;

    TaskId scheduleOnce(int delayMs, std::function<void()> task) override;
    TaskId scheduleRepeating(int intervalMs, std::function<void()> task) override;
    void cancel(TaskId id) override;
    void cancelAll() override;
    int pendingCount() const override { return m_timers.size(); }

private:
    TaskId schedule(int intervalMs, bool singleShot, std::function<void()> task);

    QHash<TaskId, QTimer*> m_timers;
    TaskId m_nextId = 1;
};

#endif // TASKSCHEDULER_H
