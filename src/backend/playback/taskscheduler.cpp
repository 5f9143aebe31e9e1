#include "taskscheduler.h"

#include <QTimer>
#include <QDebug>

QtTaskScheduler::QtTaskScheduler(QObject *parent)
    : QObject(parent)
{
}

QtTaskScheduler::~QtTaskScheduler()
{
    cancelAll();
}

TaskScheduler::TaskId QtTaskScheduler::scheduleOnce(int delayMs, std::function<void()> task)
{
    return schedule(delayMs, true, std::move(task));
}

TaskScheduler::TaskId QtTaskScheduler::scheduleRepeating(int intervalMs, std::function<void()> task)
{
    return schedule(intervalMs, false, std::move(task));
}

TaskScheduler::TaskId QtTaskScheduler::schedule(int intervalMs, bool singleShot, std::function<void()> task)
{
    const TaskId id = m_nextId++;

    QTimer *timer = new QTimer(this);
    timer->setTimerType(Qt::PreciseTimer);
    timer->setSingleShot(singleShot);
    timer->setInterval(qMax(intervalMs, 0));

    connect(timer, &QTimer::timeout, this, [this, id, singleShot, task]() {
        // A task cancelled while its timeout was already queued must not run
        if (!m_timers.contains(id)) {
            return;
        }
        if (singleShot) {
            QTimer *finished = m_timers.take(id);
            finished->deleteLater();
        }
        task();
    });

    m_timers.insert(id, timer);
    timer->start();
    return id;
}

void QtTaskScheduler::cancel(TaskId id)
{
    QTimer *timer = m_timers.take(id);
    if (!timer) {
        return;
    }
    timer->stop();
    timer->deleteLater();
}

void QtTaskScheduler::cancelAll()
{
    if (!m_timers.isEmpty()) {
        qDebug() << "[QtTaskScheduler::cancelAll] Cancelling" << m_timers.size() << "tasks";
    }
    for (QTimer *timer : std::as_const(m_timers)) {
        timer->stop();
        timer->deleteLater();
    }
    m_timers.clear();
}
