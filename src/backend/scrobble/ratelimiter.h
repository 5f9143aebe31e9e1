#ifndef RATELIMITER_H
#define RATELIMITER_H

#include <QObject>
#include <QQueue>
#include <QTimer>
#include <functional>

// Spaces out outgoing requests so a web service never sees more than
// requestsPerSecond of them.
class RateLimiter : public QObject
{
    Q_OBJECT

public:
    explicit RateLimiter(int requestsPerSecond, QObject *parent = nullptr);

    void enqueue(std::function<void()> request);
    void clear();

    int pendingCount() const { return m_queue.size(); }
    int intervalMs() const { return m_intervalMs; }

private slots:
    void processQueue();

private:
    QQueue<std::function<void()>> m_queue;
    QTimer m_timer;
    int m_intervalMs;
};

#endif // RATELIMITER_H
