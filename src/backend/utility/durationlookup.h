#ifndef DURATIONLOOKUP_H
#define DURATIONLOOKUP_H

#include <QString>
#include <functional>

namespace Vinyl {

// External metadata service able to tell how long a recording is
class DurationLookup
{
public:
    enum class Status {
        Found,
        NotFound,
        Error
    };

    struct Result {
        Status status = Status::NotFound;
        qint64 durationMs = 0;
        QString message;
    };

    using Callback = std::function<void(const Result &)>;

    virtual ~DurationLookup() = default;

    // The callback runs exactly once, possibly before this call returns
    virtual void lookupDuration(const QString &artist, const QString &title, Callback callback) = 0;
};

} // namespace Vinyl

#endif // DURATIONLOOKUP_H
