#ifndef DURATIONRESOLVER_H
#define DURATIONRESOLVER_H

#include <QString>
#include <functional>
#include <limits>
#include <optional>

namespace Vinyl {

class DurationLookup;

struct ResolvedDuration {
    enum Source {
        Catalog,
        Lookup,
        Default
    };

    int seconds = 1;
    QString display;
    Source source = Default;
};

// Turns a catalog duration string into a usable track length.
// Resolution order: catalog string, external lookup, fixed default.
class DurationResolver
{
public:
    static constexpr int DefaultDurationSeconds = 210;
    // Longest track whose length still fits an int of milliseconds
    static constexpr int MaxDurationSeconds = std::numeric_limits<int>::max() / 1000;
    static const QString DefaultDurationDisplay;

    using Callback = std::function<void(const ResolvedDuration &)>;

    explicit DurationResolver(DurationLookup *lookup = nullptr);

    void setLookup(DurationLookup *lookup) { m_lookup = lookup; }
    DurationLookup *lookup() const { return m_lookup; }

    // Completes synchronously unless the lookup has to be consulted
    void resolve(const QString &catalogDuration, const QString &artist,
                 const QString &title, Callback callback) const;

    // "M:SS" or "H:MM:SS" up to MaxDurationSeconds; std::nullopt for anything else
    static std::optional<int> parseCatalogDuration(const QString &duration);
    static QString formatDuration(int seconds);

    static ResolvedDuration fromCatalog(int seconds, const QString &display);
    static ResolvedDuration fromMilliseconds(qint64 durationMs);
    static ResolvedDuration fallback();

private:
    DurationLookup *m_lookup = nullptr;
};

} // namespace Vinyl

#endif // DURATIONRESOLVER_H
