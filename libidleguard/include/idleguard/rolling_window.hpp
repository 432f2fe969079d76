#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QtGlobal>

#include <deque>

namespace idleguard {

constexpr double kBytesPerMegabyte = 1000.0 * 1000.0;

struct RollingTotals
{
    double uploadBytes   = 0.0;
    double downloadBytes = 0.0;

    double uploadMegabytes() const { return uploadBytes / kBytesPerMegabyte; }
    double downloadMegabytes() const { return downloadBytes / kBytesPerMegabyte; }
};

QJsonObject rollingTotalsToJson(const RollingTotals &totals);

// Bytes transferred during the trailing window, derived from monotonic
// interface counters. Each observation stores the counter delta since the
// previous one; totals drop only when deltas age out of the window.
class RollingWindowTotal
{
public:
    explicit RollingWindowTotal(int windowSeconds = 3600);

    void addCounters(const QDateTime &at, quint64 cumulativeUpload, quint64 cumulativeDownload);

    // Drops deltas older than the window relative to `now`.
    void expire(const QDateTime &now);

    RollingTotals totals() const;

    void clear();

    int windowSeconds() const { return windowSeconds_; }
    std::size_t size() const { return deltas_.size(); }

private:
    struct Delta {
        QDateTime at;
        quint64 upload = 0;
        quint64 download = 0;
    };

    int windowSeconds_;
    std::deque<Delta> deltas_;

    bool havePrevious_ = false;
    quint64 previousUpload_ = 0;
    quint64 previousDownload_ = 0;

    quint64 sumUpload_ = 0;
    quint64 sumDownload_ = 0;
};

} // namespace idleguard
