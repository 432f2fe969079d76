#include "idleguard/rolling_window.hpp"

#include <QDebug>

#include <algorithm>

namespace idleguard {

QJsonObject rollingTotalsToJson(const RollingTotals &totals)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("upload_mb"), totals.uploadMegabytes());
    obj.insert(QStringLiteral("download_mb"), totals.downloadMegabytes());
    return obj;
}

RollingWindowTotal::RollingWindowTotal(int windowSeconds)
    : windowSeconds_(std::max(1, windowSeconds))
{
}

void RollingWindowTotal::addCounters(const QDateTime &at,
                                     quint64 cumulativeUpload,
                                     quint64 cumulativeDownload)
{
    if (!havePrevious_) {
        havePrevious_ = true;
        previousUpload_ = cumulativeUpload;
        previousDownload_ = cumulativeDownload;
        expire(at);
        return;
    }

    Delta delta;
    delta.at = at;

    // A counter that went backwards was reset (interface down, reboot of the
    // source); the bytes since the reset are unknown, so count nothing.
    if (cumulativeUpload >= previousUpload_) {
        delta.upload = cumulativeUpload - previousUpload_;
    } else {
        qDebug() << "RollingWindowTotal: upload counter reset";
    }
    if (cumulativeDownload >= previousDownload_) {
        delta.download = cumulativeDownload - previousDownload_;
    } else {
        qDebug() << "RollingWindowTotal: download counter reset";
    }

    previousUpload_ = cumulativeUpload;
    previousDownload_ = cumulativeDownload;

    if (delta.upload != 0 || delta.download != 0) {
        sumUpload_ += delta.upload;
        sumDownload_ += delta.download;
        deltas_.push_back(delta);
    }

    expire(at);
}

void RollingWindowTotal::expire(const QDateTime &now)
{
    const QDateTime cutoff = now.addSecs(-windowSeconds_);

    while (!deltas_.empty() && deltas_.front().at < cutoff) {
        sumUpload_ -= deltas_.front().upload;
        sumDownload_ -= deltas_.front().download;
        deltas_.pop_front();
    }
}

RollingTotals RollingWindowTotal::totals() const
{
    RollingTotals t;
    t.uploadBytes = static_cast<double>(sumUpload_);
    t.downloadBytes = static_cast<double>(sumDownload_);
    return t;
}

void RollingWindowTotal::clear()
{
    deltas_.clear();
    havePrevious_ = false;
    previousUpload_ = 0;
    previousDownload_ = 0;
    sumUpload_ = 0;
    sumDownload_ = 0;
}

} // namespace idleguard
