#pragma once

#include <QDateTime>

namespace idleguard {

QDateTime nowUtc();

// Seconds from `from` to `to`, with millisecond resolution. Returns 0 when
// either timestamp is invalid.
double secondsBetween(const QDateTime &from, const QDateTime &to);

} // namespace idleguard
