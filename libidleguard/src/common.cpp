#include "idleguard/common.hpp"

namespace idleguard {

QDateTime nowUtc()
{
    return QDateTime::currentDateTimeUtc();
}

double secondsBetween(const QDateTime &from, const QDateTime &to)
{
    if (!from.isValid() || !to.isValid()) {
        return 0.0;
    }
    return static_cast<double>(from.msecsTo(to)) / 1000.0;
}

} // namespace idleguard
