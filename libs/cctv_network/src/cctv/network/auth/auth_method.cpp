#include "auth_method.h"

namespace cctv {
namespace network {
namespace auth {

QString toString(AuthMethod method)
{
    switch (method)
    {
        case AuthMethod::none:
            return QStringLiteral("None");
        case AuthMethod::basic:
            return QStringLiteral("Basic");
        case AuthMethod::digest:
            return QStringLiteral("Digest");
        case AuthMethod::wsSecurity:
            return QStringLiteral("WS-Security");
    }
    return QString();
}

} // namespace auth
} // namespace network
} // namespace cctv
