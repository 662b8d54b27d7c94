#pragma once

#include <QtCore/QString>

namespace cctv {
namespace network {
namespace auth {

enum class AuthMethod
{
    none,
    basic,
    digest,
    wsSecurity,
};

QString toString(AuthMethod method);

} // namespace auth
} // namespace network
} // namespace cctv
