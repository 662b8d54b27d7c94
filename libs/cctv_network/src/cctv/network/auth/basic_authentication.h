#pragma once

#include <QtCore/QByteArray>

#include "credential.h"

namespace cctv {
namespace network {
namespace auth {

/**
 * "Basic " + base64(username:password).
 */
QByteArray buildBasicAuthorization(const Credential& credential);

} // namespace auth
} // namespace network
} // namespace cctv
