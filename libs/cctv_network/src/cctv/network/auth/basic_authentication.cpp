#include "basic_authentication.h"

namespace cctv {
namespace network {
namespace auth {

QByteArray buildBasicAuthorization(const Credential& credential)
{
    const QByteArray userPassword =
        credential.username().toUtf8() + ':' + credential.password().toUtf8();
    return "Basic " + userPassword.toBase64();
}

} // namespace auth
} // namespace network
} // namespace cctv
