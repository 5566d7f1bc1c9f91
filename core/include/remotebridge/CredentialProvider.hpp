// Opaque secret lookup. The engine asks for a secret right before connecting
// and never stores it.
#pragma once
#include "SftpTypes.hpp"
#include <optional>
#include <string>

namespace remotebridge {

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    // Password or key passphrase for the given session, if any is stored.
    virtual std::optional<std::string> getCredential(const SessionParams& params) = 0;
};

} // namespace remotebridge
