#pragma once

#include <stdexcept>
#include <string>

namespace forge {

// Token could not be obtained (tool missing, not logged in, timed out).
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& msg) : std::runtime_error(msg) {}
};

// Resolves the auth token handed to plugins that declare requires_auth.
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;
    // Throws AuthError.
    virtual std::string token() = 0;
};

// `chainctl auth token`, bounded by timeout_ms.
class ChainctlTokenProvider : public ITokenProvider {
public:
    explicit ChainctlTokenProvider(int timeout_ms = 30000) : timeout_ms_(timeout_ms) {}
    std::string token() override;

private:
    int timeout_ms_;
};

} // namespace forge
