#include <gatecore/error.h>
#include <gatecore/server/authenticator.h>

namespace gatecore {

static_token_authenticator::static_token_authenticator(std::unordered_map<std::string, player_id> tokens)
    : tokens_(std::move(tokens)) {}

std::error_code static_token_authenticator::verify(const std::string& credential, player_id& player) {
    if (credential.empty()) {
        return auth_errors::empty_credential;
    }

    const auto it = tokens_.find(credential);
    if (it == tokens_.end()) {
        return auth_errors::invalid_credential;
    }

    player = it->second;
    return {};
}

}  // namespace gatecore
