#pragma once
#include <gatecore/config.h>
#include <gatecore/session/session.h>

#include <memory>
#include <string>
#include <system_error>
#include <unordered_map>

namespace gatecore {

// 凭证校验，认证时调用一次
class authenticator {
  public:
    authenticator() = default;

    virtual ~authenticator() noexcept = default;

    GATECORE_NON_COPYABLE(authenticator)

    virtual std::error_code verify(const std::string& credential, player_id& player) = 0;
};

using authenticator_ptr = std::shared_ptr<authenticator>;

// 固定的 token 表
class static_token_authenticator final : public authenticator {
  public:
    GATECORE_API explicit static_token_authenticator(std::unordered_map<std::string, player_id> tokens);

    ~static_token_authenticator() noexcept override = default;

    GATECORE_NON_COPYABLE(static_token_authenticator)

    GATECORE_API std::error_code verify(const std::string& credential, player_id& player) override;

  private:
    std::unordered_map<std::string, player_id> tokens_;
};

}  // namespace gatecore
