/**
 * @file session_state.cpp
 * @brief Single-flight token refresh
 */

#include <xnat/client/session_state.hpp>

namespace xnat::client {

auto session_state::snapshot() const -> token_snapshot {
    std::shared_lock lock(mutex_);
    return token_snapshot{token_, expires_at_, generation_};
}

void session_state::install(token_grant grant) {
    std::unique_lock lock(mutex_);
    token_ = std::move(grant.token);
    expires_at_ = grant.expires_at;
    last_failure_.reset();
    ++generation_;
}

auto session_state::refresh(std::uint64_t observed_generation,
                            const authenticator& authenticate) -> Result<token_snapshot> {
    std::lock_guard refresh_lock(refresh_mutex_);

    {
        std::shared_lock lock(mutex_);
        if (generation_ != observed_generation) {
            if (last_failure_) {
                return Result<token_snapshot>(*last_failure_);
            }
            return ok(token_snapshot{token_, expires_at_, generation_});
        }
    }

    ++authentication_count_;
    auto grant = authenticate();

    std::unique_lock lock(mutex_);
    ++generation_;
    if (grant.is_err()) {
        token_.reset();
        last_failure_ = grant.error();
        return Result<token_snapshot>(grant.error());
    }

    token_ = grant.value().token;
    expires_at_ = grant.value().expires_at;
    last_failure_.reset();
    return ok(token_snapshot{token_, expires_at_, generation_});
}

void session_state::clear() {
    std::unique_lock lock(mutex_);
    token_.reset();
    last_failure_.reset();
    ++generation_;
}

}  // namespace xnat::client
