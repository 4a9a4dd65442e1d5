#pragma once

#include <cstddef>

namespace synccrypto::configuration {

/// Argon2id cost parameters
///
/// Presets mirror libsodium's crypto_pwhash presets:
/// - Interactive: 2 passes, 64 MiB (account creation and login)
/// - Moderate: 3 passes, 256 MiB (stored verifier strings)
/// - Sensitive: 4 passes, 1 GiB (offline, highly sensitive data)
///
/// Both limits are checked against crypto_pwhash_OPSLIMIT_MIN/MAX and
/// crypto_pwhash_MEMLIMIT_MIN/MAX by PasswordHasher before hashing.
class PasswordHardness {
public:
    [[nodiscard]] static constexpr PasswordHardness Interactive() noexcept {
        return PasswordHardness(2ULL, 67108864ULL);
    }

    [[nodiscard]] static constexpr PasswordHardness Moderate() noexcept {
        return PasswordHardness(3ULL, 268435456ULL);
    }

    [[nodiscard]] static constexpr PasswordHardness Sensitive() noexcept {
        return PasswordHardness(4ULL, 1073741824ULL);
    }

    [[nodiscard]] constexpr unsigned long long OpsLimit() const noexcept { return ops_limit_; }
    [[nodiscard]] constexpr size_t MemLimit() const noexcept { return mem_limit_; }

    [[nodiscard]] constexpr bool operator==(const PasswordHardness& other) const noexcept {
        return ops_limit_ == other.ops_limit_ && mem_limit_ == other.mem_limit_;
    }

private:
    constexpr PasswordHardness(unsigned long long ops_limit, size_t mem_limit) noexcept
        : ops_limit_(ops_limit), mem_limit_(mem_limit) {}

    unsigned long long ops_limit_;
    size_t mem_limit_;
};

/// Settings used by AccountKeyFactory
///
/// primary_key_hardness must stay the same between account creation and
/// every later login, otherwise the primary key (and therefore the
/// verifier and stretch key) changes.
struct AccountKeyConfig {
    PasswordHardness primary_key_hardness = PasswordHardness::Interactive();
    PasswordHardness verifier_string_hardness = PasswordHardness::Moderate();

    [[nodiscard]] static constexpr AccountKeyConfig Default() noexcept {
        return AccountKeyConfig{};
    }
};

} // namespace synccrypto::configuration
