/**
 * @file account_keys_example.cpp
 * @brief Account creation, login preparation and data key recovery
 */

#include "synccrypto/account/account_key_factory.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/core/result.hpp"

#include <iostream>
#include <iomanip>
#include <span>
#include <string>
#include <vector>

using namespace synccrypto;
using namespace synccrypto::crypto;
using synccrypto::account::AccountKeyFactory;

void print_hex(const std::string& label, std::span<const uint8_t> data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== SyncCrypto - Account Keys Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    const AccountKeyFactory factory;

    std::cout << "2. Creating account keys for user-1234..." << std::endl;
    auto create_result = factory.CreateAccount("user-1234", "correct horse");
    if (create_result.IsErr()) {
        std::cerr << "Failed to create account: "
                  << create_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto keys = std::move(create_result).Unwrap();
    std::cout << "   ✓ Account keys created" << std::endl;
    print_hex("   Password verifier", keys.password_verifier);
    print_hex("   Protected key envelope", keys.protected_key_envelope);
    std::cout << "   Primary key: [SECURE - stored in protected memory]" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Preparing login from the primary key..." << std::endl;
    auto primary_bytes = keys.primary_key.ReadBytes(keys.primary_key.Size());
    if (primary_bytes.IsErr()) {
        std::cerr << "Failed to read primary key" << std::endl;
        return 1;
    }
    std::vector<uint8_t> primary_key = std::move(primary_bytes).Unwrap();
    ScopedWipe wipe_primary_key(primary_key);
    auto login_result = factory.PrepareForLogin(primary_key);
    if (login_result.IsErr()) {
        std::cerr << "Failed to prepare login: "
                  << login_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const bool verifier_matches = login_result.Unwrap().password_verifier == keys.password_verifier;
    std::cout << "   " << (verifier_matches ? "✓" : "✗")
              << " Login verifier matches account verifier" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Recovering the data key with the password..." << std::endl;
    auto recovered = factory.RecoverDataKey("user-1234", "correct horse", keys.protected_key_envelope);
    if (recovered.IsErr()) {
        std::cerr << "Failed to recover data key: "
                  << recovered.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Data key recovered" << std::endl;

    auto wrong = factory.RecoverDataKey("user-1234", "wrong horse", keys.protected_key_envelope);
    std::cout << "   " << (wrong.IsErr() ? "✓" : "✗")
              << " Wrong password rejected" << std::endl;
    std::cout << std::endl;

    std::cout << "5. Encrypting a payload with the data key..." << std::endl;
    const std::string message = "sync payload";
    const std::vector<uint8_t> payload(message.begin(), message.end());
    auto sealed = keys.data_key.WithReadAccess([&payload](std::span<const uint8_t> data_key) {
        return SymmetricCodec::Encrypt(payload, data_key);
    });
    if (sealed.IsErr() || sealed.Unwrap().IsErr()) {
        std::cerr << "Failed to encrypt payload" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Encrypted " << payload.size() << " bytes into "
              << sealed.Unwrap().Unwrap().size() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
