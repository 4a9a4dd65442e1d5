#include <catch2/catch_test_macros.hpp>
#include "synccrypto/account/account_key_factory.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/core/constants.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace synccrypto;
using namespace synccrypto::crypto;
using synccrypto::account::AccountKeyFactory;

TEST_CASE("Concurrency - Parallel account creation", "[concurrency][account]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("4 threads sharing one factory derive the same primary key") {
        const AccountKeyFactory factory;
        auto reference = factory.CreateAccount("user-1234", "correct horse").Unwrap();
        const auto expected_primary = reference.primary_key.ReadBytes(Constants::PRIMARY_KEY_SIZE).Unwrap();

        constexpr int THREAD_COUNT = 4;

        std::atomic<int> failures{0};
        std::atomic<int> mismatches{0};
        std::set<std::vector<uint8_t>> data_keys;
        std::mutex data_keys_mutex;

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                auto result = factory.CreateAccount("user-1234", "correct horse");
                if (result.IsErr()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
                auto keys = std::move(result).Unwrap();
                auto primary = keys.primary_key.ReadBytes(Constants::PRIMARY_KEY_SIZE);
                auto data_key = keys.data_key.ReadBytes(Constants::DATA_KEY_SIZE);
                if (primary.IsErr() || data_key.IsErr()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
                if (primary.Unwrap() != expected_primary ||
                    keys.password_verifier != reference.password_verifier) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
                std::lock_guard lock(data_keys_mutex);
                data_keys.insert(std::move(data_key).Unwrap());
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(mismatches.load() == 0);
        REQUIRE(data_keys.size() == static_cast<size_t>(THREAD_COUNT));
    }

    SECTION("Parallel encryption never repeats a nonce") {
        std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0xAB);
        std::vector<uint8_t> plaintext(Constants::DATA_KEY_SIZE, 0x01);

        constexpr int THREAD_COUNT = 16;
        constexpr int BUNDLES_PER_THREAD = 500;

        std::set<std::vector<uint8_t>> nonces;
        std::mutex nonces_mutex;
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < BUNDLES_PER_THREAD; ++i) {
                    auto bundle = SymmetricCodec::Encrypt(plaintext, key);
                    if (bundle.IsErr()) {
                        failures.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    const auto& bytes = bundle.Unwrap();
                    std::vector<uint8_t> nonce(bytes.end() - Constants::SECRETBOX_NONCE_SIZE, bytes.end());
                    std::lock_guard lock(nonces_mutex);
                    nonces.insert(std::move(nonce));
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(nonces.size() == static_cast<size_t>(THREAD_COUNT * BUNDLES_PER_THREAD));
    }
}
