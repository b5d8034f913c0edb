#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <functional>

#include "crypto/kdf.hpp"
#include "crypto/sealedbox.hpp"
#include "crypto/field.hpp"
#include "crypto/verifier.hpp"

using pinseal::Bytes;

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

int main() {
    pinseal::utils::ensure_sodium_init();

    BenchmarkRunner primitive_runner(10000); // fast ops
    BenchmarkRunner derive_runner(5);        // Argon2id, 64 MiB

    Bytes salt(pinseal::kdf::SALT_SIZE, 0);

    // =====================================================================
    // SECTION 1: Key Derivation
    // =====================================================================
    std::cout << "\n--- Key Derivation (Avg over "
              << derive_runner.num_iters << " iters) ---" << std::endl;

    derive_runner.run("Argon2id Seed", [&]() {
        auto r = pinseal::kdf::derive_seed("123456", salt);
        (void)r;
    });

    derive_runner.run("Derive Key Pair", [&]() {
        auto r = pinseal::kdf::derive_keypair("123456", salt);
        (void)r;
    });

    auto kp = pinseal::kdf::derive_keypair("123456", salt);

    Bytes seed(pinseal::kdf::SEED_SIZE, 7);
    primitive_runner.run("Key Pair From Seed", [&]() {
        auto r = pinseal::kdf::keypair_from_seed(seed);
        (void)r;
    });

    // =====================================================================
    // SECTION 2: Sealed Boxes
    // =====================================================================
    std::cout << "\n--- Sealed Boxes (Avg over "
              << primitive_runner.num_iters << " iters) ---" << std::endl;

    std::string message = "OTP: 847291";
    Bytes plaintext(message.begin(), message.end());
    Bytes ciphertext = pinseal::sealedbox::encrypt(kp.public_key, plaintext);

    primitive_runner.run("Seal", [&]() {
        auto r = pinseal::sealedbox::encrypt(kp.public_key, plaintext);
        (void)r;
    });

    primitive_runner.run("Open", [&]() {
        auto r = pinseal::sealedbox::decrypt(kp, ciphertext);
        (void)r;
    });

    std::string tagged = pinseal::field::encrypt_field(message, kp.public_key_b64());
    primitive_runner.run("Decrypt Field", [&]() {
        auto r = pinseal::field::decrypt_field(tagged, kp);
        (void)r;
    });

    std::string verifier = pinseal::verifier::create_verifier(kp);
    primitive_runner.run("Verify", [&]() {
        bool r = pinseal::verifier::verify(kp, verifier);
        (void)r;
    });

    return 0;
}
