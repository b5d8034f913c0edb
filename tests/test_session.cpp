#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"
#include "session/session.hpp"
#include "crypto/verifier.hpp"

#include <string>
#include <vector>

using namespace test_helpers;
using pinseal::session::Config;
using pinseal::session::SessionKeyManager;

namespace {

// Server-side record for PIN "246810"
struct ServerRecord {
    std::string salt_b64;
    std::string verifier_b64;
    KeyPair     kp;
};

const ServerRecord& server_record() {
    static const ServerRecord record = [] {
        ServerRecord r;
        Bytes salt = random_bytes(pinseal::kdf::SALT_SIZE);
        r.salt_b64 = pinseal::utils::base64_encode(salt);
        r.kp = pinseal::kdf::derive_keypair("246810", salt);
        r.verifier_b64 = pinseal::verifier::create_verifier(r.kp);
        return r;
    }();
    return record;
}

// Reads PINs from a script and queries the manager while it is prompting
class QueryingPinSource : public pinseal::session::PinSource {
public:
    explicit QueryingPinSource(std::vector<std::string> pins) : script(std::move(pins)) {}

    std::string read_pin(const std::string& prompt) override {
        if (manager) {
            saw_cached.push_back(manager->has_cached_keypair());
            manager->clear();
            manager->set_prompt("Retry PIN: ");
        }
        return script.read_pin(prompt);
    }

    SessionKeyManager* manager = nullptr;
    std::vector<bool>  saw_cached;
    ScriptedPinSource  script;
};

struct Messages {
    std::vector<std::string> lines;

    pinseal::session::Notifier notifier() {
        return [this](const std::string& m) { lines.push_back(m); };
    }
};

} // namespace

TEST_CASE("Session - correct PIN", "[session]") {
    const ServerRecord& rec = server_record();
    ScriptedPinSource source({"246810"});
    Messages messages;
    SessionKeyManager manager(source, messages.notifier());

    REQUIRE_FALSE(manager.has_cached_keypair());

    KeyPair kp = manager.get_or_prompt(rec.salt_b64, rec.verifier_b64);
    REQUIRE(kp == rec.kp);
    REQUIRE(source.calls == 1);
    REQUIRE(source.last_prompt == pinseal::session::DEFAULT_PIN_PROMPT);
    REQUIRE(messages.lines.empty());
    REQUIRE(manager.has_cached_keypair());

    SECTION("cached pair is returned without prompting again") {
        KeyPair again = manager.get_or_prompt(rec.salt_b64, rec.verifier_b64);
        REQUIRE(again == rec.kp);
        REQUIRE(source.calls == 1);
    }

    SECTION("clear empties the cache and is idempotent") {
        manager.clear();
        REQUIRE_FALSE(manager.has_cached_keypair());
        manager.clear();
        REQUIRE_FALSE(manager.has_cached_keypair());

        // Script is exhausted, so a new prompt surfaces the source's error
        REQUIRE_THROWS_AS(manager.get_or_prompt(rec.salt_b64, rec.verifier_b64),
                          pinseal::NonInteractiveInput);
    }
}

TEST_CASE("Session - retries", "[session]") {
    const ServerRecord& rec = server_record();

    SECTION("wrong PIN then correct PIN") {
        ScriptedPinSource source({"111111", "246810"});
        Messages messages;
        SessionKeyManager manager(source, messages.notifier());

        KeyPair kp = manager.get_or_prompt(rec.salt_b64, rec.verifier_b64);
        REQUIRE(kp == rec.kp);
        REQUIRE(source.calls == 2);
        REQUIRE(messages.lines == std::vector<std::string>{"Incorrect PIN. 2 attempt(s) remaining."});
    }

    SECTION("three wrong PINs exhaust the budget") {
        ScriptedPinSource source({"111111", "222222", "333333", "246810"});
        Messages messages;
        SessionKeyManager manager(source, messages.notifier());

        REQUIRE_THROWS_AS(manager.get_or_prompt(rec.salt_b64, rec.verifier_b64),
                          pinseal::MaxAttemptsExceeded);
        REQUIRE(source.calls == 3);
        REQUIRE_FALSE(manager.has_cached_keypair());
        REQUIRE(messages.lines == std::vector<std::string>{
            "Incorrect PIN. 2 attempt(s) remaining.",
            "Incorrect PIN. 1 attempt(s) remaining."});
    }
}

TEST_CASE("Session - input errors", "[session]") {
    const ServerRecord& rec = server_record();

    SECTION("malformed salt fails before prompting") {
        ScriptedPinSource source({"246810"});
        SessionKeyManager manager(source, nullptr);

        REQUIRE_THROWS_AS(manager.get_or_prompt("%%%", rec.verifier_b64), pinseal::DecodingError);
        REQUIRE(source.calls == 0);
    }

    SECTION("PIN format errors propagate and nothing is cached") {
        ScriptedPinSource source({"12ab56"});
        SessionKeyManager manager(source, nullptr);

        REQUIRE_THROWS_AS(manager.get_or_prompt(rec.salt_b64, rec.verifier_b64), pinseal::PinFormatError);
        REQUIRE_FALSE(manager.has_cached_keypair());
    }

    SECTION("salts that are not 16 bytes still unlock") {
        Bytes short_salt = random_bytes(8);
        KeyPair kp = pinseal::kdf::derive_keypair("246810", short_salt);
        std::string verifier_b64 = pinseal::verifier::create_verifier(kp);

        ScriptedPinSource source({"246810"});
        SessionKeyManager manager(source, nullptr);

        REQUIRE(manager.get_or_prompt(pinseal::utils::base64_encode(short_salt), verifier_b64) == kp);
        REQUIRE(source.calls == 1);
    }

    SECTION("malformed verifier never caches") {
        ScriptedPinSource source({"246810", "246810", "246810"});
        SessionKeyManager manager(source, nullptr);

        REQUIRE_THROWS_AS(manager.get_or_prompt(rec.salt_b64, "not-valid-base64!!!"),
                          pinseal::MaxAttemptsExceeded);
        REQUIRE_FALSE(manager.has_cached_keypair());
    }
}

TEST_CASE("Session - unlock against server record", "[session]") {
    const ServerRecord& rec = server_record();

    Config meta;
    meta.pin_salt = rec.salt_b64;
    meta.pin_verifier = rec.verifier_b64;
    meta.public_key = rec.kp.public_key_b64();
    meta.pin_prompt = "Encryption PIN: ";

    SECTION("matching public key unlocks") {
        ScriptedPinSource source({"246810"});
        SessionKeyManager manager(source, nullptr);

        KeyPair kp = manager.unlock(meta);
        REQUIRE(kp == rec.kp);
        REQUIRE(source.last_prompt == "Encryption PIN: ");
        REQUIRE(manager.has_cached_keypair());
    }

    SECTION("mismatching public key is a key mismatch") {
        ScriptedPinSource source({"246810"});
        SessionKeyManager manager(source, nullptr);

        meta.public_key = KNOWN_PUBLIC_KEY_B64;
        REQUIRE_THROWS_AS(manager.unlock(meta), pinseal::KeyMismatch);
        REQUIRE_FALSE(manager.has_cached_keypair());
    }
}

TEST_CASE("Session - unlock when encryption is not set up", "[session]") {
    const ServerRecord& rec = server_record();
    ScriptedPinSource source({"246810"});
    SessionKeyManager manager(source, nullptr);

    SECTION("empty metadata") {
        REQUIRE_THROWS_AS(manager.unlock(Config{}), pinseal::EncryptionNotSetUp);
        REQUIRE(source.calls == 0);
        REQUIRE(source.last_prompt.empty());
    }

    SECTION("salt and verifier without a public key") {
        Config meta;
        meta.pin_salt = rec.salt_b64;
        meta.pin_verifier = rec.verifier_b64;
        REQUIRE_THROWS_AS(manager.unlock(meta), pinseal::EncryptionNotSetUp);
        REQUIRE(source.calls == 0);
        REQUIRE_FALSE(manager.has_cached_keypair());
    }
}

TEST_CASE("Session - callbacks may query the manager", "[session]") {
    const ServerRecord& rec = server_record();
    QueryingPinSource source({"111111", "246810"});
    std::vector<bool> notified_cached;
    SessionKeyManager* observed = nullptr;

    SessionKeyManager manager(source, [&](const std::string&) {
        notified_cached.push_back(observed->has_cached_keypair());
    });
    source.manager = &manager;
    observed = &manager;

    KeyPair kp = manager.get_or_prompt(rec.salt_b64, rec.verifier_b64);
    REQUIRE(kp == rec.kp);
    REQUIRE(manager.has_cached_keypair());
    REQUIRE(source.saw_cached == std::vector<bool>{false, false});
    REQUIRE(notified_cached == std::vector<bool>{false});

    // set_prompt from inside the source applies to the next prompt
    manager.clear();
    source.manager = nullptr;
    REQUIRE_THROWS_AS(manager.get_or_prompt(rec.salt_b64, rec.verifier_b64),
                      pinseal::NonInteractiveInput);
    REQUIRE(source.script.last_prompt == "Retry PIN: ");
}

TEST_CASE("Session - independent managers", "[session]") {
    const ServerRecord& rec = server_record();

    ScriptedPinSource source_a({"246810"});
    ScriptedPinSource source_b({"246810"});
    SessionKeyManager a(source_a, nullptr);
    SessionKeyManager b(source_b, nullptr);

    a.get_or_prompt(rec.salt_b64, rec.verifier_b64);
    REQUIRE(a.has_cached_keypair());
    REQUIRE_FALSE(b.has_cached_keypair());

    a.clear();
    b.get_or_prompt(rec.salt_b64, rec.verifier_b64);
    REQUIRE_FALSE(a.has_cached_keypair());
    REQUIRE(b.has_cached_keypair());
}
