#include <tasktrack/common/error.hpp>
#include <tasktrack/common/id.hpp>

#include <atomic>
#include <chrono>
#include <keylock/keylock.hpp>
#include <random>
#include <vector>

namespace tasktrack {

    namespace {

        std::atomic<uint64_t> g_sequence{0};

        void appendU64(std::vector<uint8_t> &buffer, uint64_t value) {
            for (int i = 0; i < 8; ++i)
                buffer.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
        }

        bool isLowerHex(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }

    } // namespace

    dp::Result<std::string, dp::Error> generateId() {
        std::vector<uint8_t> seed;
        seed.reserve(48);

        std::random_device rd;
        for (int i = 0; i < 4; ++i) {
            uint64_t hi = rd();
            uint64_t lo = rd();
            appendU64(seed, (hi << 32) | lo);
        }
        appendU64(seed, static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count()));
        appendU64(seed, g_sequence.fetch_add(1, std::memory_order_relaxed));

        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto hash_result = crypto.hash(seed);
        if (!hash_result.success || hash_result.data.size() < 16) {
            return dp::Result<std::string, dp::Error>::err(storage_failed("Failed to derive identifier"));
        }

        std::vector<uint8_t> bytes(hash_result.data.begin(), hash_result.data.begin() + 16);
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40); // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80); // RFC 4122 variant

        std::string hex = keylock::keylock::to_hex(bytes);
        if (hex.size() != 32) {
            return dp::Result<std::string, dp::Error>::err(storage_failed("Failed to encode identifier"));
        }
        for (auto &c : hex) {
            if (c >= 'A' && c <= 'F')
                c = static_cast<char>(c - 'A' + 'a');
        }

        std::string id = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) +
                         "-" + hex.substr(20, 12);
        return dp::Result<std::string, dp::Error>::ok(id);
    }

    bool isWellFormedId(const std::string &id) {
        if (id.size() != 36)
            return false;
        for (size_t i = 0; i < id.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (id[i] != '-')
                    return false;
            } else if (!isLowerHex(id[i])) {
                return false;
            }
        }
        return true;
    }

} // namespace tasktrack
