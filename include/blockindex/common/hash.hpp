#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace blockindex {

    inline dp::i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// SHA256 of raw bytes, empty on failure
    inline std::vector<uint8_t> computeSHA256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success) {
            return {};
        }
        return result.data;
    }

    inline std::string hashToHex(const std::vector<uint8_t> &hash) { return keylock::keylock::to_hex(hash); }

    inline std::vector<uint8_t> hexToHash(const std::string &hex) { return keylock::keylock::from_hex(hex); }

    /// Hex SHA256 of a string, as used for block and transaction ids
    inline dp::Result<std::string, dp::Error> sha256Hex(const std::string &data) {
        std::vector<uint8_t> bytes(data.begin(), data.end());
        auto digest = computeSHA256(bytes);
        if (digest.empty()) {
            return dp::Result<std::string, dp::Error>::err(dp::Error::io_error("SHA256 hashing failed"));
        }
        return dp::Result<std::string, dp::Error>::ok(hashToHex(digest));
    }

} // namespace blockindex
