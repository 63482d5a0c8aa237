#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace blockindex {

    // ===========================================
    // Blockindex-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_NODE_UNAVAILABLE = 100;
    constexpr dp::u32 ERR_NODE_TIMEOUT = 101;
    constexpr dp::u32 ERR_DATA_INTEGRITY = 102;
    constexpr dp::u32 ERR_REORG_TOO_DEEP = 103;
    constexpr dp::u32 ERR_STORAGE_COMMIT = 104;
    constexpr dp::u32 ERR_CURSOR_MISMATCH = 105;
    constexpr dp::u32 ERR_STORE_NOT_OPEN = 106;
    constexpr dp::u32 ERR_SCHEMA = 107;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 108;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 109;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error node_unavailable(const dp::String &msg = "Node unavailable") {
        return dp::Error{ERR_NODE_UNAVAILABLE, msg};
    }

    inline dp::Error node_timeout(const dp::String &msg = "Node call timed out") {
        return dp::Error{ERR_NODE_TIMEOUT, msg};
    }

    inline dp::Error data_integrity(const dp::String &msg = "Data integrity violation") {
        return dp::Error{ERR_DATA_INTEGRITY, msg};
    }

    inline dp::Error reorg_too_deep(const dp::String &msg = "Reorganization exceeds maximum depth") {
        return dp::Error{ERR_REORG_TOO_DEEP, msg};
    }

    inline dp::Error storage_commit(const dp::String &msg = "Storage commit failed") {
        return dp::Error{ERR_STORAGE_COMMIT, msg};
    }

    inline dp::Error cursor_mismatch(const dp::String &msg = "Sync cursor mismatch") {
        return dp::Error{ERR_CURSOR_MISMATCH, msg};
    }

    inline dp::Error store_not_open(const dp::String &msg = "Store not open") {
        return dp::Error{ERR_STORE_NOT_OPEN, msg};
    }

    inline dp::Error schema_error(const dp::String &msg = "Schema initialization failed") {
        return dp::Error{ERR_SCHEMA, msg};
    }

    inline dp::Error serialization_failed(const dp::String &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, msg};
    }

    inline dp::Error deserialization_failed(const dp::String &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, msg};
    }

    // ===========================================
    // Classification
    // ===========================================

    inline bool is_not_found(const dp::Error &err) { return err.code == dp::Error::not_found("").code; }

    /// Errors the follower retries with backoff instead of halting
    inline bool is_transient(const dp::Error &err) {
        return err.code == ERR_NODE_UNAVAILABLE || err.code == ERR_NODE_TIMEOUT || err.code == ERR_STORAGE_COMMIT;
    }

    /// Errors that stop the follower until an operator resumes it
    inline bool is_fatal(const dp::Error &err) {
        return err.code == ERR_DATA_INTEGRITY || err.code == ERR_REORG_TOO_DEEP;
    }

    inline std::string message_of(const dp::Error &err) { return std::string(err.message.c_str()); }

} // namespace blockindex
