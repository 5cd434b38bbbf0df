//! # Finding Fingerprints
//!
//! Stable identities for findings, used to match a run against the
//! baseline snapshot.
//!
//! ## Payload
//!
//! ```text
//! kind|file|entity|doc_id|subject|code_type|doc_type
//! ```
//!
//! The file uses forward slashes. Line numbers and message wording are not
//! part of the payload, so moving a function or rewording a hint keeps its
//! fingerprint.
//!
//! ## Digest
//!
//! 64 bits rendered as 16 lowercase hex digits: the CRC32C (Castagnoli) of
//! the first half of the payload in the high word, the CRC32C of the second
//! half mixed with the length in the low word.

#ifndef DOCSGUARD_BASELINE_FINGERPRINT_HPP
#define DOCSGUARD_BASELINE_FINGERPRINT_HPP

#include "model/entity.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace docsguard::baseline {

namespace detail {

/// Reflected Castagnoli polynomial.
constexpr uint32_t CRC32C_POLY = 0x82F63B78u;

constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1u) ? (crc >> 1) ^ CRC32C_POLY : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

} // namespace detail

/// CRC32C of a byte range.
[[nodiscard]] inline auto crc32c(const void* data, size_t len) noexcept -> uint32_t {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

/// The canonical payload hashed by `fingerprint`.
[[nodiscard]] auto fingerprint_payload(const model::ValidationResult& result) -> std::string;

/// 16-hex-digit fingerprint of a finding.
[[nodiscard]] auto fingerprint(const model::ValidationResult& result) -> std::string;

/// 16-hex-digit digest of arbitrary text.
[[nodiscard]] auto fingerprint_text(const std::string& text) -> std::string;

} // namespace docsguard::baseline

#endif // DOCSGUARD_BASELINE_FINGERPRINT_HPP
