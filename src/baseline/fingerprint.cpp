#include "baseline/fingerprint.hpp"

namespace docsguard::baseline {

namespace {

constexpr uint32_t SALT = 0x9E3779B9u; // golden ratio

auto to_hex(uint64_t value) -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = HEX[value & 0xF];
        value >>= 4;
    }
    return out;
}

} // namespace

auto fingerprint_payload(const model::ValidationResult& result) -> std::string {
    std::string payload;
    payload += model::kind_name(result.kind);
    payload += '|';
    payload += model::portable_path(result.location.file);
    payload += '|';
    payload += result.entity_name;
    payload += '|';
    payload += result.doc_id.value_or("");
    payload += '|';
    payload += result.subject;
    payload += '|';
    payload += result.code_type.value_or("");
    payload += '|';
    payload += result.doc_type.value_or("");
    return payload;
}

auto fingerprint_text(const std::string& text) -> std::string {
    size_t len = text.size();
    size_t half = len / 2;

    uint32_t crc_high = crc32c(text.data(), half);
    uint32_t crc_low = crc32c(text.data() + half, len - half);
    uint32_t mix = crc_low ^ SALT ^ static_cast<uint32_t>(len);

    return to_hex((static_cast<uint64_t>(crc_high) << 32) | static_cast<uint64_t>(mix));
}

auto fingerprint(const model::ValidationResult& result) -> std::string {
    return fingerprint_text(fingerprint_payload(result));
}

} // namespace docsguard::baseline
