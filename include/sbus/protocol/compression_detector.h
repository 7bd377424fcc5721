#ifndef SBUS_PROTOCOL_COMPRESSION_DETECTOR_H
#define SBUS_PROTOCOL_COMPRESSION_DETECTOR_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <atomic>
#include <optional>
#include <string>

namespace sbus {
namespace v1 {
namespace protocol {

/**
 * Anti-CRIME/BREACH checks.
 *
 * Compressed payloads leak plaintext through ciphertext length, so the
 * bus carries none: payloads that start with the gzip magic bytes and
 * declared content encodings gzip, deflate or br are refused with
 * COMPRESSION_DETECTED.
 */
class SBUS_API CompressionDetector {
public:
    static constexpr uint8_t GZIP_MAGIC_0 = 0x1f;
    static constexpr uint8_t GZIP_MAGIC_1 = 0x8b;
    // Shortest payload inspected for a gzip header
    static constexpr size_t MIN_INSPECTED_LENGTH = 5;

    CompressionDetector() = default;

    CompressionDetector(const CompressionDetector&) = delete;
    CompressionDetector& operator=(const CompressionDetector&) = delete;

    static bool has_gzip_signature(const Bytes& payload);
    static bool is_compressed_encoding(const std::string& content_encoding);

    Result<void> check_payload(const Bytes& payload);

    // nullopt means no declared encoding
    Result<void> check_encoding(const std::optional<std::string>& content_encoding);

    // The only encoding the bus accepts
    static const char* safe_encoding() { return "identity"; }

    // Fraction of bytes saved by compressing; above 10% is exploitable
    static bool is_breach_vulnerable(size_t uncompressed_size, size_t compressed_size);

    void set_enabled(bool enabled) { enabled_.store(enabled); }
    bool is_enabled() const { return enabled_.load(); }

    struct CompressionStats {
        uint64_t total_checks = 0;
        uint64_t compression_detected = 0;
    };
    CompressionStats get_stats() const;

private:
    std::atomic<bool> enabled_{true};
    std::atomic<uint64_t> total_checks_{0};
    std::atomic<uint64_t> detected_{0};
};

} // namespace protocol
} // namespace v1
} // namespace sbus

#endif // SBUS_PROTOCOL_COMPRESSION_DETECTOR_H
