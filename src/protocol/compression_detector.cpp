#include "sbus/protocol/compression_detector.h"
#include <algorithm>
#include <cctype>

namespace sbus::v1::protocol {

bool CompressionDetector::has_gzip_signature(const Bytes& payload) {
    return payload.size() >= MIN_INSPECTED_LENGTH &&
           payload[0] == GZIP_MAGIC_0 &&
           payload[1] == GZIP_MAGIC_1;
}

bool CompressionDetector::is_compressed_encoding(const std::string& content_encoding) {
    std::string lowered(content_encoding);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("gzip") != std::string::npos ||
           lowered.find("deflate") != std::string::npos ||
           lowered.find("br") != std::string::npos;
}

Result<void> CompressionDetector::check_payload(const Bytes& payload) {
    total_checks_.fetch_add(1);
    if (!enabled_.load()) {
        return make_result();
    }
    if (has_gzip_signature(payload)) {
        detected_.fetch_add(1);
        return Failure(SBusError::COMPRESSION_DETECTED, "gzip payload");
    }
    return make_result();
}

Result<void> CompressionDetector::check_encoding(const std::optional<std::string>& content_encoding) {
    total_checks_.fetch_add(1);
    if (!enabled_.load() || !content_encoding) {
        return make_result();
    }
    if (is_compressed_encoding(*content_encoding)) {
        detected_.fetch_add(1);
        return Failure(SBusError::COMPRESSION_DETECTED, "content encoding " + *content_encoding);
    }
    return make_result();
}

bool CompressionDetector::is_breach_vulnerable(size_t uncompressed_size, size_t compressed_size) {
    if (uncompressed_size == 0 || compressed_size >= uncompressed_size) {
        return false;
    }
    double ratio = static_cast<double>(uncompressed_size - compressed_size) /
                   static_cast<double>(uncompressed_size);
    return ratio > 0.1;
}

CompressionDetector::CompressionStats CompressionDetector::get_stats() const {
    CompressionStats stats;
    stats.total_checks = total_checks_.load();
    stats.compression_detected = detected_.load();
    return stats;
}

} // namespace sbus::v1::protocol
