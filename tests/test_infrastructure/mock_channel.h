#ifndef SBUS_TEST_MOCK_CHANNEL_H
#define SBUS_TEST_MOCK_CHANNEL_H

#include <sbus/transport/channel.h>
#include <sbus/types.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace sbus {
namespace test {

/**
 * Mock Channel for Testing
 *
 * Records every accepted send and can be told to refuse records, either
 * always or for the next N sends.
 */
class MockChannel : public v1::transport::Channel {
public:
    struct SentRecord {
        std::string destination;
        v1::Bytes payload;
        std::string token;
    };

    bool send(const std::string& destination, const v1::Bytes& payload, const std::string& token) override;

    // Error injection
    void refuse_all(bool refuse) { refuse_all_.store(refuse); }
    void refuse_next(uint32_t count) { refuse_next_.store(count); }

    std::vector<SentRecord> sent() const;
    size_t sent_count() const;
    size_t refused_count() const { return refused_.load(); }
    v1::Bytes last_payload() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<SentRecord> sent_;
    std::atomic<bool> refuse_all_{false};
    std::atomic<uint32_t> refuse_next_{0};
    std::atomic<size_t> refused_{0};
};

} // namespace test
} // namespace sbus

#endif // SBUS_TEST_MOCK_CHANNEL_H
