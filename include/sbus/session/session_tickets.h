#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/crypto/crypto_key.h>

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace session {

/**
 * Decrypted view of a session ticket handed to the caller
 */
struct SessionTicket {
    std::string ticket_id;
    std::vector<uint8_t> session_key;
    std::string client_identity;
    Timestamp created_at{0};
    std::chrono::seconds lifetime{0};
    uint64_t reuse_count = 0;
};

struct SessionTicketStats {
    size_t total_tickets = 0;
    uint64_t created_count = 0;
    uint64_t reused_count = 0;
    uint64_t expired_count = 0;
    uint64_t revoked_count = 0;
};

/**
 * Issues and redeems session tickets.
 *
 * Ticket ids are random hex strings. The session key is stored sealed
 * under the manager's AES-256-GCM ticket key with the ticket id as
 * additional data, so a stored blob cannot be moved to another ticket.
 * Tickets expire at created_at + lifetime.
 */
class SBUS_API SessionTicketManager {
public:
    SessionTicketManager(const TicketConfig& config,
                         crypto::CryptoKey ticket_key,
                         std::shared_ptr<crypto::CryptoProvider> provider,
                         std::shared_ptr<Clock> clock);

    SessionTicketManager(const SessionTicketManager&) = delete;
    SessionTicketManager& operator=(const SessionTicketManager&) = delete;

    Result<std::string> create_ticket(const std::vector<uint8_t>& session_key,
                                      const std::string& client_identity);

    /**
     * Redeems a ticket and counts the reuse.
     *
     * @return TICKET_NOT_FOUND for unknown or expired tickets (expired
     *         tickets are removed), AUTHENTICATION_FAILED when the
     *         ticket is bound and the presented identity does not match
     */
    Result<SessionTicket> reuse_ticket(const std::string& ticket_id,
                                       const std::string& client_identity);

    Result<SessionTicket> get_ticket(const std::string& ticket_id) const;
    bool has_valid_ticket(const std::string& ticket_id) const;
    bool revoke_ticket(const std::string& ticket_id);
    bool update_lifetime(const std::string& ticket_id, std::chrono::seconds lifetime);

    size_t cleanup_expired();
    SessionTicketStats stats() const;
    void clear_all();

private:
    struct StoredTicket {
        std::string ticket_id;
        std::vector<uint8_t> sealed_key;
        std::string client_identity;
        Timestamp created_at{0};
        std::chrono::seconds lifetime{0};
        uint64_t reuse_count = 0;

        bool is_valid(Timestamp now) const {
            return now < created_at + std::chrono::duration_cast<Timestamp>(lifetime);
        }
    };

    Result<SessionTicket> open_ticket(const StoredTicket& stored) const;
    void evict_oldest_locked();

    TicketConfig config_;
    crypto::CryptoKey ticket_key_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, StoredTicket> tickets_;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> reused_{0};
    mutable std::atomic<uint64_t> expired_{0};
    std::atomic<uint64_t> revoked_{0};
};

} // namespace session
} // namespace v1
} // namespace sbus
