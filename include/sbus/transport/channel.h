#ifndef SBUS_TRANSPORT_CHANNEL_H
#define SBUS_TRANSPORT_CHANNEL_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <string>

namespace sbus {
namespace v1 {
namespace transport {

/**
 * Token-authorized send primitive.
 *
 * Supplied by the embedding environment or by a routing loop. The bus core
 * opens no sockets; record bytes leave through this interface.
 */
class SBUS_API Channel {
public:
    virtual ~Channel() = default;

    /**
     * Hand a record to the transport
     * @param destination Node name of the receiver
     * @param payload Record bytes
     * @param token Authorization token of the sender
     * @return false if the transport did not accept the record
     */
    virtual bool send(const std::string& destination, const Bytes& payload, const std::string& token) = 0;
};

} // namespace transport
} // namespace v1
} // namespace sbus

#endif // SBUS_TRANSPORT_CHANNEL_H
