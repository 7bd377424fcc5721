#ifndef SBUS_CONTROL_CONTROL_MESSAGE_H
#define SBUS_CONTROL_CONTROL_MESSAGE_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace control {

// Bootstrap and provisioning messages exchanged as ASCII text
enum class MessageTag : uint8_t {
    BOOT_REQ,
    BUNDLE_REQ,
    BUNDLE,
    BUILD_SIGN_REQ
};

SBUS_API std::string to_string(MessageTag tag);
SBUS_API std::optional<MessageTag> tag_from_string(const std::string& text);

enum class FieldType : uint8_t {
    STRING,
    U64,
    HEX
};

/**
 * One required field of a message type.
 *
 * HEX fields carry hex_bytes bytes exactly, or at least hex_bytes when
 * hex_minimum is set. A non-null expected value pins the field to it.
 */
struct FieldSpec {
    const char* name;
    FieldType type;
    size_t hex_bytes;
    bool hex_minimum;
    const char* expected;
};

struct MessageSchema {
    MessageTag tag;
    // Declared order; this is also the canonical order. Excludes sig.
    std::vector<FieldSpec> fields;

    const FieldSpec* find(const std::string& name) const;
};

SBUS_API const MessageSchema& schema_for(MessageTag tag);

constexpr const char* SIGNATURE_FIELD = "sig";
constexpr size_t SIGNATURE_BYTES = 32;

/**
 * Parsed control message: `TAG;key=value;...;sig=<hex>`.
 *
 * Parsing is strict. Unknown tags, unknown fields, duplicate keys, missing
 * fields, empty values, whitespace, malformed integers and bad hex are
 * all hard errors. Hex values are stored in lower case.
 */
class SBUS_API ControlMessage {
public:
    /**
     * Parse wire text
     * @return UNKNOWN_MESSAGE_TAG, MALFORMED_FIELD, DUPLICATE_FIELD,
     *         UNKNOWN_FIELD, MISSING_FIELD, INVALID_INTEGER or INVALID_HEX
     */
    static Result<ControlMessage> parse(const std::string& text);

    // Builds an unsigned message; fields are checked as in parse()
    static Result<ControlMessage> create(MessageTag tag, const std::map<std::string, std::string>& fields);

    MessageTag tag() const { return tag_; }

    bool has(const std::string& key) const;
    Result<std::string> get(const std::string& key) const;
    Result<uint64_t> get_u64(const std::string& key) const;
    Result<Bytes> get_hex(const std::string& key) const;

    // The "module" field, or "component" for build signing requests
    std::optional<std::string> module() const;

    const std::optional<std::string>& signature() const { return signature_; }
    void set_signature(std::string hex_signature);
    void clear_signature() { signature_.reset(); }

    // Tag and fields in declared order, ';'-joined, without sig
    std::string canonical_form() const;

    // Canonical form plus ";sig=..." when signed
    std::string serialize() const;

private:
    ControlMessage(MessageTag tag, std::map<std::string, std::string> fields,
                   std::optional<std::string> signature);

    static Result<std::string> check_value(const FieldSpec& spec, const std::string& value);

    MessageTag tag_;
    std::map<std::string, std::string> fields_;
    std::optional<std::string> signature_;
};

} // namespace control
} // namespace v1
} // namespace sbus

#endif // SBUS_CONTROL_CONTROL_MESSAGE_H
