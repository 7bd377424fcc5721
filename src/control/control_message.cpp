#include <sbus/control/control_message.h>
#include <sbus/crypto/crypto_utils.h>

#include <cctype>
#include <limits>

namespace sbus {
namespace v1 {
namespace control {

namespace {

const char* const TAG_NAMES[] = {"BOOT_REQ", "BUNDLE_REQ", "BUNDLE", "BUILD_SIGN_REQ"};

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = text.find(separator, start);
        if (end == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

bool has_whitespace(const std::string& text) {
    for (unsigned char c : text) {
        if (std::isspace(c) || !std::isprint(c)) {
            return true;
        }
    }
    return false;
}

Result<uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        return make_error<uint64_t>(SBusError::INVALID_INTEGER, "integer out of range");
    }
    if (text.size() > 1 && text[0] == '0') {
        return make_error<uint64_t>(SBusError::INVALID_INTEGER, "leading zero in " + text);
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return make_error<uint64_t>(SBusError::INVALID_INTEGER, "not a decimal integer: " + text);
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return make_error<uint64_t>(SBusError::INVALID_INTEGER, "integer overflows 64 bits");
        }
        value = value * 10 + digit;
    }
    return value;
}

const FieldSpec SIGNATURE_SPEC = {SIGNATURE_FIELD, FieldType::HEX, SIGNATURE_BYTES, false, nullptr};

} // namespace

std::string to_string(MessageTag tag) {
    return TAG_NAMES[static_cast<size_t>(tag)];
}

std::optional<MessageTag> tag_from_string(const std::string& text) {
    for (size_t i = 0; i < sizeof(TAG_NAMES) / sizeof(TAG_NAMES[0]); ++i) {
        if (text == TAG_NAMES[i]) {
            return static_cast<MessageTag>(i);
        }
    }
    return std::nullopt;
}

const FieldSpec* MessageSchema::find(const std::string& name) const {
    for (const auto& field : fields) {
        if (name == field.name) {
            return &field;
        }
    }
    return nullptr;
}

const MessageSchema& schema_for(MessageTag tag) {
    static const MessageSchema boot_req{MessageTag::BOOT_REQ, {
        {"v", FieldType::U64, 0, false, "1"},
        {"op", FieldType::STRING, 0, false, "BOOT"},
        {"mode", FieldType::STRING, 0, false, "run"},
        {"first_run", FieldType::U64, 0, false, "1"},
        {"module", FieldType::STRING, 0, false, nullptr},
        {"nonce", FieldType::HEX, 8, false, nullptr},
    }};
    static const MessageSchema bundle_req{MessageTag::BUNDLE_REQ, {
        {"v", FieldType::U64, 0, false, "1"},
        {"module", FieldType::STRING, 0, false, nullptr},
        {"nonce", FieldType::HEX, 8, false, nullptr},
    }};
    static const MessageSchema bundle{MessageTag::BUNDLE, {
        {"v", FieldType::U64, 0, false, "1"},
        {"module", FieldType::STRING, 0, false, nullptr},
        {"bundle_id", FieldType::HEX, 16, false, nullptr},
        {"expires", FieldType::U64, 0, false, nullptr},
        {"key", FieldType::HEX, 16, true, nullptr},
        {"nonce", FieldType::HEX, 8, false, nullptr},
    }};
    static const MessageSchema build_sign_req{MessageTag::BUILD_SIGN_REQ, {
        {"v", FieldType::U64, 0, false, "1"},
        {"op", FieldType::STRING, 0, false, "SIGN"},
        {"mode", FieldType::STRING, 0, false, "run"},
        {"first_run", FieldType::U64, 0, false, "1"},
        {"component", FieldType::STRING, 0, false, nullptr},
        {"id", FieldType::HEX, 8, false, nullptr},
        {"nonce", FieldType::HEX, 8, false, nullptr},
    }};

    switch (tag) {
        case MessageTag::BOOT_REQ: return boot_req;
        case MessageTag::BUNDLE_REQ: return bundle_req;
        case MessageTag::BUNDLE: return bundle;
        case MessageTag::BUILD_SIGN_REQ: return build_sign_req;
    }
    return boot_req;
}

ControlMessage::ControlMessage(MessageTag tag, std::map<std::string, std::string> fields,
                               std::optional<std::string> signature)
    : tag_(tag)
    , fields_(std::move(fields))
    , signature_(std::move(signature)) {}

Result<std::string> ControlMessage::check_value(const FieldSpec& spec, const std::string& value) {
    if (value.empty()) {
        return make_error<std::string>(SBusError::MALFORMED_FIELD, std::string("empty value for ") + spec.name);
    }

    std::string normalized = value;
    switch (spec.type) {
        case FieldType::STRING:
            break;

        case FieldType::U64: {
            auto parsed = parse_u64(value);
            if (!parsed) {
                return make_error<std::string>(SBusError::INVALID_INTEGER,
                                               std::string(spec.name) + ": " + parsed.error_detail());
            }
            break;
        }

        case FieldType::HEX: {
            auto bytes = crypto::utils::from_hex(value);
            if (!bytes) {
                return make_error<std::string>(SBusError::INVALID_HEX, std::string(spec.name) + " is not hex");
            }
            const bool length_ok = spec.hex_minimum ? bytes->size() >= spec.hex_bytes
                                                    : bytes->size() == spec.hex_bytes;
            if (!length_ok) {
                return make_error<std::string>(SBusError::INVALID_HEX,
                                               std::string(spec.name) + " has " + std::to_string(bytes->size()) +
                                               " bytes");
            }
            normalized = crypto::utils::to_hex(*bytes);
            break;
        }
    }

    if (spec.expected != nullptr && normalized != spec.expected) {
        return make_error<std::string>(SBusError::MALFORMED_FIELD,
                                       std::string(spec.name) + " must be " + spec.expected);
    }
    return normalized;
}

Result<ControlMessage> ControlMessage::parse(const std::string& text) {
    if (text.empty()) {
        return make_error<ControlMessage>(SBusError::INVALID_MESSAGE_FORMAT, "empty control message");
    }
    if (has_whitespace(text)) {
        return make_error<ControlMessage>(SBusError::MALFORMED_FIELD, "whitespace in control message");
    }

    auto parts = split(text, ';');
    auto tag = tag_from_string(parts.front());
    if (!tag) {
        return make_error<ControlMessage>(SBusError::UNKNOWN_MESSAGE_TAG, "unknown tag " + parts.front());
    }
    const MessageSchema& schema = schema_for(*tag);

    std::map<std::string, std::string> fields;
    std::optional<std::string> signature;

    for (size_t i = 1; i < parts.size(); ++i) {
        const std::string& part = parts[i];
        const size_t eq = part.find('=');
        if (eq == std::string::npos || eq == 0) {
            return make_error<ControlMessage>(SBusError::MALFORMED_FIELD, "field without key=value form");
        }
        const std::string key = part.substr(0, eq);
        const std::string value = part.substr(eq + 1);

        if (key == SIGNATURE_FIELD) {
            if (signature) {
                return make_error<ControlMessage>(SBusError::DUPLICATE_FIELD, "duplicate sig");
            }
            signature = SBUS_TRY(check_value(SIGNATURE_SPEC, value));
            continue;
        }

        const FieldSpec* spec = schema.find(key);
        if (spec == nullptr) {
            return make_error<ControlMessage>(SBusError::UNKNOWN_FIELD,
                                              "field " + key + " not allowed in " + parts.front());
        }
        if (fields.count(key) != 0) {
            return make_error<ControlMessage>(SBusError::DUPLICATE_FIELD, "duplicate " + key);
        }
        fields[key] = SBUS_TRY(check_value(*spec, value));
    }

    for (const auto& spec : schema.fields) {
        if (fields.count(spec.name) == 0) {
            return make_error<ControlMessage>(SBusError::MISSING_FIELD, std::string("missing ") + spec.name);
        }
    }
    if (!signature) {
        return make_error<ControlMessage>(SBusError::MISSING_FIELD, "missing sig");
    }

    return ControlMessage(*tag, std::move(fields), std::move(signature));
}

Result<ControlMessage> ControlMessage::create(MessageTag tag, const std::map<std::string, std::string>& fields) {
    const MessageSchema& schema = schema_for(tag);
    std::map<std::string, std::string> checked;

    for (const auto& entry : fields) {
        const FieldSpec* spec = schema.find(entry.first);
        if (spec == nullptr) {
            return make_error<ControlMessage>(SBusError::UNKNOWN_FIELD,
                                              "field " + entry.first + " not allowed in " + to_string(tag));
        }
        if (has_whitespace(entry.second) || entry.second.find(';') != std::string::npos) {
            return make_error<ControlMessage>(SBusError::MALFORMED_FIELD, "bad characters in " + entry.first);
        }
        checked[entry.first] = SBUS_TRY(check_value(*spec, entry.second));
    }
    for (const auto& spec : schema.fields) {
        if (checked.count(spec.name) == 0) {
            return make_error<ControlMessage>(SBusError::MISSING_FIELD, std::string("missing ") + spec.name);
        }
    }
    return ControlMessage(tag, std::move(checked), std::nullopt);
}

bool ControlMessage::has(const std::string& key) const {
    return fields_.count(key) != 0;
}

Result<std::string> ControlMessage::get(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) {
        return make_error<std::string>(SBusError::MISSING_FIELD, "no field " + key);
    }
    return it->second;
}

Result<uint64_t> ControlMessage::get_u64(const std::string& key) const {
    auto value = SBUS_TRY(get(key));
    return parse_u64(value);
}

Result<Bytes> ControlMessage::get_hex(const std::string& key) const {
    auto value = SBUS_TRY(get(key));
    return crypto::utils::from_hex(value);
}

std::optional<std::string> ControlMessage::module() const {
    auto it = fields_.find(tag_ == MessageTag::BUILD_SIGN_REQ ? "component" : "module");
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ControlMessage::set_signature(std::string hex_signature) {
    signature_ = std::move(hex_signature);
}

std::string ControlMessage::canonical_form() const {
    std::string out = to_string(tag_);
    for (const auto& spec : schema_for(tag_).fields) {
        auto it = fields_.find(spec.name);
        if (it == fields_.end()) {
            continue;
        }
        out += ';';
        out += spec.name;
        out += '=';
        out += it->second;
    }
    return out;
}

std::string ControlMessage::serialize() const {
    std::string out = canonical_form();
    if (signature_) {
        out += ";";
        out += SIGNATURE_FIELD;
        out += "=";
        out += *signature_;
    }
    return out;
}

} // namespace control
} // namespace v1
} // namespace sbus
