#include <refcheck/privilege/payload.hpp>

#include <refcheck/common/error_types.hpp>
#include <refcheck/exceptions.hpp>
#include <refcheck/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace refcheck {

using nlohmann::json;

namespace {

constexpr std::string_view TAG_VALUE = "value";
constexpr std::string_view TAG_ERROR = "error";

[[noreturn]] void reject(std::string_view reason) {
    LOG_FATAL("Rejected result from privilege-dropped worker: {}", reason);
    throw InternalFailure(fmt::format("[!] Rejected result from privilege-dropped worker: {}", reason));
}

/// Walks a CBOR item without building it, and stops once nesting exceeds ``max_depth``.
/// The DOM parser recurses once per level with no limit of its own.
class DepthLimitedSax
{
public:
    explicit DepthLimitedSax(std::size_t max_depth)
        : max_depth_{max_depth} {}

    bool null() { return true; }

    bool boolean(bool /*val*/) { return true; }

    bool number_integer(json::number_integer_t /*val*/) { return true; }

    bool number_unsigned(json::number_unsigned_t /*val*/) { return true; }

    bool number_float(json::number_float_t /*val*/, const json::string_t& /*str*/) { return true; }

    bool string(json::string_t& /*val*/) { return true; }

    bool binary(json::binary_t& /*val*/) { return true; }

    bool start_object(std::size_t /*elements*/) { return enter(); }

    bool key(json::string_t& /*val*/) { return true; }

    bool end_object() { return leave(); }

    bool start_array(std::size_t /*elements*/) { return enter(); }

    bool end_array() { return leave(); }

    bool parse_error(std::size_t /*position*/, const std::string& /*last_token*/, const json::exception& /*ex*/) {
        return false;
    }

    bool exceeded_depth() const { return exceeded_depth_; }

private:
    bool enter() {
        if (++depth_ > max_depth_) {
            exceeded_depth_ = true;
            return false;
        }
        return true;
    }

    bool leave() {
        --depth_;
        return true;
    }

    std::size_t max_depth_;
    std::size_t depth_{};
    bool exceeded_depth_{};
};

json to_binary(std::string_view bytes) {
    return json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

} // namespace

void to_json(json& out, const CommandResult& value) {
    out = json{{"exit_code", value.exit_code},
               {"stdout", to_binary(value.stdout_bytes)},
               {"stderr", to_binary(value.stderr_bytes)}};
}

void to_json(json& out, const ProcessIdentity& value) {
    out = json{{"ruid", value.ruid}, {"euid", value.euid}, {"suid", value.suid},     {"rgid", value.rgid},
               {"egid", value.egid}, {"sgid", value.sgid}, {"groups", value.groups}};
}

namespace {

/// Kinds whose only field is the message
bool is_message_only(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Harness:
    case ErrorKind::Validation:
    case ErrorKind::Configuration:
    case ErrorKind::Internal:
    case ErrorKind::Unexpected:
        return true;
    case ErrorKind::Timeout:
    case ErrorKind::ExecutionFailure:
    case ErrorKind::WrongOutput:
    case ErrorKind::Interrupted:
        return false;
    }

    return false;
}

ChannelBytes make_error(ErrorKind kind, json fields) {
    return json::to_cbor(json{
        {"tag", std::string{TAG_ERROR}}, {"kind", std::string{to_string(kind)}}, {"fields", std::move(fields)}});
}

template <AllowListedPayload T>
ChannelBytes make_value(const T& value) {
    return json::to_cbor(
        json{{"tag", std::string{TAG_VALUE}}, {"type", std::string{PayloadTraits<T>::TYPE_NAME}}, {"fields", value}});
}

/// Rejects ``obj`` unless it is a map with exactly ``keys``
void expect_keys(const json& obj, std::initializer_list<const char*> keys, std::string_view what) {
    if (!obj.is_object()) {
        reject(fmt::format("{} is not a map", what));
    }

    for (const char* key : keys) {
        if (!obj.contains(key)) {
            reject(fmt::format("{} is missing field {:?}", what, key));
        }
    }

    if (obj.size() != keys.size()) {
        reject(fmt::format("{} has {} fields, expected {}", what, obj.size(), keys.size()));
    }
}

std::string get_text(const json& fields, const char* key) {
    const json& field = fields.at(key);

    if (!field.is_string()) {
        reject(fmt::format("field {:?} is not a text string", key));
    }

    return field.get<std::string>();
}

std::string get_bytes(const json& fields, const char* key) {
    const json& field = fields.at(key);

    if (!field.is_binary()) {
        reject(fmt::format("field {:?} is not a byte string", key));
    }

    const auto& bytes = field.get_binary();
    return {bytes.begin(), bytes.end()};
}

template <std::integral I>
I to_integer(const json& field, std::string_view what) {
    if (field.is_number_unsigned()) {
        auto value = field.get<std::uint64_t>();
        if (std::in_range<I>(value)) {
            return static_cast<I>(value);
        }
    } else if (field.is_number_integer()) {
        auto value = field.get<std::int64_t>();
        if (std::in_range<I>(value)) {
            return static_cast<I>(value);
        }
    } else {
        reject(fmt::format("{} is not an integer", what));
    }

    reject(fmt::format("{} is out of range", what));
}

template <std::integral I>
I get_integer(const json& fields, const char* key) {
    return to_integer<I>(fields.at(key), fmt::format("field {:?}", key));
}

[[noreturn]] void throw_carried_error(const json& payload) {
    expect_keys(payload, {"tag", "kind", "fields"}, "error payload");

    std::string kind_name = get_text(payload, "kind");
    auto kind = error_kind_from_string(kind_name);

    if (!kind) {
        reject(fmt::format("unknown error kind {:?}", kind_name));
    }

    const json& fields = payload.at("fields");

    if (is_message_only(*kind)) {
        expect_keys(fields, {"message"}, "error fields");
    }

    switch (*kind) {
    case ErrorKind::Timeout:
        expect_keys(fields, {"command", "timeout"}, "error fields");
        throw TimeoutError(get_text(fields, "command"),
                           std::chrono::seconds{get_integer<std::chrono::seconds::rep>(fields, "timeout")});
    case ErrorKind::ExecutionFailure:
        expect_keys(fields, {"command", "exit_code", "stdout", "stderr"}, "error fields");
        throw ExecutionError(get_text(fields, "command"), get_integer<int>(fields, "exit_code"),
                             get_bytes(fields, "stdout"), get_bytes(fields, "stderr"));
    case ErrorKind::WrongOutput:
        expect_keys(fields, {"output"}, "error fields");
        throw WrongOutputError(get_bytes(fields, "output"));
    case ErrorKind::Interrupted:
        expect_keys(fields, {}, "error fields");
        throw UserInterrupt{};
    case ErrorKind::Harness:
        throw HarnessError(get_text(fields, "message"));
    case ErrorKind::Validation:
        throw ValidationError(get_text(fields, "message"));
    case ErrorKind::Configuration:
        throw ConfigurationError(get_text(fields, "message"));
    case ErrorKind::Internal: {
        std::string message = get_text(fields, "message");
        LOG_FATAL("Privilege-dropped worker reported an internal failure: {}", message);
        throw InternalFailure(message);
    }
    case ErrorKind::Unexpected:
        throw WorkerError(get_text(fields, "message"));
    }

    UNREACHABLE("Unhandled error kind", to_string(*kind));
}

/// Validates the envelope. Throws the carried error for ``Error`` payloads;
/// returns the fields of a ``Value`` payload of type ``type_name``.
json open_envelope(std::span<const std::uint8_t> bytes, std::string_view type_name) {
    if (bytes.size() > MAX_PAYLOAD_SIZE) {
        reject(fmt::format("{} bytes exceed the limit of {}", bytes.size(), MAX_PAYLOAD_SIZE));
    }

    // strict: trailing bytes after the first item are an error
    DepthLimitedSax shape_check{MAX_PAYLOAD_DEPTH};
    if (!json::sax_parse(bytes.begin(), bytes.end(), &shape_check, json::input_format_t::cbor, /*strict=*/true)) {
        if (shape_check.exceeded_depth()) {
            reject(fmt::format("nested deeper than {} levels", MAX_PAYLOAD_DEPTH));
        }
        reject("not a single well-formed CBOR item");
    }

    json payload = json::from_cbor(bytes.begin(), bytes.end(), /*strict=*/true, /*allow_exceptions=*/false);

    if (payload.is_discarded()) {
        reject("not a single well-formed CBOR item");
    }

    if (!payload.is_object() || !payload.contains("tag")) {
        reject("not a tagged map");
    }

    std::string tag = get_text(payload, "tag");

    if (tag == TAG_ERROR) {
        throw_carried_error(payload);
    }

    if (tag != TAG_VALUE) {
        reject(fmt::format("unknown tag {:?}", tag));
    }

    expect_keys(payload, {"tag", "type", "fields"}, "value payload");

    if (std::string type = get_text(payload, "type"); type != type_name) {
        reject(fmt::format("unexpected value type {:?} (expected {:?})", type, type_name));
    }

    return payload.at("fields");
}

} // namespace

ChannelBytes encode_payload(const CommandResult& value) {
    return make_value(value);
}

ChannelBytes encode_payload(const ProcessIdentity& value) {
    return make_value(value);
}

ChannelBytes encode_error_payload(const ClassifiedError& error) {
    if (const auto* timeout = dynamic_cast<const TimeoutError*>(&error)) {
        return make_error(ErrorKind::Timeout,
                          {{"command", timeout->get_command()}, {"timeout", timeout->get_timeout().count()}});
    }

    if (const auto* failure = dynamic_cast<const ExecutionError*>(&error)) {
        return make_error(ErrorKind::ExecutionFailure, {{"command", failure->get_command()},
                                                        {"exit_code", failure->get_exit_code()},
                                                        {"stdout", to_binary(failure->get_stdout())},
                                                        {"stderr", to_binary(failure->get_stderr())}});
    }

    if (const auto* wrong_output = dynamic_cast<const WrongOutputError*>(&error)) {
        return make_error(ErrorKind::WrongOutput, {{"output", to_binary(wrong_output->get_output())}});
    }

    if (dynamic_cast<const UserInterrupt*>(&error) != nullptr) {
        return make_error(ErrorKind::Interrupted, json::object());
    }

    return encode_error_payload(error.get_kind(), error.what());
}

ChannelBytes encode_error_payload(ErrorKind kind, std::string_view message) {
    // Structured kinds can't be expressed with a message alone
    if (!is_message_only(kind)) {
        kind = ErrorKind::Harness;
    }

    return make_error(kind, {{"message", std::string{message}}});
}

template <>
CommandResult decode_payload<CommandResult>(std::span<const std::uint8_t> bytes) {
    json fields = open_envelope(bytes, PayloadTraits<CommandResult>::TYPE_NAME);

    expect_keys(fields, {"exit_code", "stdout", "stderr"}, "CommandResult");

    return {.exit_code = get_integer<int>(fields, "exit_code"),
            .stdout_bytes = get_bytes(fields, "stdout"),
            .stderr_bytes = get_bytes(fields, "stderr")};
}

template <>
ProcessIdentity decode_payload<ProcessIdentity>(std::span<const std::uint8_t> bytes) {
    json fields = open_envelope(bytes, PayloadTraits<ProcessIdentity>::TYPE_NAME);

    expect_keys(fields, {"ruid", "euid", "suid", "rgid", "egid", "sgid", "groups"}, "ProcessIdentity");

    const json& groups_field = fields.at("groups");

    if (!groups_field.is_array()) {
        reject("field \"groups\" is not an array");
    }

    std::vector<gid_t> groups;
    for (const json& group : groups_field) {
        groups.push_back(to_integer<gid_t>(group, "supplementary group"));
    }

    return {.ruid = get_integer<uid_t>(fields, "ruid"),
            .euid = get_integer<uid_t>(fields, "euid"),
            .suid = get_integer<uid_t>(fields, "suid"),
            .rgid = get_integer<gid_t>(fields, "rgid"),
            .egid = get_integer<gid_t>(fields, "egid"),
            .sgid = get_integer<gid_t>(fields, "sgid"),
            .groups = std::move(groups)};
}

} // namespace refcheck
