#pragma once

#include <refcheck/exceptions.hpp>
#include <refcheck/privilege/credentials.hpp>
#include <refcheck/process/command.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace refcheck {

/// Raw bytes exchanged over the worker channel
using ChannelBytes = std::vector<std::uint8_t>;

/// Largest payload a worker may send. Anything bigger is never decoded.
inline constexpr std::size_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

/// Deepest nesting of any allow-listed payload: envelope, fields, then a list field
inline constexpr std::size_t MAX_PAYLOAD_DEPTH = 3;

/// Allow-list of the value shapes a worker may send back.
/// Only types with a specialization here can be returned from ``run_privileged``.
template <typename T>
struct PayloadTraits;

template <>
struct PayloadTraits<CommandResult>
{
    static constexpr std::string_view TYPE_NAME = "CommandResult";
};

template <>
struct PayloadTraits<ProcessIdentity>
{
    static constexpr std::string_view TYPE_NAME = "ProcessIdentity";
};

template <typename T>
concept AllowListedPayload = requires {
    { PayloadTraits<T>::TYPE_NAME } -> std::convertible_to<std::string_view>;
};

/// Encodes a ``Value`` payload.
///
/// Wire format: a CBOR map ``{"tag": "value", "type": <TYPE_NAME>, "fields": {...}}``.
/// Byte strings (captured output) are sent as CBOR byte strings, never as text.
ChannelBytes encode_payload(const CommandResult& value);
ChannelBytes encode_payload(const ProcessIdentity& value);

/// Encodes an ``Error`` payload: ``{"tag": "error", "kind": <ErrorKind>, "fields": {...}}``.
/// The fields carried depend on the kind (command and timeout for Timeout, and so on).
ChannelBytes encode_error_payload(const ClassifiedError& error);

/// Encodes an ``Error`` payload of a kind that has only a message
ChannelBytes encode_error_payload(ErrorKind kind, std::string_view message);

/// The restricted decoder.
///
/// Accepts exactly one well-formed payload: a ``Value`` whose type is ``T`` is reconstructed
/// and returned; an ``Error`` of an allow-listed kind is reconstructed and thrown as the
/// matching exception. Anything else (malformed CBOR, trailing bytes, payloads over
/// ``MAX_PAYLOAD_SIZE`` or nested deeper than ``MAX_PAYLOAD_DEPTH``, unknown tags, types or
/// kinds, missing, extra or mistyped fields) is logged at critical level and thrown as
/// ``InternalFailure``; none of it is ever turned into an object.
template <AllowListedPayload T>
T decode_payload(std::span<const std::uint8_t> bytes);

template <>
CommandResult decode_payload<CommandResult>(std::span<const std::uint8_t> bytes);

template <>
ProcessIdentity decode_payload<ProcessIdentity>(std::span<const std::uint8_t> bytes);

} // namespace refcheck
