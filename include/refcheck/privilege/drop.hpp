#pragma once

#include <refcheck/privilege/credentials.hpp>
#include <refcheck/privilege/payload.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace refcheck {

namespace detail {

/// Fork a worker, drop it to ``creds`` and run ``body`` inside it.
///
/// ``body`` produces an encoded ``Value`` payload; an exception escaping it is encoded as an
/// ``Error`` payload by the worker. The worker never returns into the caller's stack: it sends
/// exactly one payload and ``_exit``s. Returns the raw bytes received from the worker.
///
/// Throws ``InternalFailure`` if the worker cannot be spawned, sends nothing or sends more
/// than ``MAX_PAYLOAD_SIZE`` bytes (the worker is killed then).
ChannelBytes run_in_worker(const Credentials& creds, const std::function<ChannelBytes()>& body);

} // namespace detail

/// Run ``func(args...)`` in a separate process running as ``creds``, and return its result.
///
/// The result type must be on the payload allow-list (see ``PayloadTraits``). Classified errors
/// raised by ``func`` are re-thrown here with the same kind and fields; anything else comes back
/// as ``WorkerError``. A result that fails the restricted decode yields ``InternalFailure``.
///
/// There is no timeout here: ``func`` is expected to bound its own runtime.
template <typename Func, typename... Args>
    requires(std::invocable<Func, Args...> &&
             AllowListedPayload<std::remove_cvref_t<std::invoke_result_t<Func, Args...>>>)
auto run_privileged(const Credentials& creds, Func&& func, Args&&... args) {
    using ResultT = std::remove_cvref_t<std::invoke_result_t<Func, Args...>>;

    ChannelBytes payload = detail::run_in_worker(creds, [&]() -> ChannelBytes {
        return encode_payload(std::invoke(std::forward<Func>(func), std::forward<Args>(args)...));
    });

    return decode_payload<ResultT>(payload);
}

/// The credentials a worker dropped to ``creds`` actually ends up with
ProcessIdentity get_worker_identity(const Credentials& creds);

} // namespace refcheck
