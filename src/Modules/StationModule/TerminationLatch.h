#pragma once
/**
 * @file TerminationLatch.h
 * @brief Pending stop/restart request shared by the console and `c/system`.
 */
#include <atomic>
#include <stddef.h>
#include <stdint.h>

/** @brief Termination requested from the console or over `c/system`. */
enum class TerminationRequest : uint8_t { None, Stop, Restart };

/**
 * @brief Latches the strongest termination request seen so far.
 *
 * None -> Stop -> Restart only moves forward: a restart may follow a stop,
 * a repeated or late stop never downgrades a pending restart.
 */
class TerminationLatch {
public:
    /** @return true when `req` changed the pending request. */
    bool request(TerminationRequest req);
    TerminationRequest pending() const { return pending_.load(); }

    /** @brief Parse a `c/system` payload. Case and surrounding blanks are ignored. */
    static TerminationRequest parse(const char* payload, size_t len);

private:
    std::atomic<TerminationRequest> pending_{TerminationRequest::None};
};
