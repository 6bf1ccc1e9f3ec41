#pragma once

#include "common/live_protocol.hpp"
#include <string>

namespace livegate {

/**
 * HandshakeController - setup message and the readiness gate
 *
 * The setup message goes out once, right after the upstream connects.
 * Readiness flips false -> true on the first setupComplete and never back.
 */
class HandshakeController {
public:
    explicit HandshakeController(upstream::SetupParams params);

    // Serialized setup message; marks the setup as sent
    std::string build_setup_message();

    /**
     * Record a setupComplete acknowledgement.
     * @return true only for the call that made the session ready
     */
    bool mark_ready();

    bool setup_sent() const { return setup_sent_; }
    bool is_ready() const { return ready_; }

private:
    upstream::SetupParams params_;
    bool setup_sent_{false};
    bool ready_{false};
};

} // namespace livegate
