#include "server/handshake_controller.hpp"

namespace livegate {

HandshakeController::HandshakeController(upstream::SetupParams params)
    : params_(std::move(params))
{}

std::string HandshakeController::build_setup_message() {
    setup_sent_ = true;
    return upstream::build_setup_message(params_);
}

bool HandshakeController::mark_ready() {
    if (ready_) {
        return false;
    }
    ready_ = true;
    return true;
}

} // namespace livegate
