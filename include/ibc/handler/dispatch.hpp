#pragma once

#include <ibc/client/verifier.hpp>
#include <ibc/handler/message.hpp>
#include <ibc/host/context.hpp>
#include <ibc/router/router.hpp>

namespace ibc::handler {

/// Read-only checks of `message` against `store`.
ibc::common::status_t validate(const ibc::host::reader& store,
                               const ibc::router::router& modules,
                               const ibc::client::signature_verifier_t& verifier,
                               const message_t& message);

/// State transition of `message`. Only meaningful after `validate` passed
/// against the same state.
ibc::common::status_t execute(ibc::host::writer& store,
                              ibc::router::router& modules,
                              const message_t& message);

}  // namespace ibc::handler
