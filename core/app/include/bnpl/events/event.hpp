#pragma once

#include "bnpl/events/event_types.hpp"

#include <variant>

namespace bnpl {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by EventBus. A closed std::variant keeps the
// set of mirrored records explicit: adding a record means adding it here and
// the compiler points at every visit site that must handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    LoanCreatedEvent,
    RepaymentEvent,
    DefaultEvent,
    DisputeEvent,
    CreditLimitSetEvent,
    UserUnblockedEvent,
    PoolActivityEvent>;

}  // namespace bnpl
