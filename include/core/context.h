#pragma once

#include "core/types.h"
#include "core/roles.h"
#include "core/clock.h"
#include "core/notifications.h"

namespace coursedao {
namespace core {

// Shared collaborators handed to every component by the Organization.
struct EngineContext {
    RoleRegistry& roles;
    const Clock& clock;
    NotificationBus& bus;
    Account owner;
};

}
}
