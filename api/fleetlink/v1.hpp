#pragma once

#include "fleetlink/v1/fleet_service.pb.h"
#include "fleetlink/v1/vda5050.pb.h"

namespace fleetlink::v1 {
}
