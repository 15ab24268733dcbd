#pragma once

#include "api/shipx/courier/v1.hpp"

namespace shipx::cli {

// Sandbox example: one standard courier parcel from Kraków to Warszawa.
shipx::courier::v1::ShipmentRequest ExampleShipment();

} // namespace shipx::cli
