#pragma once

#include "shipx/courier/v1/common.pb.h"
#include "shipx/courier/v1/dispatch_order.pb.h"
#include "shipx/courier/v1/shipment.pb.h"
