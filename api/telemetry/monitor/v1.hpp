#pragma once

#include "telemetry/monitor/v1/types.pb.h"

#include "telemetry/monitor/services/v1/broker_service.pb.h"
#include "telemetry/monitor/services/v1/monitor_service.pb.h"

#include "telemetry/monitor/services/v1/broker_service.grpc.pb.h"
#include "telemetry/monitor/services/v1/monitor_service.grpc.pb.h"

namespace telemetry::monitor::v1 {
using namespace ::telemetry::monitor::services::v1;
}
