#pragma once

#include "vigil/agent/v1/sensor_config.pb.h"

#include "vigil/agent/v1/admin_service.pb.h"
#include "vigil/agent/v1/config_service.pb.h"

#include "vigil/agent/v1/admin_service.grpc.pb.h"
#include "vigil/agent/v1/config_service.grpc.pb.h"
