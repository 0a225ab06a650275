#pragma once

#include "shopfloor/scheduler/v1/types.pb.h"
#include "shopfloor/scheduler/v1/scheduling_service.pb.h"
#include "shopfloor/scheduler/v1/scheduling_service.grpc.pb.h"
