#pragma once

#include "threadnet/manager/v1/dataset.pb.h"
#include "threadnet/manager/v1/router.pb.h"

#include "threadnet/manager/v1/thread_service.pb.h"
#include "threadnet/manager/v1/thread_service.grpc.pb.h"
