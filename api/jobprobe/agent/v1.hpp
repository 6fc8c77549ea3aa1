#pragma once

#include "jobprobe/agent/v1/remote_agent.pb.h"
#include "jobprobe/agent/v1/remote_agent.grpc.pb.h"
