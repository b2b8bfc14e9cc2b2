#pragma once

#include "launcher/agent/v1/agent_api.pb.h"
#include "launcher/agent/v1/agent_api.grpc.pb.h"
#include "launcher/agent/v1/jsonrpc.pb.h"

namespace launcher::agent::v1 {
using namespace ::kolide::agent;
}
