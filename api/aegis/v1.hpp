#pragma once

#include "aegis/config/v1/config.pb.h"
#include "aegis/core/v1/quarantine.pb.h"

#include "aegis/admin/v1/admin.pb.h"
#include "aegis/admin/v1/admin.grpc.pb.h"

namespace aegis::v1 {
using namespace ::aegis::config::v1;
using namespace ::aegis::core::v1;
using namespace ::aegis::admin::v1;
}
