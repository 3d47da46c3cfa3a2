#pragma once

#include "courier/types/v1/types.pb.h"

#include "courier/admin/v1/admin.pb.h"

#include "courier/services/v1/courier_admin_service.pb.h"

namespace courier::v1 {
using namespace ::courier::types::v1;
using namespace ::courier::admin::v1;
using namespace ::courier::services::v1;
}
