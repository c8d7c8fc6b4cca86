#pragma once

#include "glucolumin/v1/types.pb.h"
#include "glucolumin/v1/visit_service.pb.h"
#include "glucolumin/v1/admin_service.pb.h"
