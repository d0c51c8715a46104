#pragma once

#include "circulation/v1/types.pb.h"

#include "circulation/v1/admin_service.pb.h"
#include "circulation/v1/circulation_service.pb.h"
