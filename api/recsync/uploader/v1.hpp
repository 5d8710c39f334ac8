#pragma once

// Single include for every generated message and service of the uploader API.

#include "recsync/uploader/v1/manifest.pb.h"

#include "recsync/uploader/v1/admin_service.pb.h"
#include "recsync/uploader/v1/admin_service.grpc.pb.h"
