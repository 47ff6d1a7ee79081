#pragma once

#include "accessres/resolver/v1/types.pb.h"

#include "accessres/resolver/v1/access_service.pb.h"
#include "accessres/resolver/v1/access_service.grpc.pb.h"
