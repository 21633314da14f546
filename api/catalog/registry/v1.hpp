#pragma once

#include "catalog/registry/v1/registry.pb.h"
#include "catalog/registry/v1/registry.grpc.pb.h"

#include "catalog/cache/v1/index.pb.h"
#include "catalog/declcfg/v1/declcfg.pb.h"
