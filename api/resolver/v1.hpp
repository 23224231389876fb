#pragma once

#include "resolver/v1/types.pb.h"
#include "resolver/v1/query.pb.h"
