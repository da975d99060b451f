#pragma once

#include "rdsync/v1/payload.pb.h"
#include "rdsync/v1/remote_data.pb.h"
#include "rdsync/v1/schedule.pb.h"
