#pragma once

#include "shakemap/v1/event.pb.h"
#include "shakemap/v1/shakemap.pb.h"
