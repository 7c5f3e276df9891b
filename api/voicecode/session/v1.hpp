#pragma once

#include "voicecode/session/v1/queue.pb.h"
#include "voicecode/session/v1/upload.pb.h"
