#pragma once

#include "mbx/channel/channel.hpp"
#include "mbx/core/box.hpp"
#include "mbx/core/queue.hpp"
#include "mbx/core/stack.hpp"
#include "mbx/platform.hpp"
#include "mbx/process.hpp"
#include "mbx/types.hpp"
