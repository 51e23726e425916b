#pragma once

// engine
#include "engine/result.hpp"
#include "engine/types.hpp"
#include "engine/bundle_scanner.hpp"
#include "engine/selector.hpp"
#include "engine/plan_builder.hpp"
#include "engine/patcher.hpp"
#include "engine/session.hpp"

// utilities
#include "utils/file_utils.hpp"
#include "utils/hex_utils.hpp"
#include "utils/index_list.hpp"
#include "utils/pretty_hexdump.hpp"
