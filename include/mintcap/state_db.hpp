#pragma once

#include <mintcap/state_db/database.hpp>
#include <mintcap/state_db/error.hpp>
#include <mintcap/state_db/state_node.hpp>
#include <mintcap/state_db/types.hpp>
