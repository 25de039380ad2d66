#pragma once

#include <mintcap/protocol/account.hpp>
#include <mintcap/protocol/call.hpp>
#include <mintcap/protocol/event.hpp>
