#pragma once

#include <mintcap/program/capped_token.hpp>
#include <mintcap/program/error.hpp>
#include <mintcap/program/ledger.hpp>
#include <mintcap/program/objects.hpp>
#include <mintcap/program/ownable.hpp>
#include <mintcap/program/pausable.hpp>
#include <mintcap/program/program.hpp>
#include <mintcap/program/system_interface.hpp>
