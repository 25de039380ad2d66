#pragma once

#include <mintcap/controller/controller.hpp>
#include <mintcap/controller/error.hpp>
#include <mintcap/controller/state.hpp>
