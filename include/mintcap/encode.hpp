#pragma once

#include <mintcap/encode/error.hpp>
#include <mintcap/encode/hex.hpp>
