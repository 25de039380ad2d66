#pragma once

#include <mintcap/memory/memory.hpp>
