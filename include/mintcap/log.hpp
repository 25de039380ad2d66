#pragma once

#include <mintcap/log/log.hpp>
