#pragma once

#include "letterbox/utils/base-include.hpp"
