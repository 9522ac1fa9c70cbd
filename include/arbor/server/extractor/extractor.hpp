#pragma once

#include "method.hpp"
#include "path.hpp"
#include "query.hpp"
