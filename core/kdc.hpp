#pragma once
// Standard C/C++ headers
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ctime>

// Standard C++ Library headers
#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Project core headers
#include "core/macros.hpp"
#include "core/noncopyable.hpp"
#include "core/singleton.hpp"
#include "core/types.hpp"

// Project utils headers
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"
