// commands.hpp
#pragma once
#include "cas_commands.hpp"
#include "command.hpp"
#include "kv_commands.hpp"
#include "queue_commands.hpp"
#include "result.hpp"
#include "subkey_commands.hpp"
