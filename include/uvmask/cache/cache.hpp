#pragma once

/// @file cache.hpp
/// @brief Main include header for uvmask_cache

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "key.hpp"
#include "codec.hpp"
#include "statistics.hpp"
#include "storage.hpp"
#include "memory_storage.hpp"
#include "file_storage.hpp"
#include "uv_cache.hpp"
