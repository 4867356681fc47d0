#pragma once

#include "atomicstore/atomic_counter.hpp"
#include "atomicstore/batch.hpp"
#include "atomicstore/change_notifier.hpp"
#include "atomicstore/concurrent_map.hpp"
#include "atomicstore/errors.hpp"
#include "atomicstore/store.hpp"
