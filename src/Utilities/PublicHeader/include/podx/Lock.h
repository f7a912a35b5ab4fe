#pragma once

#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/recursive_mutex.hpp>

namespace util {

using mutex = boost::mutex;
using lock_guard = boost::lock_guard<boost::mutex>;

// The cluster state is guarded by one recursive mutex: sweeps holding it call
// back into components which acquire it again.
using recursive_mutex = boost::recursive_mutex;
using recursive_lock_guard = boost::lock_guard<boost::recursive_mutex>;

}  // namespace util
