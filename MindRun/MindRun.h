#ifndef _MindRun_MindRun_h_
#define _MindRun_MindRun_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <ctime>
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <future>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <deque>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <thread>
#include <atomic>
#include <chrono>
#include <system_error>
#include <limits>
#include <type_traits>

// System includes
#include <sys/types.h>
#include <unistd.h>

#include "common.h"
#include "errors.h"
#include "types.h"
#include "deadline.h"
#include "driver.h"
#include "event_log.h"
#include "session_registry.h"
#include "snapshot_store.h"
#include "recovery.h"
#include "health_monitor.h"
#include "supervisor.h"

#endif
