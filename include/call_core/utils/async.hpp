#pragma once

#include <chrono>
#include <functional>

namespace call_core {
namespace utils {

using Task = std::function<void()>;
using Executor = std::function<void(Task)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

void run_async(Task task);

// Executor that hands each task to run_async.
Executor detached_executor();

}
}
