#include "call_core/utils/async.hpp"

#include <thread>

#include "call_core/logging.hpp"

namespace call_core::utils {

void run_async(Task task) {
    std::thread worker([task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Async task failed",
                {kv("error", ex.what())});
        }
    });
    worker.detach();
}

Executor detached_executor() {
    return [](Task task) { run_async(std::move(task)); };
}

}
