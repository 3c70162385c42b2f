#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <type_traits>

namespace utility {
using runnerint_t = std::shared_ptr<std::atomic<bool>>;
using runner_f_t = std::function<void(const runnerint_t should_int)>;

/// @brief Executes lambda in the new thread. When the last copy of returned shared_ptr is
/// released, the thread is signalled to stop and joined, so the owner of the pointer outlives
/// the thread always.
/// @param func - callable with 1 parameter which accepts runnerint_t. Once stored value is true,
/// callable should exit.
/// @returns std::shared_ptr<std::thread> which signals and joins the thread on destruction.
template <typename taCallable>
std::shared_ptr<std::thread> startNewRunner(taCallable &&func)
{
    static_assert(std::is_invocable_v<taCallable, runnerint_t>,
                  "Callable should be invocable with runnerint_t as parameter");

    using res_t = std::shared_ptr<std::thread>;
    auto stop = std::make_shared<std::atomic<bool>>(false);
    return res_t(new std::thread(std::forward<taCallable>(func), stop), [stop](auto ptrToDelete) {
        stop->store(true);
        if (ptrToDelete)
        {
            if (ptrToDelete->joinable())
            {
                ptrToDelete->join();
            }
            delete ptrToDelete;
        }
    });
}
} // namespace utility
