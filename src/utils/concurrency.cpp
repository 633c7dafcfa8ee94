#include "dh/concurrency.hpp"

#include <exception>
#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace dh {

void run_workers(
    int workers,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel,
    const ThreadStarter& start)
{
    Cancellation local_cancel;
    Cancellation& token = cancel ? *cancel : local_cancel;

    std::mutex ex_mtx;
    std::exception_ptr first_ex = nullptr;
    auto set_first_ex = [&](std::exception_ptr ep) {
        if (!ep) return;
        std::scoped_lock lk(ex_mtx);
        if (!first_ex) first_ex = std::move(ep);
    };

    auto safe_call = [&](int idx) {
        if (token.is_cancelled()) return;
        try {
            fn(idx, token.flag());
        } catch (...) {
            set_first_ex(std::current_exception());
            token.cancel();
        }
    };

    if (workers <= 1)
    {
        safe_call(0);
    }
    else
    {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (int i = 0; i < workers; ++i)
        {
            try {
                std::function<void()> body = [&safe_call, i] { safe_call(i); };
                threads.push_back(start ? start(std::move(body)) : std::thread(std::move(body)));
            } catch (const std::exception& e) {
                // the workers already running share the same source and drain it
                if (threads.empty())
                {
                    set_first_ex(std::current_exception());
                    token.cancel();
                }
                else
                {
                    spdlog::warn("started {} of {} workers: {}", threads.size(), workers, e.what());
                }
                break;
            }
        }
        for (auto& th : threads) if (th.joinable()) th.join();
    }

    if (first_ex) std::rethrow_exception(first_ex);
}

} // namespace dh
