#include "expiration.hpp"
#include "logger.hpp"

namespace hk
{
    ActiveExpirer::ActiveExpirer(Dispatcher &dispatcher, std::chrono::milliseconds interval, std::size_t batch)
        : dispatcher(dispatcher), interval(interval), batch(batch == 0 ? 1 : batch)
    {
    }

    ActiveExpirer::~ActiveExpirer()
    {
        stop();
    }

    void ActiveExpirer::start()
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (worker.joinable())
        {
            return;
        }
        stopping = false;
        worker = std::thread(&ActiveExpirer::loop, this);
    }

    void ActiveExpirer::stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        cv.notify_all();
        if (worker.joinable())
        {
            worker.join();
        }
    }

    std::size_t ActiveExpirer::run_cycle()
    {
        std::size_t total = 0;
        for (;;)
        {
            std::size_t removed = dispatcher.sweep_expired(batch);
            total += removed;
            if (removed < batch)
            {
                break;
            }
            std::this_thread::yield();
        }
        return total;
    }

    void ActiveExpirer::loop()
    {
        std::unique_lock<std::mutex> lock(mutex);
        while (!cv.wait_for(lock, interval, [this] { return stopping; }))
        {
            lock.unlock();
            std::size_t removed = run_cycle();
            if (removed > 0)
            {
                log(LogLevel::Debug, "active expiration removed " + std::to_string(removed) + " keys");
            }
            lock.lock();
        }
    }
}
