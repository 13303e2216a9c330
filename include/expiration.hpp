#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include "dispatcher.hpp"

namespace hk
{
    // Background sweep that removes keys nobody reads again. Each batch takes
    // the database lock once and releases it before the next, so foreground
    // commands interleave with a long sweep.
    class ActiveExpirer
    {
    public:
        ActiveExpirer(Dispatcher &dispatcher, std::chrono::milliseconds interval, std::size_t batch);

        ~ActiveExpirer();

        ActiveExpirer(const ActiveExpirer &) = delete;
        ActiveExpirer &operator=(const ActiveExpirer &) = delete;

        void start();

        void stop();

        // Runs batches until one comes back short. Returns keys removed.
        std::size_t run_cycle();

    private:
        void loop();

        Dispatcher &dispatcher;
        std::chrono::milliseconds interval;
        std::size_t batch;

        std::thread worker;
        std::mutex mutex;
        std::condition_variable cv;
        bool stopping = false;
    };
}
