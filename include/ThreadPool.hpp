#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <exception>

class ThreadPool
{
public:
    explicit ThreadPool(size_t ThreadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Job);

    // Blocks until every submitted job has finished. Rethrows the first exception a job raised.
    void Join();

    size_t GetThreadCount() const;

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;

    std::mutex ThreadPoolMutex;
    std::condition_variable ThreadPool_CV;
    std::condition_variable ThreadPoolIdle_CV;
    bool ThreadPoolStop = false;
    size_t ThreadPoolActiveJobs = 0;
    std::exception_ptr FirstJobError;

    void WorkerThread();
};
