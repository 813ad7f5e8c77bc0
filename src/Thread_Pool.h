//Thread_Pool.h - A part of CropAutomaton.

#pragma once

#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <list>

#include "YgorLog.h"


// Multi-threaded work queue used to process independent source volumes concurrently.
//
// Tasks are consumed in FIFO order. With a single worker, tasks are therefore processed sequentially in submission
// order. Tasks are expected to report their own failures; an exception escaping a task is logged and counted so it
// can be detected after the queue drains.

template<class T>
class work_queue {

  private:
    std::list<T> queue;
    std::mutex queue_mutex;

    std::condition_variable new_task_notifier;
    std::condition_variable end_task_notifier;
    std::atomic<bool> should_quit = false;
    std::list<std::thread> worker_threads;

    int64_t in_flight = 0; // Tasks claimed by a worker but not yet finished. Guarded by queue_mutex.
    std::atomic<int64_t> escaped_failures = 0;

  public:

    explicit work_queue(unsigned int n_workers = std::thread::hardware_concurrency()){
        std::unique_lock<std::mutex> lock(this->queue_mutex);

        auto l_n_workers = (n_workers == 0U) ? std::thread::hardware_concurrency()
                                             : n_workers;
        l_n_workers = (l_n_workers == 0U) ? 2U : l_n_workers;

        for(unsigned int i = 0; i < l_n_workers; ++i){
            this->worker_threads.emplace_back(
                [this](){
                    bool l_should_quit = false;
                    while(!l_should_quit){

                        std::unique_lock<std::mutex> lock(this->queue_mutex);
                        while( !(l_should_quit = this->should_quit.load())
                               && this->queue.empty() ){
                            // Spurious wakeups simply return here.
                            this->new_task_notifier.wait(lock);
                        }

                        std::list<T> l_queue;
                        if(!this->queue.empty()){
                            l_queue.splice( std::end(l_queue), this->queue, std::begin(this->queue) );
                            ++this->in_flight;
                        }
                        lock.unlock();

                        for(const auto &user_f : l_queue){
                            try{
                                user_f();
                            }catch(const std::exception &e){
                                ++this->escaped_failures;
                                YLOGWARN("Queued task failed: " << e.what());
                            }

                            lock.lock();
                            --this->in_flight;
                            this->end_task_notifier.notify_all();
                            lock.unlock();
                        }
                    }
                }
            );
        }
    }

    work_queue(const work_queue &) = delete;
    work_queue & operator=(const work_queue &) = delete;

    void submit_task(T f){
        std::lock_guard<std::mutex> lock(this->queue_mutex);
        this->queue.push_back(std::move(f));
        this->new_task_notifier.notify_one();
        return;
    }

    std::list<T> clear_tasks(){
        std::list<T> out;
        std::lock_guard<std::mutex> lock(this->queue_mutex);
        out.swap( this->queue );
        return out;
    }

    // Blocks until every submitted task has been claimed and completed.
    void wait_until_idle(){
        std::unique_lock<std::mutex> lock(this->queue_mutex);
        while( !this->queue.empty() || (0 < this->in_flight) ){
            this->end_task_notifier.wait_for(lock, std::chrono::milliseconds(500) );
        }
        return;
    }

    int64_t get_escaped_failure_count() const {
        return this->escaped_failures.load();
    }

    ~work_queue(){
        // Outstanding queued tasks are completed before the workers are joined. Use clear_tasks() first to cancel them.
        this->wait_until_idle();

        {
            std::lock_guard<std::mutex> lock(this->queue_mutex);
            this->should_quit.store(true);
            this->new_task_notifier.notify_all();
        }
        for(auto &wt : this->worker_threads) wt.join();
    }
};

