/**********************************************************************
File name: worker_pool.hpp
This file is part of: userspacefs

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about userspacefs please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#ifndef USERSPACEFS_WORKER_POOL_H
#define USERSPACEFS_WORKER_POOL_H

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "userspacefs/error.hpp"

namespace Userspacefs {

/**
 * Fixed set of threads running submitted jobs in FIFO order.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

public:
    explicit WorkerPool(size_t threads);
    WorkerPool(const WorkerPool &src) = delete;
    WorkerPool &operator=(const WorkerPool &src) = delete;
    ~WorkerPool();

private:
    std::vector<std::thread> m_workers;
    std::queue<Job> m_jobs;
    std::mutex m_mutex;
    std::condition_variable m_job_cv;
    bool m_shutting_down;

    void worker();

public:
    /**
     * Queue @a job. Fails with Errc::CANCELLED once shutdown() was called.
     */
    Result<void> submit(Job &&job);

    /**
     * Run the jobs already queued, then join all threads.
     */
    void shutdown();

    [[nodiscard]] size_t size() const {
        return m_workers.size();
    }

};

}

#endif
