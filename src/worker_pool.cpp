/**********************************************************************
File name: worker_pool.cpp
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
#include "userspacefs/worker_pool.hpp"

#include "userspacefs/logging.hpp"

namespace Userspacefs {

WorkerPool::WorkerPool(size_t threads):
    m_shutting_down(false)
{
    if (threads == 0) {
        threads = 1;
    }
    m_workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        m_workers.emplace_back(&WorkerPool::worker, this);
    }
    logger().debug("worker pool started with {} threads", threads);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

void WorkerPool::worker()
{
    while (true) {
        Job job;
        {
            std::unique_lock lock(m_mutex);
            m_job_cv.wait(lock, [this]{ return m_shutting_down || !m_jobs.empty(); });
            if (m_jobs.empty()) {
                // shutting down with nothing left to do
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
        }

        try {
            job();
        } catch (const std::exception &exc) {
            logger().error("uncaught exception in worker: {}", exc.what());
        }
    }
}

Result<void> WorkerPool::submit(Job &&job)
{
    {
        std::lock_guard lock(m_mutex);
        if (m_shutting_down) {
            return make_result(FAILED, Errc::CANCELLED);
        }
        m_jobs.push(std::move(job));
    }
    m_job_cv.notify_one();
    return make_result();
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard lock(m_mutex);
        m_shutting_down = true;
    }
    m_job_cv.notify_all();

    for (auto &thread: m_workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

}
