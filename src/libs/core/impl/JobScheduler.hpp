/*
 * Copyright (C) 2025 Tracklike contributors
 *
 * This file is part of Tracklike.
 *
 * Tracklike is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Tracklike is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Tracklike.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "core/IJobScheduler.hpp"
#include "core/IOContextRunner.hpp"

namespace tracklike::core
{
    class JobScheduler : public IJobScheduler
    {
    public:
        JobScheduler(LiteralString name, std::size_t threadCount);
        ~JobScheduler() override;
        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

    private:
        std::size_t getThreadCount() const override;
        void scheduleJob(std::unique_ptr<IJob> job) override;

        std::size_t popJobsDone(std::vector<std::unique_ptr<IJob>>& jobs, std::size_t maxCount) override;

        void wait() override;

        LiteralString _name;

        mutable std::mutex _mutex;
        std::atomic<std::size_t> _ongoingJobCount{};
        std::deque<std::unique_ptr<IJob>> _doneJobs;
        std::condition_variable _condVar;

        // last: worker threads are joined before the members above are destroyed
        boost::asio::io_context _ioContext;
        IOContextRunner _ioContextRunner;
    };
} // namespace tracklike::core
