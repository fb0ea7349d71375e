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

#include "JobScheduler.hpp"

#include <boost/asio/post.hpp>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"

namespace tracklike::core
{
    std::unique_ptr<IJobScheduler> createJobScheduler(LiteralString name, std::size_t threadCount)
    {
        return std::make_unique<JobScheduler>(name, threadCount);
    }

    JobScheduler::JobScheduler(LiteralString name, std::size_t threadCount)
        : _name{ name }
        , _ioContextRunner{ _ioContext, threadCount, name.str() }
    {
    }

    JobScheduler::~JobScheduler() = default;

    std::size_t JobScheduler::getThreadCount() const
    {
        return _ioContextRunner.getThreadCount();
    }

    void JobScheduler::scheduleJob(std::unique_ptr<IJob> job)
    {
        {
            std::scoped_lock lock{ _mutex };
            _ongoingJobCount += 1;
        }

        auto jobHandler{ [job = std::move(job), this]() mutable {
            TRACKLIKE_LOG(UTILS, DEBUG, "[" << _name << "] running job '" << job->getName() << "'");
            job->run();

            {
                std::scoped_lock lock{ _mutex };
                _doneJobs.emplace_back(std::move(job));
                _ongoingJobCount -= 1;
            }

            _condVar.notify_all();
        } };

        boost::asio::post(_ioContext, std::move(jobHandler));
    }

    std::size_t JobScheduler::popJobsDone(std::vector<std::unique_ptr<IJob>>& doneJobs, std::size_t maxCount)
    {
        doneJobs.clear();
        doneJobs.reserve(maxCount);

        std::scoped_lock lock{ _mutex };
        while (doneJobs.size() < maxCount && !_doneJobs.empty())
        {
            doneJobs.push_back(std::move(_doneJobs.front()));
            _doneJobs.pop_front();
        }

        return doneJobs.size();
    }

    void JobScheduler::wait()
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [this] { return _ongoingJobCount == 0; });
    }
} // namespace tracklike::core
