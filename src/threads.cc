/*
 Copyright (C) 2020-2025 Fredrik Öhrström (gpl-3.0-or-later)

 This program is free software: you can redistribute it and/or modify
 it under the terms of the GNU General Public License as published by
 the Free Software Foundation, either version 3 of the License, or
 (at your option) any later version.

 This program is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 GNU General Public License for more details.

 You should have received a copy of the GNU General Public License
 along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "threads.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

using namespace std;

RecursiveMutex::RecursiveMutex(const char *name)
    : name_(name), locked_in_func_(""), locked_by_pid_(0)
{
    pthread_mutexattr_init(&attr_);
    pthread_mutexattr_settype(&attr_, PTHREAD_MUTEX_RECURSIVE);
    pthread_mutex_init(&mutex_, &attr_);
}

RecursiveMutex::~RecursiveMutex()
{
    pthread_mutex_destroy(&mutex_);
    pthread_mutexattr_destroy(&attr_);
}

Lock::Lock(RecursiveMutex *rmutex, const char *func_name)
{
    rmutex_ = rmutex;
    func_name_ = func_name;
    trace("[LOCKING] %s %s (%s %d)\n", rmutex_->name_, func_name_, rmutex_->locked_in_func_, rmutex->locked_by_pid_);
    pthread_mutex_lock(&rmutex_->mutex_);
    rmutex->locked_in_func_ = func_name;
    rmutex->locked_by_pid_ = getpid();
    trace("[LOCKED]  %s %s (%s %d)\n", rmutex_->name_, func_name_, rmutex_->locked_in_func_, rmutex->locked_by_pid_);
}

Lock::~Lock()
{
    trace("[UNLOCKING] %s %s (%s %d)\n", rmutex_->name_, func_name_, rmutex_->locked_in_func_, rmutex_->locked_by_pid_);
    rmutex_->locked_in_func_ = "";
    rmutex_->locked_by_pid_ = 0;
    pthread_mutex_unlock(&rmutex_->mutex_);
    trace("[UNLOCKED]  %s %s\n", rmutex_->name_, func_name_);
}

WorkerPool::WorkerPool(const char *name, int num_workers)
    : name_(name), num_workers_(num_workers < 1 ? 1 : num_workers), items_mutex_("items_mutex")
{
}

void *WorkerPool::dispatch(void *ptr)
{
    WorkerPool *pool = static_cast<WorkerPool*>(ptr);
    pool->drain();
    return NULL;
}

bool WorkerPool::nextItem(size_t *i)
{
    WITH(items_mutex_, nextItem);
    if (next_item_ >= num_items_) return false;
    *i = next_item_++;
    return true;
}

void WorkerPool::drain()
{
    size_t i;
    while (nextItem(&i))
    {
        work_(i);
    }
}

void WorkerPool::run(size_t n, function<void(size_t)> work)
{
    work_ = work;
    next_item_ = 0;
    num_items_ = n;

    size_t num_threads = num_workers_;
    if (num_threads > n) num_threads = n;

    if (num_threads <= 1)
    {
        debug("(threads) %s running %zu items in the main thread\n", name_, n);
        drain();
        return;
    }

    debug("(threads) %s running %zu items on %zu workers\n", name_, n, num_threads);

    vector<pthread_t> threads;
    for (size_t t = 0; t < num_threads; ++t)
    {
        pthread_t thread;
        int rc = pthread_create(&thread, NULL, dispatch, this);
        if (rc)
        {
            warning("(threads) %s could not start worker %zu: %s\n", name_, t, strerror(rc));
            break;
        }
        threads.push_back(thread);
    }

    // Help out, this also finishes the job if no worker could be started.
    drain();

    for (auto &thread : threads)
    {
        pthread_join(thread, NULL);
    }
    work_ = function<void(size_t)>();
}
