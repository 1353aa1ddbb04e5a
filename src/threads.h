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

#ifndef THREADS_H
#define THREADS_H

#include "util.h"

#include <functional>
#include <pthread.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

// Declare all threads and locks used in hvacmeters!
//
// The main thread parses the configuration, loads the rosters and
// finally writes the output. In between it hands the query round trips
// to a WorkerPool and sleeps until the pool has drained.

#define WITH(mutex,func) Lock local_ ## mutex (&mutex, #func)

struct Lock;

struct RecursiveMutex
{
    RecursiveMutex(const char *name);
    ~RecursiveMutex();

private:

    const char *name_;
    pthread_mutex_t mutex_;
    pthread_mutexattr_t attr_;
    const char *locked_in_func_;
    pid_t       locked_by_pid_;

    friend Lock;
};

struct Lock
{
    Lock(RecursiveMutex *rmutex, const char *func_name);
    ~Lock();

private:

    RecursiveMutex  *rmutex_ {};
    const char *func_name_;
};

// A bounded number of worker threads that drain a numbered list of work items.
// Each item is handed to exactly one worker. The items must not touch
// shared state unless it is protected by a lock, the usual pattern is
// that item i only writes into slot i of a result vector.
struct WorkerPool
{
    WorkerPool(const char *name, int num_workers);

    // Call work(i) for every i in 0..n-1 and return when all calls have returned.
    void run(size_t n, std::function<void(size_t)> work);

private:

    static void *dispatch(void *ptr);
    void drain();
    bool nextItem(size_t *i);

    const char *name_;
    int num_workers_;
    RecursiveMutex items_mutex_;
    size_t next_item_ {};
    size_t num_items_ {};
    std::function<void(size_t)> work_;
};

#endif
