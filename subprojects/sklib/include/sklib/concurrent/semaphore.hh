#pragma once

#include <semaphore.h>

namespace concurrent {

// POSIX unnamed semaphore shared between the threads of one process
class Semaphore {
    sem_t sem_{};

public:
    explicit Semaphore(unsigned initial_count);

    Semaphore(const Semaphore&) = delete;
    Semaphore(Semaphore&&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;
    Semaphore& operator=(Semaphore&&) = delete;

    ~Semaphore();

    // Blocks until the count is positive, then decrements it. Interrupted
    // waits are resumed.
    void wait();

    void post();
};

} // namespace concurrent
