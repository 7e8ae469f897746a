#include <cerrno>
#include <sklib/concurrent/semaphore.hh>
#include <sklib/debug.hh>

namespace concurrent {

Semaphore::Semaphore(unsigned initial_count) {
    if (sem_init(&sem_, 0, initial_count) != 0) {
        THROW("sem_init()", errmsg());
    }
}

Semaphore::~Semaphore() { (void)sem_destroy(&sem_); }

void Semaphore::wait() {
    while (sem_wait(&sem_) != 0) {
        if (errno != EINTR) {
            THROW("sem_wait()", errmsg());
        }
    }
}

void Semaphore::post() {
    if (sem_post(&sem_) != 0) {
        THROW("sem_post()", errmsg());
    }
}

} // namespace concurrent
