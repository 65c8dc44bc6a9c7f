#ifndef _RW_LOCK_H_
#define _RW_LOCK_H_

#include <pthread.h>

// pthread reader/writer lock, readers share, writers are exclusive
class RwLock
{
public:
    RwLock()
    {
        pthread_rwlock_init(&this->m_lock, NULL);
    }

    ~RwLock()
    {
        pthread_rwlock_destroy(&this->m_lock);
    }

    void read_lock()
    {
        pthread_rwlock_rdlock(&this->m_lock);
    }

    void write_lock()
    {
        pthread_rwlock_wrlock(&this->m_lock);
    }

    void unlock()
    {
        pthread_rwlock_unlock(&this->m_lock);
    }

private:
    RwLock(const RwLock&);
    RwLock& operator=(const RwLock&);

    pthread_rwlock_t m_lock;
};

class ReadGuard
{
public:
    explicit ReadGuard(RwLock& lock) :
        m_lock(lock)
    {
        this->m_lock.read_lock();
    }

    ~ReadGuard()
    {
        this->m_lock.unlock();
    }

private:
    ReadGuard(const ReadGuard&);
    ReadGuard& operator=(const ReadGuard&);

    RwLock& m_lock;
};

class WriteGuard
{
public:
    explicit WriteGuard(RwLock& lock) :
        m_lock(lock)
    {
        this->m_lock.write_lock();
    }

    ~WriteGuard()
    {
        this->m_lock.unlock();
    }

private:
    WriteGuard(const WriteGuard&);
    WriteGuard& operator=(const WriteGuard&);

    RwLock& m_lock;
};

#endif
