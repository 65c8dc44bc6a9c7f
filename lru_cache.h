#ifndef _LRU_CACHE_H_
#define _LRU_CACHE_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "rw_lock.h"

struct CacheStats
{
    CacheStats() :
        size(0), hits(0), misses(0), hit_ratio(0.0)
    {
    }

    size_t size;
    long hits;
    long misses;
    double hit_ratio;
};

// Bounded LRU cache with per entry expiration.
//
// An entry is visible to get() only while now < expiration. When a new key is
// set on a full cache the least recently used entry (by get or set) goes
// first. With a positive cleanup interval a background thread drops expired
// entries on that interval whether or not the cache is read.
//
// Lookups share a read lock. Recency updates, set, eviction and the sweep
// take the write lock.
template <typename V>
class LruCache
{
public:
    LruCache(size_t capacity, long default_ttl_ms, long cleanup_interval_ms) :
        m_capacity(capacity),
        m_default_ttl_ms(default_ttl_ms),
        m_cleanup_interval_ms(cleanup_interval_ms),
        m_hits(0),
        m_misses(0),
        m_stopping(false)
    {
        if (this->m_cleanup_interval_ms > 0)
        {
            this->m_sweeper = std::thread(&LruCache::sweep_loop, this);
        }
    }

    ~LruCache()
    {
        {
            std::lock_guard<std::mutex> guard(this->m_sweep_mutex);
            this->m_stopping = true;
        }

        this->m_sweep_cond.notify_all();
        if (this->m_sweeper.joinable())
        {
            this->m_sweeper.join();
        }
    }

    bool get(const std::string& key, V& value)
    {
        bool found = false;
        bool expired = false;
        {
            ReadGuard guard(this->m_lock);
            typename Index::const_iterator iter = this->m_index.find(key);
            if (iter != this->m_index.end())
            {
                if (Clock::now() < iter->second->expiration)
                {
                    value = iter->second->value;
                    found = true;
                }
                else
                {
                    expired = true;
                }
            }
        }

        if (found || expired)
        {
            WriteGuard guard(this->m_lock);
            typename Index::iterator iter = this->m_index.find(key);
            if (iter != this->m_index.end())
            {
                if (Clock::now() >= iter->second->expiration)
                {
                    this->m_entries.erase(iter->second);
                    this->m_index.erase(iter);
                }
                else if (found)
                {
                    this->m_entries.splice(this->m_entries.begin(), this->m_entries, iter->second);
                }
            }
        }

        if (found)
        {
            ++this->m_hits;
        }
        else
        {
            ++this->m_misses;
        }

        return found;
    }

    void set(const std::string& key, const V& value)
    {
        this->set(key, value, this->m_default_ttl_ms);
    }

    // ttl_ms <= 0 uses the default expiration
    void set(const std::string& key, const V& value, long ttl_ms)
    {
        if (this->m_capacity == 0)
        {
            return;
        }

        if (ttl_ms <= 0)
        {
            ttl_ms = this->m_default_ttl_ms;
        }

        Clock::time_point expiration = Clock::now() + std::chrono::milliseconds(ttl_ms);

        WriteGuard guard(this->m_lock);
        typename Index::iterator iter = this->m_index.find(key);
        if (iter != this->m_index.end())
        {
            iter->second->value = value;
            iter->second->expiration = expiration;
            this->m_entries.splice(this->m_entries.begin(), this->m_entries, iter->second);
            return;
        }

        while (this->m_entries.size() >= this->m_capacity)
        {
            this->m_index.erase(this->m_entries.back().key);
            this->m_entries.pop_back();
        }

        Entry entry;
        entry.key = key;
        entry.value = value;
        entry.expiration = expiration;
        this->m_entries.push_front(entry);
        this->m_index[key] = this->m_entries.begin();
    }

    bool remove(const std::string& key)
    {
        WriteGuard guard(this->m_lock);
        typename Index::iterator iter = this->m_index.find(key);
        if (iter == this->m_index.end())
        {
            return false;
        }

        this->m_entries.erase(iter->second);
        this->m_index.erase(iter);
        return true;
    }

    void clear()
    {
        WriteGuard guard(this->m_lock);
        this->m_entries.clear();
        this->m_index.clear();
        this->m_hits = 0;
        this->m_misses = 0;
    }

    size_t remove_expired()
    {
        WriteGuard guard(this->m_lock);
        Clock::time_point now = Clock::now();
        size_t removed = 0;
        typename EntryList::iterator iter = this->m_entries.begin();
        while (iter != this->m_entries.end())
        {
            if (now >= iter->expiration)
            {
                this->m_index.erase(iter->key);
                iter = this->m_entries.erase(iter);
                ++removed;
            }
            else
            {
                ++iter;
            }
        }

        return removed;
    }

    size_t size() const
    {
        ReadGuard guard(this->m_lock);
        return this->m_entries.size();
    }

    CacheStats stats() const
    {
        CacheStats result;
        result.size = this->size();
        result.hits = this->m_hits;
        result.misses = this->m_misses;
        long total = result.hits + result.misses;
        if (total > 0)
        {
            result.hit_ratio = static_cast<double>(result.hits) / total;
        }

        return result;
    }

private:
    typedef std::chrono::steady_clock Clock;

    struct Entry
    {
        std::string key;
        V value;
        Clock::time_point expiration;
    };

    typedef std::list<Entry> EntryList;
    typedef std::map<std::string, typename EntryList::iterator> Index;

    LruCache(const LruCache&);
    LruCache& operator=(const LruCache&);

    void sweep_loop()
    {
        std::unique_lock<std::mutex> lock(this->m_sweep_mutex);
        while (!this->m_stopping)
        {
            this->m_sweep_cond.wait_for(lock, std::chrono::milliseconds(this->m_cleanup_interval_ms));
            if (this->m_stopping)
            {
                break;
            }

            lock.unlock();
            this->remove_expired();
            lock.lock();
        }
    }

    const size_t m_capacity;
    const long m_default_ttl_ms;
    const long m_cleanup_interval_ms;

    // front is the most recently used entry
    EntryList m_entries;
    Index m_index;
    mutable RwLock m_lock;

    std::atomic<long> m_hits;
    std::atomic<long> m_misses;

    std::thread m_sweeper;
    std::mutex m_sweep_mutex;
    std::condition_variable m_sweep_cond;
    bool m_stopping;
};

#endif
