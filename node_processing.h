#ifndef _NODE_PROCESSING_H_
#define _NODE_PROCESSING_H_

#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "dom_tree.h"

typedef std::function<void(NodeId)> NodeAction;

// Walks the tree once in document order and runs every action whose selector
// matches the current element. Actions on one element run in map order.
// Actions must not change the tree structure.
bool batch_process_selections(const DomTree& tree, const std::map<std::string, NodeAction>& operations);

struct ParallelOptions
{
    ParallelOptions();

    // reads the [parallel] section
    void load(const Config& config);

    bool enabled;
    int max_parallelism;
    // fewer nodes than this are processed on the calling thread
    size_t min_parallel_nodes;
    // from this many nodes on a shared job queue replaces fixed batches
    size_t queue_threshold;
};

class NodeJobQueue
{
public:
    explicit NodeJobQueue(size_t count)
    {
        for (size_t i = 0; i < count; ++i)
        {
            this->m_jobs.push(i);
        }
    }

    bool pop(size_t& index)
    {
        std::lock_guard<std::mutex> guard(this->m_mutex);
        if (this->m_jobs.empty())
        {
            return false;
        }

        index = this->m_jobs.front();
        this->m_jobs.pop();
        return true;
    }

private:
    std::mutex m_mutex;
    std::queue<size_t> m_jobs;
};

// Applies processor to every node and stores the outputs in input order.
// processor runs concurrently on worker threads: it must only read shared
// state and must not throw.
template <typename R>
void parallel_process_nodes(const std::vector<NodeId>& nodes, const std::function<R(NodeId)>& processor,
        const ParallelOptions& options, std::vector<R>& results)
{
    // a wrapper keeps each output in its own object, vector<bool> packs bits
    struct Slot
    {
        R value;
    };

    size_t count = nodes.size();
    results.clear();
    if (count == 0)
    {
        return;
    }

    size_t workers = options.max_parallelism > 0 ? static_cast<size_t>(options.max_parallelism) : 1;
    if (workers > count)
    {
        workers = count;
    }

    if (!options.enabled || count < options.min_parallel_nodes || count <= 1 || workers <= 1)
    {
        results.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            results.push_back(processor(nodes[i]));
        }

        return;
    }

    std::vector<Slot> slots(count);
    std::vector<std::thread> threads;
    bool use_queue = count >= options.queue_threshold;
    NodeJobQueue queue(use_queue ? count : 0);
    if (!use_queue)
    {
        size_t batch = (count + workers - 1) / workers;
        for (size_t start = 0; start < count; start += batch)
        {
            size_t end = start + batch < count ? start + batch : count;
            threads.push_back(std::thread([&nodes, &processor, &slots, start, end]()
            {
                for (size_t i = start; i < end; ++i)
                {
                    slots[i].value = processor(nodes[i]);
                }
            }));
        }
    }
    else
    {
        for (size_t i = 0; i < workers; ++i)
        {
            threads.push_back(std::thread([&nodes, &processor, &slots, &queue]()
            {
                size_t index;
                while (queue.pop(index))
                {
                    slots[index].value = processor(nodes[index]);
                }
            }));
        }
    }

    for (size_t i = 0; i < threads.size(); ++i)
    {
        threads[i].join();
    }

    results.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        results.push_back(slots[i].value);
    }
}

#endif
