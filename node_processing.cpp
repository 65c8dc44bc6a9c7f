#include "node_processing.h"

#include <iostream>

#include "selector.h"

using namespace std;

static const char* c_section_name = "parallel";

ParallelOptions::ParallelOptions() :
    enabled(true),
    max_parallelism(4),
    min_parallel_nodes(2),
    queue_threshold(20)
{
    unsigned int cores = thread::hardware_concurrency();
    if (cores > 0)
    {
        this->max_parallelism = static_cast<int>(cores);
    }
}

void ParallelOptions::load(const Config& config)
{
    this->enabled = config.GetBoolValue(c_section_name, "enabled", this->enabled);
    this->max_parallelism = config.GetIntValue(c_section_name, "max_parallelism", this->max_parallelism);
    this->min_parallel_nodes = config.GetIntValue(c_section_name, "min_parallel_nodes", static_cast<int>(this->min_parallel_nodes));
    this->queue_threshold = config.GetIntValue(c_section_name, "queue_threshold", static_cast<int>(this->queue_threshold));
}

struct BatchOperation
{
    Selector selector;
    vector<string> plain_tags;
    const NodeAction* action;
};

static void run_operations(const DomTree& tree, NodeId node, const vector<BatchOperation>& operations)
{
    const DomNode& current = tree.get_node(node);
    if (current.is_element())
    {
        for (size_t i = 0; i < operations.size(); ++i)
        {
            const BatchOperation& operation = operations[i];
            bool matched = false;
            if (!operation.plain_tags.empty())
            {
                for (size_t j = 0; j < operation.plain_tags.size(); ++j)
                {
                    if (current.get_tag() == operation.plain_tags[j])
                    {
                        matched = true;
                        break;
                    }
                }
            }
            else
            {
                matched = operation.selector.matches(tree, node);
            }

            if (matched)
            {
                (*operation.action)(node);
            }
        }
    }

    const vector<NodeId>& children = current.get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        run_operations(tree, children[i], operations);
    }
}

bool batch_process_selections(const DomTree& tree, const map<string, NodeAction>& operations)
{
    vector<BatchOperation> parsed;
    for (map<string, NodeAction>::const_iterator iter = operations.begin(); iter != operations.end(); ++iter)
    {
        BatchOperation operation;
        if (!operation.selector.parse(iter->first))
        {
            cerr << "bad selector: " << iter->first << endl;
            return false;
        }

        operation.selector.get_plain_tags(operation.plain_tags);
        operation.action = &iter->second;
        parsed.push_back(operation);
    }

    run_operations(tree, tree.get_document(), parsed);
    return true;
}
