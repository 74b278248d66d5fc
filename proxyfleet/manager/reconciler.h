#pragma once
#include <string>
#include <vector>

#include "instance.h"

class process_supervisor;

enum reconcile_action_type : uint8_t
{
    action_none  = 0,
    action_start = 1
};

struct reconcile_action
{
    std::string name;
    reconcile_action_type type = action_none;
};

struct reconcile_outcome
{
    std::string name;
    op_result result;
};

// Restores the fleet to the persisted desired state after a manager restart.
// plan() is pure; run() performs the starts. An orphan still holding a port
// makes that start fail with a bind error: it is reported, never adopted.
class reconciler
{
public:
    explicit reconciler(process_supervisor& supervisor);

    static std::vector<reconcile_action> plan(const std::vector<instance_record>& records);

    std::vector<reconcile_outcome> run(const std::vector<instance_record>& records);

private:
    process_supervisor& m_supervisor;
};

constexpr const char* action_to_string(reconcile_action_type t)
{
    return t == action_start ? "start" : "none";
}
