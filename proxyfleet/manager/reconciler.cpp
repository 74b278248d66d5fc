#include "reconciler.h"
#include "process_supervisor.h"
#include "../shared/logging.h"

#include <algorithm>

reconciler::reconciler(process_supervisor& supervisor)
    : m_supervisor(supervisor)
{
}

std::vector<reconcile_action> reconciler::plan(const std::vector<instance_record>& records)
{
    std::vector<reconcile_action> actions;
    actions.reserve(records.size());
    for (const auto& rec : records)
        actions.push_back({ rec.name, rec.desired == desired_running ? action_start : action_none });
    return actions;
}

std::vector<reconcile_outcome> reconciler::run(const std::vector<instance_record>& records)
{
    std::vector<reconcile_outcome> outcomes;

    for (const auto& action : plan(records))
    {
        if (action.type != action_start)
            continue;

        auto it = std::find_if(records.begin(), records.end(),
            [&action](const instance_record& r) { return r.name == action.name; });

        op_result r = m_supervisor.start(*it);
        if (r)
            LOG_INFOF("restore: %s running", action.name.c_str());
        else
            LOG_WARNF("restore: %s failed to start: %s", action.name.c_str(), r.message.c_str());

        outcomes.push_back({ action.name, std::move(r) });
    }
    return outcomes;
}
