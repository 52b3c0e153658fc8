#include "SyncEngine.hpp"
#include "Core/Logger.hpp"

SyncEngine::SyncEngine(RuleMutator &mutator)
    : mutator_(mutator)
{
}

SyncReport SyncEngine::Sync(const std::vector<ForwardingRule> &observed, const std::string &current_address)
{
    SyncReport report;

    for (const ForwardingRule &rule : observed)
    {
        if (rule.target_address == current_address)
        {
            LOGT("sync") << "up to date: " << rule.listen_address << ":" << rule.port;
            continue;
        }

        LOGI("sync") << "rewrite " << rule.listen_address << ":" << rule.port
                     << " " << rule.target_address << " -> " << current_address;

        const bool removed = mutator_.ApplyForward(Mode::Delete, rule.port, rule.listen_address, rule.target_address);
        const bool added   = mutator_.ApplyForward(Mode::Add,    rule.port, rule.listen_address, current_address);

        ++report.rewritten;
        if (!removed || !added)
        {
            ++report.failed;
            LOGW("sync") << "rewrite of " << rule.listen_address << ":" << rule.port
                         << " incomplete (delete=" << removed << " add=" << added << ")";
        }
    }

    report.changed = report.rewritten > 0;
    if (!report.changed)
        LOGI("sync") << "no drift: " << observed.size() << " rule(s) already point to " << current_address;
    else
        LOGI("sync") << "rewritten " << report.rewritten << " rule(s), failed " << report.failed;

    return report;
}
