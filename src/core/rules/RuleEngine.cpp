#include "core/rules/RuleEngine.hpp"
#include "core/dnd/DndScheduler.hpp"

namespace hush {

namespace {

struct MutationApplier {
    Notification& n;

    void operator()(const action::Suppress&) const {}
    void operator()(const action::DndExempt&) const {}
    void operator()(const action::ForceUrgency& a) const { n.urgency = a.urgency; }
    void operator()(const action::MuteSound&) const { n.muteSound = true; }
    void operator()(const action::HidePopup&) const { n.hidePopup = true; }
    void operator()(const action::SetTimeout& a) const
    {
        n.expireTimeout = a.ms == 0 ? ExpireTimeout::never() : ExpireTimeout::explicitMs(a.ms);
    }
    void operator()(const action::SetResident& a) const { n.resident = a.value; }
    void operator()(const action::SetTransient& a) const { n.transient = a.value; }
    void operator()(const action::RewriteField& a) const
    {
        switch (a.field) {
        case RuleField::AppName: n.appName = a.value; break;
        case RuleField::Summary: n.summary = a.value; break;
        case RuleField::Body: n.body = a.value; break;
        case RuleField::Category: n.category = a.value; break;
        }
    }
};

} // namespace

Verdict RuleEngine::evaluate(const Notification& notification,
                             const ConfigSnapshot& config,
                             DndState dnd)
{
    Verdict verdict;
    Notification working = notification;

    for (const Rule& rule : config.rules) {
        if (!rule.predicate.matches(working))
            continue;

        verdict.matchedRules << rule.name;
        for (const RuleAction& act : rule.actions) {
            if (std::holds_alternative<action::Suppress>(act)) {
                verdict.suppress = true;
                return verdict;
            }
            if (std::holds_alternative<action::DndExempt>(act)) {
                verdict.dndExempt = true;
                continue;
            }
            applyMutation(act, working);
            verdict.mutations.push_back(act);
        }
    }

    if (dnd != DndState::Off && config.dnd.allowCritical && working.urgency == Urgency::Critical)
        verdict.dndExempt = true;

    return verdict;
}

void RuleEngine::apply(const Verdict& verdict, Notification& n)
{
    for (const Mutation& mutation : verdict.mutations)
        applyMutation(mutation, n);
}

void RuleEngine::applyMutation(const Mutation& mutation, Notification& n)
{
    std::visit(MutationApplier{n}, mutation);
}

} // namespace hush
