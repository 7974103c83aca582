#pragma once

#include "core/ConfigSnapshot.hpp"
#include "core/rules/Rule.hpp"
#include <vector>

namespace hush {

enum class DndState;

/// A non-terminal action that changed the notification, in the order applied.
using Mutation = RuleAction;

struct Verdict {
    bool suppress = false;
    std::vector<Mutation> mutations;
    bool dndExempt = false;
    QStringList matchedRules;
};

/// Interprets the configured rule list. Stateless: every call reads the
/// snapshot it is given, so a reload takes effect on the next notification.
class RuleEngine {
public:
    /// Rules run in declaration order, each predicate seeing the notification
    /// as rewritten by earlier rules. Suppress stops evaluation. Never throws.
    static Verdict evaluate(const Notification& notification,
                            const ConfigSnapshot& config,
                            DndState dnd);

    /// Applies the verdict's mutations to n in order.
    static void apply(const Verdict& verdict, Notification& n);

    /// Applies a single action; Suppress and DndExempt leave n unchanged.
    static void applyMutation(const Mutation& mutation, Notification& n);
};

} // namespace hush
