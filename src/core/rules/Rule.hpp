#pragma once

#include "core/Notification.hpp"
#include <QRegularExpression>
#include <QString>
#include <optional>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace hush {

enum class MatchMode {
    Substring,  // case-insensitive contains
    Exact,
    Glob        // case-insensitive, anchored
};

/// One text predicate. Built (and validated) at config load time only.
class TextMatcher {
public:
    /// Throws ConfigError for an invalid glob.
    static TextMatcher create(const QString& pattern, MatchMode mode);

    bool matches(const QString& value) const;

    const QString& pattern() const { return pattern_; }
    MatchMode mode() const { return mode_; }

private:
    TextMatcher() = default;

    QString pattern_;
    MatchMode mode_ = MatchMode::Substring;
    QRegularExpression regex_;
};

struct RulePredicate {
    std::optional<TextMatcher> app;
    std::optional<TextMatcher> summary;
    std::optional<TextMatcher> body;
    std::optional<TextMatcher> category;
    std::optional<Urgency> urgency;

    /// An empty predicate matches every notification.
    bool matches(const Notification& n) const;
};

enum class RuleField { AppName, Summary, Body, Category };

namespace action {
struct Suppress {};
struct ForceUrgency { Urgency urgency; };
struct MuteSound {};
struct DndExempt {};
struct RewriteField { RuleField field; QString value; };
struct HidePopup {};
struct SetTimeout { int ms; };
struct SetResident { bool value; };
struct SetTransient { bool value; };
} // namespace action

using RuleAction = std::variant<
    action::Suppress,
    action::ForceUrgency,
    action::MuteSound,
    action::DndExempt,
    action::RewriteField,
    action::HidePopup,
    action::SetTimeout,
    action::SetResident,
    action::SetTransient>;

struct Rule {
    QString name;
    RulePredicate predicate;
    std::vector<RuleAction> actions;
};

/// Parses one entry of the `rules` sequence. Throws ConfigError.
Rule parseRule(const YAML::Node& node, int index);

} // namespace hush
