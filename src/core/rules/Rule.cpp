#include "core/rules/Rule.hpp"
#include "core/ConfigError.hpp"
#include <string>

namespace hush {

namespace {

QString qstr(const YAML::Node& node)
{
    return QString::fromStdString(node.as<std::string>());
}

std::string ruleLabel(const QString& name, int index)
{
    if (name.isEmpty())
        return "rules[" + std::to_string(index) + "]";
    return "rule '" + name.toStdString() + "'";
}

// Rejects the one construct QRegularExpression would otherwise accept
// silently after wildcard conversion: a character class never closed.
bool isBalancedGlob(const QString& pattern)
{
    bool inClass = false;
    for (int i = 0; i < pattern.size(); ++i) {
        const QChar c = pattern.at(i);
        if (c == '\\') {
            ++i;
            continue;
        }
        if (!inClass && c == '[') {
            inClass = true;
            // "[]" and "[!]" keep the bracket as a literal member
            if (i + 1 < pattern.size() && pattern.at(i + 1) == '!') ++i;
            if (i + 1 < pattern.size() && pattern.at(i + 1) == ']') ++i;
        } else if (inClass && c == ']') {
            inClass = false;
        }
    }
    return !inClass;
}

MatchMode parseMode(const YAML::Node& node, const std::string& label)
{
    if (!node.IsDefined())
        return MatchMode::Substring;
    const QString mode = qstr(node).trimmed().toLower();
    if (mode == "substring" || mode == "contains") return MatchMode::Substring;
    if (mode == "exact") return MatchMode::Exact;
    if (mode == "glob") return MatchMode::Glob;
    throw ConfigError(label + ": unknown match mode '" + mode.toStdString() + "'");
}

Urgency parseUrgency(const YAML::Node& node, const std::string& label)
{
    auto urgency = urgencyFromName(qstr(node));
    if (!urgency)
        throw ConfigError(label + ": invalid urgency '" + node.as<std::string>() + "'");
    return *urgency;
}

RuleField parseField(const QString& name, const std::string& label)
{
    const QString f = name.trimmed().toLower();
    if (f == "app" || f == "app_name") return RuleField::AppName;
    if (f == "summary") return RuleField::Summary;
    if (f == "body") return RuleField::Body;
    if (f == "category") return RuleField::Category;
    throw ConfigError(label + ": cannot rewrite field '" + f.toStdString() + "'");
}

int parseTimeout(const YAML::Node& node, const std::string& label)
{
    int ms = node.as<int>();
    if (ms < 0)
        throw ConfigError(label + ": timeout must not be negative");
    return ms;
}

RuleAction parseAction(const YAML::Node& item, const std::string& label)
{
    if (item.IsScalar()) {
        const QString name = qstr(item).trimmed().toLower();
        if (name == "suppress") return action::Suppress{};
        if (name == "mute_sound" || name == "silent") return action::MuteSound{};
        if (name == "dnd_exempt") return action::DndExempt{};
        if (name == "hide_popup" || name == "no_popup") return action::HidePopup{};
        throw ConfigError(label + ": unknown action '" + name.toStdString() + "'");
    }

    if (!item.IsMap() || item.size() != 1)
        throw ConfigError(label + ": an action is a name or a single-key map");

    auto entry = item.begin();
    const QString name = qstr(entry->first).trimmed().toLower();
    const YAML::Node& value = entry->second;

    if (name == "force_urgency")
        return action::ForceUrgency{parseUrgency(value, label)};
    if (name == "set_timeout" || name == "expire_timeout_ms")
        return action::SetTimeout{parseTimeout(value, label)};
    if (name == "resident")
        return action::SetResident{value.as<bool>()};
    if (name == "transient")
        return action::SetTransient{value.as<bool>()};
    if (name == "rewrite") {
        if (!value["field"] || !value["value"])
            throw ConfigError(label + ": rewrite needs field and value");
        return action::RewriteField{parseField(qstr(value["field"]), label), qstr(value["value"])};
    }
    throw ConfigError(label + ": unknown action '" + name.toStdString() + "'");
}

std::optional<TextMatcher> parseMatcher(const YAML::Node& node, MatchMode mode)
{
    if (!node.IsDefined() || node.IsNull())
        return std::nullopt;
    return TextMatcher::create(qstr(node), mode);
}

} // namespace

TextMatcher TextMatcher::create(const QString& pattern, MatchMode mode)
{
    TextMatcher m;
    m.pattern_ = pattern;
    m.mode_ = mode;

    if (mode == MatchMode::Glob) {
        if (!isBalancedGlob(pattern))
            throw ConfigError("invalid glob '" + pattern.toStdString() + "': unterminated '['");
#if QT_VERSION >= QT_VERSION_CHECK(6, 6, 0)
        const QString re = QRegularExpression::wildcardToRegularExpression(
            pattern, QRegularExpression::NonPathWildcardConversion);
#else
        const QString re = QRegularExpression::wildcardToRegularExpression(pattern);
#endif
        m.regex_ = QRegularExpression(re, QRegularExpression::CaseInsensitiveOption);
        if (!m.regex_.isValid())
            throw ConfigError("invalid glob '" + pattern.toStdString() + "': "
                              + m.regex_.errorString().toStdString());
    }
    return m;
}

bool TextMatcher::matches(const QString& value) const
{
    switch (mode_) {
    case MatchMode::Exact:
        return value == pattern_;
    case MatchMode::Glob:
        return regex_.match(value).hasMatch();
    case MatchMode::Substring:
        return value.contains(pattern_, Qt::CaseInsensitive);
    }
    return false;
}

bool RulePredicate::matches(const Notification& n) const
{
    if (app && !app->matches(n.appName)) return false;
    if (summary && !summary->matches(n.summary)) return false;
    if (body && !body->matches(n.body)) return false;
    if (category && !category->matches(n.category)) return false;
    if (urgency && *urgency != n.urgency) return false;
    return true;
}

Rule parseRule(const YAML::Node& node, int index)
{
    if (!node.IsMap())
        throw ConfigError("rules[" + std::to_string(index) + "]: expected a mapping");

    Rule rule;
    rule.name = node["name"] ? qstr(node["name"]) : QString();
    const std::string label = ruleLabel(rule.name, index);

    try {
        const MatchMode mode = parseMode(node["match"], label);
        rule.predicate.app = parseMatcher(node["app"], mode);
        rule.predicate.summary = parseMatcher(node["summary"], mode);
        rule.predicate.body = parseMatcher(node["body"], mode);
        rule.predicate.category = parseMatcher(node["category"], mode);
        if (node["urgency"])
            rule.predicate.urgency = parseUrgency(node["urgency"], label);

        if (const YAML::Node actions = node["actions"]) {
            if (!actions.IsSequence())
                throw ConfigError(label + ": actions must be a list");
            for (const auto& item : actions)
                rule.actions.push_back(parseAction(item, label));
        }

        // Shorthand keys, applied after the explicit list in a fixed order.
        if (node["suppress"] && node["suppress"].as<bool>())
            rule.actions.push_back(action::Suppress{});
        if (node["force_urgency"])
            rule.actions.push_back(action::ForceUrgency{parseUrgency(node["force_urgency"], label)});
        if (node["silent"] && node["silent"].as<bool>())
            rule.actions.push_back(action::MuteSound{});
        if (node["no_popup"] && node["no_popup"].as<bool>())
            rule.actions.push_back(action::HidePopup{});
        if (node["dnd_exempt"] && node["dnd_exempt"].as<bool>())
            rule.actions.push_back(action::DndExempt{});
        if (node["expire_timeout_ms"])
            rule.actions.push_back(action::SetTimeout{parseTimeout(node["expire_timeout_ms"], label)});
        if (node["resident"])
            rule.actions.push_back(action::SetResident{node["resident"].as<bool>()});
        if (node["transient"])
            rule.actions.push_back(action::SetTransient{node["transient"].as<bool>()});
    } catch (const ConfigError& e) {
        if (std::string(e.what()).rfind(label, 0) == 0)
            throw;
        throw ConfigError(label + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigError(label + ": " + e.what());
    }

    if (rule.actions.empty())
        throw ConfigError(label + ": no actions");
    return rule;
}

} // namespace hush
