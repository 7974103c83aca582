#include "NotificationService.hpp"
#include "ConfigStore.hpp"
#include "ExpiryScheduler.hpp"
#include "SoundPlayer.hpp"
#include "core/Logging.hpp"
#include "core/cache/IconCache.hpp"
#include "core/dnd/DndScheduler.hpp"
#include "core/history/HistoryStore.hpp"
#include "core/rules/RuleEngine.hpp"
#include <QThreadPool>
#include <boost/log/trivial.hpp>

#ifndef HUSHD_VERSION
#define HUSHD_VERSION "0.1.0"
#endif

namespace hush {

namespace {
const QString kDndBypassHint = QStringLiteral("x-hush-dnd-bypass");
}

NotificationService::NotificationService(ConfigStore& config, HistoryStore& history,
                                         DndScheduler& dnd, ExpiryScheduler& expiry,
                                         QObject* parent)
    : QObject(parent)
    , config_(config)
    , history_(history)
    , dnd_(dnd)
    , expiry_(expiry)
{
    qRegisterMetaType<hush::Notification>();
    qRegisterMetaType<hush::CloseReason>();

    connect(&expiry_, &ExpiryScheduler::expired, this, [this](quint32 id) {
        closeEntry(id, CloseReason::Expired);
    });

    // Runs under the history write lock: only timer bookkeeping here, the
    // signal goes out once the event loop is back.
    history_.setEvictionHook([this](quint32 id) {
        expiry_.cancel(id);
        QMetaObject::invokeMethod(this, [this, id]() {
            emit notificationClosed(id, CloseReason::Undefined);
        }, Qt::QueuedConnection);
    });
}

NotificationService::~NotificationService()
{
    history_.setEvictionHook({});
}

quint32 NotificationService::notify(const NotifyRequest& request)
{
    Notification n = notificationFromRequest(request);
    auto config = config_.snapshot();

    const bool replacing = request.replacesId != 0 && history_.isOpen(request.replacesId);
    n.id = replacing ? request.replacesId : history_.allocateId();

    const DndState dnd = dnd_.state();
    const Verdict verdict = RuleEngine::evaluate(n, *config, dnd);
    if (verdict.suppress) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] #" << n.id << " suppressed by rule "
                                 << verdict.matchedRules.value(verdict.matchedRules.size() - 1)
                                        .toStdString();
        return n.id;
    }
    RuleEngine::apply(verdict, n);

    if (dnd != DndState::Off && !verdict.dndExempt && !n.hintFlag(kDndBypassHint)) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] #" << n.id << " held back by DND ("
                                 << dndStateName(dnd).toStdString() << ")";
        return n.id;
    }

    const InsertOutcome outcome = history_.insertOrReplace(n, config->history.dedupWindowMs);
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] #" << outcome.id << " from "
                            << n.appName.toStdString() << " ("
                            << urgencyName(n.urgency).toStdString() << ")"
                            << (outcome.replaced ? " replaced" : "")
                            << (outcome.deduplicated ? " repeated" : "")
                            << ": " << logSnippet(n.summary);

    enforceActiveCap(*config);

    auto stored = history_.find(outcome.id);
    if (!stored || stored->closed)
        return outcome.id;

    const int ms = expiryFor(*stored, *config);
    if (ms > 0)
        expiry_.schedule(stored->id, ms);
    else
        expiry_.cancel(stored->id);

    if (!stored->hidePopup)
        emit notificationShown(*stored);

    prefetchIcon(*stored);
    if (sound_)
        sound_->play(*stored);

    return outcome.id;
}

int NotificationService::expiryFor(const Notification& n, const ConfigSnapshot& config)
{
    if (n.resident)
        return 0;
    switch (n.expireTimeout.kind) {
    case ExpireTimeout::Kind::Never:
        return 0;
    case ExpireTimeout::Kind::Explicit:
        return n.expireTimeout.ms;
    case ExpireTimeout::Kind::Default:
        break;
    }
    return n.urgency == Urgency::Critical ? config.popups.criticalTimeoutMs
                                          : config.popups.defaultTimeoutMs;
}

void NotificationService::enforceActiveCap(const ConfigSnapshot& config)
{
    const int maxActive = config.history.maxActive;
    while (maxActive > 0 && history_.activeCount() > maxActive) {
        auto oldest = history_.oldestOpenId();
        if (!oldest || !closeEntry(*oldest, CloseReason::Undefined))
            break;
    }
}

void NotificationService::prefetchIcon(const Notification& n)
{
    if (!icons_)
        return;
    const bool fileIcon = !n.imagePath.isEmpty()
        || (n.appIcon.startsWith(QLatin1Char('/')) || n.appIcon.startsWith(QStringLiteral("file://")));
    if (!n.imageData && !fileIcon)
        return;

    IconCache* cache = icons_;
    QThreadPool::globalInstance()->start([cache, n]() {
        cache->iconFor(n);
    });
}

bool NotificationService::closeEntry(quint32 id, CloseReason reason)
{
    auto entry = history_.find(id);
    if (!entry || entry->closed)
        return false;

    const bool retain = !entry->transient || config_.snapshot()->history.transientToHistory;
    if (!history_.close(id, reason, retain))
        return false;

    expiry_.cancel(id);
    BOOST_LOG_TRIVIAL(debug) << "[NotificationService] #" << id << " closed ("
                             << closeReasonName(reason).toStdString() << ")";
    emit notificationClosed(id, reason);
    return true;
}

bool NotificationService::closeNotification(quint32 id)
{
    return closeEntry(id, CloseReason::ClosedByRequest);
}

bool NotificationService::dismiss(quint32 id)
{
    return closeEntry(id, CloseReason::Dismissed);
}

bool NotificationService::invokeAction(quint32 id, const QString& actionKey)
{
    auto entry = history_.find(id);
    if (!entry || entry->closed || !entry->hasAction(actionKey))
        return false;

    emit actionInvoked(id, actionKey);
    if (!entry->resident && !closeEntry(id, CloseReason::Dismissed))
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] #" << id << " closed before action completed";
    return true;
}

int NotificationService::clearHistory()
{
    const QList<Notification> removed = history_.clear([](const Notification&) { return true; });
    for (const Notification& n : removed) {
        if (!n.isOpen())
            continue;
        expiry_.cancel(n.id);
        emit notificationClosed(n.id, CloseReason::Dismissed);
    }
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] History cleared (" << removed.size()
                            << " entries)";
    emit historyCleared();
    return removed.size();
}

QStringList NotificationService::capabilities() const
{
    QStringList caps = {QStringLiteral("actions"), QStringLiteral("body"),
                        QStringLiteral("body-markup"), QStringLiteral("icon-static")};
    auto config = config_.snapshot();
    if (config->history.persist)
        caps << QStringLiteral("persistence");
    if (config->sound.enabled)
        caps << QStringLiteral("sound");
    return caps;
}

ServerInformation NotificationService::serverInformation() const
{
    return {QStringLiteral("hushd"), QStringLiteral("hushd"), QStringLiteral(HUSHD_VERSION),
            QStringLiteral("1.2")};
}

} // namespace hush
