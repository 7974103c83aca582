#pragma once

#include <QDateTime>
#include <QObject>
#include <QTimer>
#include <atomic>
#include <functional>
#include <optional>

namespace hush {

class ConfigStore;

enum class DndState {
    Off,
    ManualOn,
    ScheduledOn
};

QString dndStateName(DndState state);

/// Do-not-disturb state machine.
///
/// Manual on is sticky across window boundaries. Leaving manual mode hands
/// control back to the schedule. Turning DND off while a window is active
/// snoozes that window until its end boundary.
/// Window membership is re-evaluated on a timer and on every config reload.
class DndScheduler : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<QDateTime()>;

    explicit DndScheduler(ConfigStore& config, QObject* parent = nullptr);

    DndState state() const { return state_; }
    bool isActive() const { return state_ != DndState::Off; }

    void start();
    void stop();

    void setManual(bool enabled);
    void toggle();

    /// Replaces the wall clock (tests drive window boundaries through it).
    void setClock(Clock clock);

    /// Recomputes window membership against the current clock.
    void evaluate();

signals:
    void stateChanged(hush::DndState state);

private:
    bool insideWindow() const;
    void onConfigReloaded();

    ConfigStore& config_;
    QTimer timer_;
    Clock clock_;
    bool manual_ = false;
    bool snoozed_ = false;
    std::optional<bool> lastInWindow_;
    std::atomic<DndState> state_{DndState::Off};
};

} // namespace hush

Q_DECLARE_METATYPE(hush::DndState)
