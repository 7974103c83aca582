#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QString>
#include <boost/log/trivial.hpp>
#include <functional>
#include <future>
#include <list>
#include <optional>
#include <stdexcept>
#include <string>

namespace hush {

/// Thrown by a compute function when the asset cannot be produced.
class CacheComputeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * LruCache: byte-budgeted, access-ordered memo table with single-flight
 * computation.
 *
 * getOrCompute() runs at most one computation per missing key; other
 * callers for the same key block on the in-flight std::shared_future and
 * receive the same value. A computation that throws CacheComputeError (or
 * any std::exception) is cached as a negative entry holding a
 * default-constructed Value until a retry deadline that doubles with each
 * consecutive failure (1 s up to 60 s).
 *
 * Thread safety: all members may be called from any thread.
 */
template <typename Value>
class LruCache {
public:
    using SizeFn = std::function<qint64(const Value&)>;
    using ComputeFn = std::function<Value()>;
    using ClockFn = std::function<qint64()>;

    static constexpr qint64 kInitialBackoffMs = 1000;
    static constexpr qint64 kMaxBackoffMs = 60000;

    LruCache(std::string name, qint64 budgetBytes, SizeFn sizeOf)
        : name_(std::move(name))
        , budget_(budgetBytes)
        , sizeOf_(std::move(sizeOf))
        , clock_([] { return QDateTime::currentMSecsSinceEpoch(); })
    {
    }

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    Value getOrCompute(const QString& key, const ComputeFn& compute)
    {
        std::promise<Value> promise;
        std::shared_future<Value> pending;
        int previousFailures = 0;

        {
            QMutexLocker lock(&mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                if (!it->negative || clock_() < it->retryAtMs) {
                    touchLocked(it);
                    return it->value;
                }
                previousFailures = it->failures;
            }

            auto flight = inflight_.find(key);
            if (flight != inflight_.end()) {
                pending = *flight;
            } else {
                inflight_.insert(key, promise.get_future().share());
            }
        }

        if (pending.valid())
            return pending.get();

        Value value;
        bool failed = false;
        try {
            value = compute();
        } catch (const std::exception& e) {
            failed = true;
            value = Value{};
            BOOST_LOG_TRIVIAL(warning) << "[" << name_ << "] compute failed for "
                                       << key.toStdString() << ": " << e.what();
        } catch (...) {
            {
                QMutexLocker lock(&mutex_);
                inflight_.remove(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }

        {
            QMutexLocker lock(&mutex_);
            inflight_.remove(key);
            if (failed)
                storeNegativeLocked(key, previousFailures + 1);
            else
                storeLocked(key, value);
        }
        promise.set_value(value);
        return value;
    }

    /// Cached value without computing; negative entries report nullopt.
    std::optional<Value> peek(const QString& key)
    {
        QMutexLocker lock(&mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || it->negative)
            return std::nullopt;
        touchLocked(it);
        return it->value;
    }

    bool isNegative(const QString& key) const
    {
        QMutexLocker lock(&mutex_);
        auto it = entries_.constFind(key);
        return it != entries_.constEnd() && it->negative;
    }

    void setBudget(qint64 budgetBytes)
    {
        QMutexLocker lock(&mutex_);
        budget_ = budgetBytes;
        evictLocked();
    }

    void clear()
    {
        QMutexLocker lock(&mutex_);
        entries_.clear();
        order_.clear();
        resident_ = 0;
    }

    void setClock(ClockFn clock)
    {
        QMutexLocker lock(&mutex_);
        clock_ = std::move(clock);
    }

    qint64 budget() const { QMutexLocker lock(&mutex_); return budget_; }
    qint64 residentBytes() const { QMutexLocker lock(&mutex_); return resident_; }
    int size() const { QMutexLocker lock(&mutex_); return entries_.size(); }

private:
    struct Entry {
        Value value;
        qint64 bytes = 0;
        bool negative = false;
        int failures = 0;
        qint64 retryAtMs = 0;
        typename std::list<QString>::iterator position;
    };

    using EntryMap = QHash<QString, Entry>;

    void touchLocked(typename EntryMap::iterator it)
    {
        order_.splice(order_.begin(), order_, it->position);
    }

    void removeLocked(typename EntryMap::iterator it)
    {
        resident_ -= it->bytes;
        order_.erase(it->position);
        entries_.erase(it);
    }

    void insertLocked(const QString& key, Entry entry)
    {
        auto existing = entries_.find(key);
        if (existing != entries_.end())
            removeLocked(existing);

        order_.push_front(key);
        entry.position = order_.begin();
        resident_ += entry.bytes;
        entries_.insert(key, std::move(entry));
        evictLocked();
    }

    void storeLocked(const QString& key, const Value& value)
    {
        Entry entry;
        entry.value = value;
        entry.bytes = sizeOf_(value);
        if (entry.bytes > budget_) {
            auto existing = entries_.find(key);
            if (existing != entries_.end())
                removeLocked(existing);
            BOOST_LOG_TRIVIAL(debug) << "[" << name_ << "] " << entry.bytes
                                     << " bytes exceeds budget, not cached";
            return;
        }
        insertLocked(key, std::move(entry));
    }

    void storeNegativeLocked(const QString& key, int failures)
    {
        qint64 backoff = kInitialBackoffMs;
        for (int i = 1; i < failures && backoff < kMaxBackoffMs; ++i)
            backoff *= 2;
        backoff = qMin(backoff, kMaxBackoffMs);

        Entry entry;
        entry.negative = true;
        entry.failures = failures;
        entry.retryAtMs = clock_() + backoff;
        entry.bytes = key.size() * qint64(sizeof(QChar));
        insertLocked(key, std::move(entry));
    }

    void evictLocked()
    {
        while (resident_ > budget_ && !order_.empty()) {
            auto it = entries_.find(order_.back());
            if (it == entries_.end()) {
                order_.pop_back();
                continue;
            }
            removeLocked(it);
        }
    }

    std::string name_;
    qint64 budget_;
    SizeFn sizeOf_;
    ClockFn clock_;

    mutable QMutex mutex_;
    EntryMap entries_;
    std::list<QString> order_;  // front = most recently used
    qint64 resident_ = 0;
    QHash<QString, std::shared_future<Value>> inflight_;
};

} // namespace hush
