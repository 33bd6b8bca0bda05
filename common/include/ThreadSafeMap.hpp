#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Удалить все записи, для которых pred(value) == true
     *
     * Ключи собираются под shared_lock, затем каждая запись удаляется
     * под коротким unique_lock с повторной проверкой предиката.
     * Читатели не блокируются на всё время обхода.
     *
     * @return Количество удалённых записей
     */
    template <typename Pred>
    size_t eraseIf(Pred pred)
    {
        std::vector<K> candidates;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (const auto &[key, value] : map_)
            {
                if (value && pred(*value))
                    candidates.push_back(key);
            }
        }

        size_t erased = 0;
        for (const auto &key : candidates)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end() && it->second && pred(*it->second))
            {
                map_.erase(it);
                ++erased;
            }
        }
        return erased;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
