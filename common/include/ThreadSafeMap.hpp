#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <cstddef>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный ассоциативный контейнер
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения хранятся как std::shared_ptr<V> и изменяются по схеме
 * copy-on-write: указатель, полученный через find(), остаётся
 * неизменяемым снимком и его можно читать без блокировки.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Атомарно изменить значение по ключу
     *
     * fn получает копию текущего значения и выполняется под unique_lock,
     * поэтому проверка и запись внутри fn не пересекаются с другими
     * update()/insert(). Копия заменяет старое значение после fn.
     *
     * @return false если ключ отсутствует (fn не вызывается)
     */
    template <typename F>
    bool update(const K &key, F &&fn)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
        {
            return false;
        }

        auto copy = std::make_shared<V>(*it->second);
        fn(*copy);
        it->second = std::move(copy);
        return true;
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Удалить все значения, для которых pred(value) == true
     * @return Количество удалённых элементов
     */
    template <typename Pred>
    std::size_t removeIf(Pred &&pred)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        std::size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (pred(static_cast<const V &>(*it->second)))
            {
                it = map_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
