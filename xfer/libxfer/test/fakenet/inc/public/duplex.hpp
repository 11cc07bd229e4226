#ifndef XFER_TEST_FAKENET_DUPLEX_HPP_
#define XFER_TEST_FAKENET_DUPLEX_HPP_

#include <deque>
#include <future>
#include <mutex>
#include <optional>

/**
 * In-memory bidirectional pipe with two ends, 0 and 1.
 *
 * Every returned future is either ready or backed by a promise, so none of them blocks in
 * its destructor. Closing one end resolves all outstanding receives with nullopt.
 */
template<typename T>
class Duplex
{
public:
    using End = int;

    std::future<bool> send(End from, T item)
    {
        std::promise<bool> result;
        {
            std::lock_guard lock {mutex_};
            if (closed_[0] || closed_[1])
            {
                result.set_value(false);
                return result.get_future();
            }

            auto &direction = directions_[other(from)];
            if (!direction.waiting.empty())
            {
                direction.waiting.front().set_value(std::move(item));
                direction.waiting.pop_front();
            }
            else
            {
                direction.items.push_back(std::move(item));
            }
            ++sent_count_[from];
        }
        result.set_value(true);
        return result.get_future();
    }

    std::future<std::optional<T>> receive(End to)
    {
        std::promise<std::optional<T>> promise;
        auto                           future = promise.get_future();

        std::lock_guard lock {mutex_};
        auto           &direction = directions_[to];
        if (!direction.items.empty())
        {
            promise.set_value(std::move(direction.items.front()));
            direction.items.pop_front();
        }
        else if (closed_[0] || closed_[1])
        {
            promise.set_value(std::nullopt);
        }
        else
        {
            direction.waiting.push_back(std::move(promise));
        }
        return future;
    }

    void close(End end)
    {
        std::lock_guard lock {mutex_};
        closed_[end] = true;
        for (auto &direction : directions_)
        {
            for (auto &waiting : direction.waiting)
            {
                waiting.set_value(std::nullopt);
            }
            direction.waiting.clear();
        }
    }

    [[nodiscard]] bool is_closed(End end) const
    {
        std::lock_guard lock {mutex_};
        return closed_[end];
    }

    [[nodiscard]] size_t sent_count(End from) const
    {
        std::lock_guard lock {mutex_};
        return sent_count_[from];
    }

    static End other(End end)
    {
        return 1 - end;
    }

private:
    struct Direction
    {
        std::deque<T>                                   items;
        std::deque<std::promise<std::optional<T>>>      waiting;
    };

    // Indexed by the receiving end
    Direction          directions_[2];
    bool               closed_[2] {};
    size_t             sent_count_[2] {};
    mutable std::mutex mutex_;
};

#endif  // XFER_TEST_FAKENET_DUPLEX_HPP_
