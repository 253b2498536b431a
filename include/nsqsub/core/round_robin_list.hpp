/**
 * @file round_robin_list.hpp
 * @brief Deterministic rotation over a fixed ordered sequence.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace nsqsub {
namespace core {

/**
 * @brief Cycles through every element, in order, before repeating.
 */
template<typename T>
class RoundRobinList {
public:
    explicit RoundRobinList(std::vector<T> items)
        : items_(std::move(items)), index_(0) {}

    /**
     * @brief Return the next element and advance the rotation.
     * @throws std::out_of_range if the list is empty.
     */
    const T& next() {
        if (items_.empty()) {
            throw std::out_of_range("RoundRobinList::next on empty list");
        }
        const T& item = items_[index_];
        index_ = (index_ + 1) % items_.size();
        return item;
    }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<T>& items() const { return items_; }

private:
    std::vector<T> items_;
    size_t index_;
};

}  // namespace core
}  // namespace nsqsub
