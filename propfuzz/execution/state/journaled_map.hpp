// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <propfuzz/core/assert.h>
#include <propfuzz/core/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

/// Hash map that records the previous value of every key it overwrites
/// while a checkpoint is open, so that `revert` can restore the map as it
/// was at the matching `checkpoint`. Writes made with no open checkpoint
/// are not recorded.
template <typename K, typename V>
class JournaledMap
{
    struct Undo
    {
        K key;
        std::optional<V> previous;
    };

    using Map = ankerl::unordered_dense::map<K, V>;

    Map entries_{};
    std::vector<Undo> undo_{};
    std::vector<size_t> checkpoints_{};

    void remember(K const &key)
    {
        if (checkpoints_.empty()) {
            return;
        }
        auto const it = entries_.find(key);
        if (it == entries_.end()) {
            undo_.push_back(Undo{.key = key, .previous = std::nullopt});
        }
        else {
            undo_.push_back(Undo{.key = key, .previous = it->second});
        }
    }

public:
    using const_iterator = typename Map::const_iterator;

    V const *find(K const &key) const
    {
        auto const it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(K const &key) const
    {
        return entries_.contains(key);
    }

    void put(K const &key, V value)
    {
        remember(key);
        entries_.insert_or_assign(key, std::move(value));
    }

    // false if the key was already present, in which case nothing changes
    bool insert(K const &key, V value)
    {
        if (entries_.contains(key)) {
            return false;
        }
        remember(key);
        entries_.emplace(key, std::move(value));
        return true;
    }

    void checkpoint()
    {
        checkpoints_.push_back(undo_.size());
    }

    void accept()
    {
        PROPFUZZ_ASSERT(!checkpoints_.empty());
        checkpoints_.pop_back();
        if (checkpoints_.empty()) {
            undo_.clear();
        }
    }

    void revert()
    {
        PROPFUZZ_ASSERT(!checkpoints_.empty());
        auto const mark = checkpoints_.back();
        checkpoints_.pop_back();
        while (undo_.size() > mark) {
            auto &undo = undo_.back();
            if (undo.previous.has_value()) {
                entries_.insert_or_assign(
                    undo.key, std::move(undo.previous).value());
            }
            else {
                entries_.erase(undo.key);
            }
            undo_.pop_back();
        }
    }

    size_t depth() const
    {
        return checkpoints_.size();
    }

    size_t size() const
    {
        return entries_.size();
    }

    const_iterator begin() const
    {
        return entries_.begin();
    }

    const_iterator end() const
    {
        return entries_.end();
    }
};

PROPFUZZ_NAMESPACE_END
