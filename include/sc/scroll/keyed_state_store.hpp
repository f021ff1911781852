#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sc::scroll
{

template <typename State, typename Key>
struct KeyedEntry
{
    State state;
    Key key;
};

// Matches the previous frame's states to the current frame's keys.
//
// States whose key is still present are moved into the result unchanged and passed
// to `sync`; new keys get `make(index)`; states of vanished keys are destroyed.
// Keys must be unique within one frame. If the previous list holds a key twice the
// later entry wins.
template <typename State, typename Key, typename Hash = std::hash<Key>, typename Make, typename Sync>
std::vector<KeyedEntry<State, Key>> diffKeyedStates(std::vector<KeyedEntry<State, Key>> previous,
                                                    std::span<const Key> keys, Make &&make, Sync &&sync)
{
    std::unordered_map<Key, State, Hash> byKey;
    byKey.reserve(previous.size());
    for (auto &entry : previous)
        byKey.insert_or_assign(std::move(entry.key), std::move(entry.state));
    previous.clear();

    std::vector<KeyedEntry<State, Key>> result;
    result.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i)
    {
        auto it = byKey.find(keys[i]);
        if (it != byKey.end())
        {
            State state = std::move(it->second);
            byKey.erase(it);
            sync(i, state);
            result.push_back(KeyedEntry<State, Key>{std::move(state), keys[i]});
        }
        else
        {
            result.push_back(KeyedEntry<State, Key>{make(i), keys[i]});
        }
    }
    return result;
}

template <typename Key, typename State, typename Hash = std::hash<Key>>
class KeyedStateStore
{
public:
    using Entry = KeyedEntry<State, Key>;

    template <typename Make, typename Sync>
    void diff(std::span<const Key> keys, Make &&make, Sync &&sync)
    {
        entries_ = diffKeyedStates<State, Key, Hash>(std::move(entries_), keys, std::forward<Make>(make),
                                                     std::forward<Sync>(sync));
    }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    State &stateAt(std::size_t index) { return entries_[index].state; }
    const State &stateAt(std::size_t index) const { return entries_[index].state; }
    const Key &keyAt(std::size_t index) const { return entries_[index].key; }

    const std::vector<Entry> &entries() const noexcept { return entries_; }

private:
    std::vector<Entry> entries_;
};

} // namespace sc::scroll
